#include "canopy/cli/arg_parser.hpp"

#include <algorithm>
#include <string_view>

#include <fmt/format.h>

namespace canopy::cli {

namespace {

auto usage_error(std::string message) -> core::Error {
  return core::Error{core::ErrorKind::UsageError, std::move(message)};
}

} // namespace

auto Arguments::has(std::string const& name) const noexcept -> bool {
  return args_.contains(name);
}

auto Arguments::get_all(std::string const& name) const -> std::vector<std::string> {
  auto it = args_.find(name);
  if (it == args_.end()) {
    return {};
  }
  return it->second;
}

Option::Option(std::string name, std::string short_name)
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::default_value(std::string value) -> Option& {
  default_value_ = {std::move(value)};
  return *this;
}

auto Option::nargs(size_t n) noexcept -> Option& {
  nargs_ = n;
  return *this;
}

auto Option::multiple() noexcept -> Option& {
  multiple_ = true;
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc)
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::stop_at_positional(bool stop) noexcept -> ArgumentParser& {
  stop_at_positional_ = stop;
  return *this;
}

auto ArgumentParser::usage(std::string usage) -> ArgumentParser& {
  usage_ = std::move(usage);
  return *this;
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> core::Result<Arguments> {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(args);
}

auto ArgumentParser::parse(std::vector<std::string> const& args) const -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  auto store = [&result](Option const& option, std::vector<std::string> values) {
    auto& slot = result.args_[option.name_];
    if (option.multiple_ && !(option.default_value_ && slot == *option.default_value_)) {
      slot.insert(slot.end(), values.begin(), values.end());
    } else {
      slot = std::move(values);
    }
  };

  // Values for an option that takes them; an attached value counts as the first
  auto take_values = [&args](Option const& option, size_t& i, std::optional<std::string> attached)
      -> core::Result<std::vector<std::string>> {
    std::vector<std::string> values;
    values.reserve(option.nargs_);
    if (attached) {
      values.push_back(std::move(*attached));
    }
    while (values.size() < option.nargs_ && i + 1 < args.size()) {
      values.push_back(args[++i]);
    }
    if (values.size() < option.nargs_) {
      return std::unexpected(usage_error(
          fmt::format("option --{} requires {} argument(s), got {}", option.name_, option.nargs_, values.size())
      ));
    }
    return values;
  };

  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view arg{args[i]};

    if (arg == "--") {
      result.trailing_.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
      break;
    }

    if (arg.starts_with("--")) {
      // Long option
      std::string_view name        = arg.substr(2);
      size_t           eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });

      if (option_it == options_.end()) {
        return std::unexpected(usage_error(fmt::format("unknown option: --{}", option_name)));
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(usage_error(fmt::format("flag option --{} does not accept a value", option_name)));
        }
        store(*option_it, {"true"});
        continue;
      }

      std::optional<std::string> attached;
      if (eq_pos != std::string_view::npos) {
        attached = std::string(name.substr(eq_pos + 1));
      }
      auto values = take_values(*option_it, i, std::move(attached));
      if (!values) {
        return std::unexpected(values.error());
      }
      store(*option_it, std::move(*values));
    } else if (arg.starts_with("-") && arg.size() > 1) {
      // Short option(s)
      for (size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [short_opt](Option const& opt) {
          return !opt.short_name_.empty() && opt.short_name_.front() == short_opt;
        });

        if (option_it == options_.end()) {
          return std::unexpected(usage_error(fmt::format("unknown option: -{}", short_opt)));
        }

        if (option_it->nargs_ == 0) {
          store(*option_it, {"true"});
          continue;
        }

        // "-Dname=value" carries its value in the same word
        std::optional<std::string> attached;
        if (j + 1 < arg.size()) {
          attached = std::string(arg.substr(j + 1));
        }
        auto values = take_values(*option_it, i, std::move(attached));
        if (!values) {
          return std::unexpected(values.error());
        }
        store(*option_it, std::move(*values));
        break;
      }
    } else if (stop_at_positional_) {
      result.positional_.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
      break;
    } else {
      // Positional argument
      result.positional_.emplace_back(arg);
    }
  }

  return result;
}

auto ArgumentParser::help() const -> std::string {
  std::string out = fmt::format("Usage: {}", name_);
  if (!options_.empty()) {
    out += " [OPTIONS]";
  }
  if (!usage_.empty()) {
    out += fmt::format(" {}", usage_);
  }
  out += "\n\n";

  if (!desc_.empty()) {
    out += fmt::format("{}\n\n", desc_);
  }

  if (!options_.empty()) {
    out += "Options:\n";
    for (auto const& option : options_) {
      out += "  ";

      if (!option.short_name_.empty()) {
        out += fmt::format("-{}", option.short_name_);
        if (!option.name_.empty()) {
          out += ", ";
        }
      }

      if (!option.name_.empty()) {
        out += fmt::format("--{}", option.name_);
      }

      if (option.nargs_ > 0) {
        out += " <value>";
        if (option.nargs_ > 1) {
          out += "...";
        }
      }

      if (!option.description_.empty()) {
        out += fmt::format("\n    {}", option.description_);
      }

      if (option.default_value_) {
        out += fmt::format(" (default: {})", option.default_value_->front());
      }

      out += "\n";
    }
  }
  return out;
}

} // namespace canopy::cli
