#pragma once

#include "canopy/cli/arg_parser.hpp"

namespace canopy::cli {

auto create_default_arg_parser() -> ArgumentParser;

void print_version();

// Entry point behind main(); returns the process exit code
auto run(int argc, char const* const* argv) -> int;

} // namespace canopy::cli
