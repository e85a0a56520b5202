#pragma once

#include <utility>

#include "canopy/core/error.hpp"

namespace canopy::core {

class FileDescriptor {
  int  fd_;
  bool owning_;

public:
  explicit FileDescriptor(int fd = -1, bool owning = true) noexcept;
  ~FileDescriptor() noexcept;

  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] auto get() const noexcept -> int;
  auto               release() noexcept -> int;
  void               reset(int fd = -1, bool owning = true) noexcept;
  [[nodiscard]] auto valid() const noexcept -> bool;
};

// {read end, write end}, both close-on-exec
auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>>;

} // namespace canopy::core
