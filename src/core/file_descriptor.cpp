#include "canopy/core/file_descriptor.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace canopy::core {

FileDescriptor::FileDescriptor(int fd, bool owning) noexcept
    : fd_(fd), owning_(owning) {}

FileDescriptor::~FileDescriptor() noexcept {
  if (owning_ && fd_ >= 0) {
    ::close(fd_);
  }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_), owning_(other.owning_) {
  other.fd_     = -1;
  other.owning_ = false;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    if (owning_ && fd_ >= 0) {
      ::close(fd_);
    }
    fd_           = other.fd_;
    owning_       = other.owning_;
    other.fd_     = -1;
    other.owning_ = false;
  }
  return *this;
}

auto FileDescriptor::get() const noexcept -> int {
  return fd_;
}

auto FileDescriptor::release() noexcept -> int {
  int fd  = fd_;
  fd_     = -1;
  owning_ = false;
  return fd;
}

void FileDescriptor::reset(int fd, bool owning) noexcept {
  if (owning_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_     = fd;
  owning_ = owning;
}

auto FileDescriptor::valid() const noexcept -> bool {
  return fd_ >= 0;
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(Error::system("failed to create pipe", errno));
  }
  return std::make_pair(FileDescriptor(fds[0]), FileDescriptor(fds[1]));
}

} // namespace canopy::core
