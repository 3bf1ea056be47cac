#include "wpcsh/FileDescriptor.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace wpcsh {

FileDescriptor::FileDescriptor(int fd)
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset();
    fd_       = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

int FileDescriptor::get() const noexcept {
  return fd_;
}

bool FileDescriptor::valid() const noexcept {
  return fd_ >= 0;
}

int FileDescriptor::release() noexcept {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::reset() noexcept {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

Result<Pipe> makePipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return fail(ErrorKind::SPAWN_FAILED, fmt::format("pipe: {}", std::strerror(errno)));
  }
  return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

} // namespace wpcsh
