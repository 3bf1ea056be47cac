#pragma once

#include "wpcsh/Error.hpp"

namespace wpcsh {

// Owning wrapper that closes the descriptor on destruction.
class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd);
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const noexcept;
  [[nodiscard]] bool valid() const noexcept;
  int                release() noexcept;
  void               reset() noexcept;
};

struct Pipe {
  FileDescriptor read_end_;
  FileDescriptor write_end_;
};

// pipe2(O_CLOEXEC): both ends close in spawned children unless dup'ed
Result<Pipe> makePipe();

} // namespace wpcsh
