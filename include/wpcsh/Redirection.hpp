#pragma once

#include "wpcsh/AST.hpp"
#include "wpcsh/Error.hpp"
#include "wpcsh/FileDescriptor.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

#include <spawn.h>

namespace wpcsh {

// One redirect with its file already open: target_fd_ becomes a copy of
// source(), or is closed when close_ is set.
struct RedirectAction {
  int            target_fd_ = -1;
  FileDescriptor file_;
  int            source_fd_ = -1;
  bool           close_     = false;

  [[nodiscard]] int source() const noexcept {
    return file_.valid() ? file_.get() : source_fd_;
  }
};

// Opens files close-on-exec. Here-documents and here-strings are Unsupported.
Result<RedirectAction> openRedirect(RedirectKind kind, std::string const& target, std::optional<int> io_number);

// Queue actions after any pipe wiring already in file_actions.
int addFileActions(posix_spawn_file_actions_t& file_actions, std::span<RedirectAction const> actions);

// Applies redirects to the shell's own descriptors and puts the originals
// back on restore() or destruction.
class RedirectionGuard {
  struct SavedFd {
    int target_fd_;
    int saved_fd_; // -1: target was not open before
  };

  std::vector<SavedFd> saved_;

public:
  RedirectionGuard() = default;

  ~RedirectionGuard() {
    restore();
  }

  Result<void> apply(std::span<RedirectAction const> actions);
  void         restore();

  RedirectionGuard(RedirectionGuard const&)            = delete;
  RedirectionGuard& operator=(RedirectionGuard const&) = delete;
  RedirectionGuard(RedirectionGuard&&)                 = delete;
  RedirectionGuard& operator=(RedirectionGuard&&)      = delete;
};

} // namespace wpcsh
