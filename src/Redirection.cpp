#include "wpcsh/Redirection.hpp"
#include "wpcsh/Util.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace wpcsh {

namespace {

// Lowest descriptor used for saved copies, clear of anything a redirect targets
constexpr int SAVED_FD_MIN = 10;

Result<FileDescriptor> openFile(std::string const& path, int flags) {
  int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
  if (fd == -1) {
    return invalidInput(fmt::format("{}: {}", path, std::strerror(errno)));
  }
  return FileDescriptor(fd);
}

} // namespace

Result<RedirectAction> openRedirect(RedirectKind kind, std::string const& target, std::optional<int> io_number) {
  RedirectAction action;
  int            flags = 0;
  switch (kind) {
    case RedirectKind::INPUT:
      action.target_fd_ = io_number.value_or(STDIN_FILENO);
      flags             = O_RDONLY;
      break;
    case RedirectKind::OUTPUT:
      action.target_fd_ = io_number.value_or(STDOUT_FILENO);
      flags             = O_WRONLY | O_CREAT | O_TRUNC;
      break;
    case RedirectKind::APPEND:
      action.target_fd_ = io_number.value_or(STDOUT_FILENO);
      flags             = O_WRONLY | O_CREAT | O_APPEND;
      break;
    case RedirectKind::READ_WRITE:
      action.target_fd_ = io_number.value_or(STDIN_FILENO);
      flags             = O_RDWR | O_CREAT;
      break;
    case RedirectKind::INPUT_DUP:
    case RedirectKind::OUTPUT_DUP: {
      action.target_fd_ = io_number.value_or(kind == RedirectKind::INPUT_DUP ? STDIN_FILENO : STDOUT_FILENO);
      if (target == "-") {
        action.close_ = true;
        return action;
      }
      if (!isAllDigits(target)) {
        return invalidInput(fmt::format("{}: ambiguous redirect", target));
      }
      auto [ptr, ec] = std::from_chars(target.data(), target.data() + target.size(), action.source_fd_);
      if (ec != std::errc()) {
        return invalidInput(fmt::format("{}: bad file descriptor", target));
      }
      return action;
    }
    case RedirectKind::HERE_DOC:
    case RedirectKind::HERE_DOC_DASH:
      return fail(ErrorKind::UNSUPPORTED, "here-document is not supported");
    case RedirectKind::HERE_STRING:
      return fail(ErrorKind::UNSUPPORTED, "here-string is not supported");
  }

  auto file = openFile(target, flags);
  if (!file) {
    return std::unexpected(file.error());
  }
  action.file_ = std::move(*file);
  return action;
}

int addFileActions(posix_spawn_file_actions_t& file_actions, std::span<RedirectAction const> actions) {
  for (auto const& action : actions) {
    int rc = action.close_ ? posix_spawn_file_actions_addclose(&file_actions, action.target_fd_)
                           : posix_spawn_file_actions_adddup2(&file_actions, action.source(), action.target_fd_);
    if (rc != 0) {
      return rc;
    }
  }
  return 0;
}

Result<void> RedirectionGuard::apply(std::span<RedirectAction const> actions) {
  std::fflush(stdout);
  std::fflush(stderr);
  for (auto const& action : actions) {
    int saved_fd = fcntl(action.target_fd_, F_DUPFD_CLOEXEC, SAVED_FD_MIN);
    if (saved_fd == -1 && errno != EBADF) {
      auto message = fmt::format("{}: {}", action.target_fd_, std::strerror(errno));
      restore();
      return invalidInput(message);
    }
    saved_.push_back({action.target_fd_, saved_fd});

    if (action.close_) {
      close(action.target_fd_);
      continue;
    }
    if (dup2(action.source(), action.target_fd_) == -1) {
      auto message = fmt::format("{}: bad file descriptor", action.source());
      restore();
      return invalidInput(message);
    }
  }
  return {};
}

void RedirectionGuard::restore() {
  if (saved_.empty()) {
    return;
  }
  std::fflush(stdout);
  std::fflush(stderr);
  // Restore original file descriptors in reverse order
  for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
    if (it->saved_fd_ == -1) {
      close(it->target_fd_);
      continue;
    }
    dup2(it->saved_fd_, it->target_fd_);
    close(it->saved_fd_);
  }
  saved_.clear();
}

} // namespace wpcsh
