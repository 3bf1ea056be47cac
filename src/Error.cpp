#include "wpcsh/Error.hpp"

namespace wpcsh {

int ShellError::exitStatus() const noexcept {
  switch (kind_) {
    case ErrorKind::NOT_FOUND: return 127;
    case ErrorKind::SPAWN_FAILED: return 126;
    case ErrorKind::INVALID_INPUT:
    case ErrorKind::INTERRUPTED:
    case ErrorKind::UNSUPPORTED: break;
  }
  return 1;
}

std::string_view kindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::NOT_FOUND: return "not found";
    case ErrorKind::INVALID_INPUT: return "invalid input";
    case ErrorKind::INTERRUPTED: return "interrupted";
    case ErrorKind::SPAWN_FAILED: return "spawn failed";
    case ErrorKind::UNSUPPORTED: return "unsupported";
  }
  return "unknown";
}

} // namespace wpcsh
