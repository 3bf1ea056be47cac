#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace wpcsh {

enum struct ErrorKind {
  NOT_FOUND,
  INVALID_INPUT,
  INTERRUPTED,
  SPAWN_FAILED,
  UNSUPPORTED
};

class ShellError {
  ErrorKind   kind_;
  std::string message_;

public:
  ShellError(ErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  [[nodiscard]] ErrorKind kind() const noexcept {
    return kind_;
  }

  [[nodiscard]] std::string const& message() const noexcept {
    return message_;
  }

  // Status recorded as $? when this error stops a command.
  [[nodiscard]] int exitStatus() const noexcept;
};

template<typename T>
using Result = std::expected<T, ShellError>;

inline std::unexpected<ShellError> fail(ErrorKind kind, std::string message) {
  return std::unexpected(ShellError{kind, std::move(message)});
}

inline std::unexpected<ShellError> invalidInput(std::string message) {
  return fail(ErrorKind::INVALID_INPUT, std::move(message));
}

std::string_view kindName(ErrorKind kind) noexcept;

} // namespace wpcsh
