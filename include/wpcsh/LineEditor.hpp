#pragma once

#include "wpcsh/Error.hpp"

#include <filesystem>
#include <string>

namespace wpcsh {

struct ReadResult {
  enum struct Kind {
    INPUT,
    END_OF_INPUT,
    INTERRUPTED
  };

  Kind        kind_ = Kind::INPUT;
  std::string line_;
};

// Interactive line source with history.
class LineEditor {
public:
  LineEditor()                             = default;
  LineEditor(LineEditor const&)            = delete;
  LineEditor& operator=(LineEditor const&) = delete;
  virtual ~LineEditor()                    = default;

  virtual ReadResult   readLine(std::string const& prompt)            = 0;
  virtual void         addHistory(std::string const& line)            = 0;
  virtual Result<void> loadHistory(std::filesystem::path const& path) = 0;
  virtual Result<void> saveHistory(std::filesystem::path const& path) = 0;
};

// GNU readline; SIGINT during a read ends it with INTERRUPTED.
class ReadlineEditor final : public LineEditor {
public:
  ReadlineEditor();

  ReadResult   readLine(std::string const& prompt) override;
  void         addHistory(std::string const& line) override;
  Result<void> loadHistory(std::filesystem::path const& path) override;
  Result<void> saveHistory(std::filesystem::path const& path) override;
};

} // namespace wpcsh
