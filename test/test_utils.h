#pragma once

#include "wpcsh/ShellState.hpp"
#include "wpcsh/Util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <unistd.h>

namespace wpcsh::test {

// Fresh directory under the system temp dir, removed with its contents on destruction.
class TempDir {
  std::filesystem::path path_;

public:
  TempDir() {
    auto base = std::filesystem::canonical(std::filesystem::temp_directory_path());
    std::string pattern = (base / "wpcsh-test-XXXXXX").string();
    char*       made    = mkdtemp(pattern.data());
    EXPECT_NE(made, nullptr);
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(TempDir const&)            = delete;
  TempDir& operator=(TempDir const&) = delete;

  [[nodiscard]] std::filesystem::path const& path() const noexcept {
    return path_;
  }
};

// Moves the process into a temp dir for the test and back afterwards.
class InTempDir : public ::testing::Test {
protected:
  std::filesystem::path saved_cwd_;
  TempDir               dir_;

  void SetUp() override {
    saved_cwd_ = std::filesystem::current_path();
    std::filesystem::current_path(dir_.path());
  }

  void TearDown() override {
    std::filesystem::current_path(saved_cwd_);
  }

  [[nodiscard]] ShellState makeState() const {
    VariableMap variables;
    if (char const* path = std::getenv("PATH"); path != nullptr) {
      variables["PATH"] = path;
    }
    return ShellState(dir_.path(), dir_.path(), std::move(variables));
  }
};

inline std::string readFile(std::filesystem::path const& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

inline void writeFile(std::filesystem::path const& path, std::string const& content) {
  std::ofstream out(path);
  out << content;
}

} // namespace wpcsh::test
