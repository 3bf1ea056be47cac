#include "wpcsh/Cli.hpp"
#include "wpcsh/Constants.hpp"

#include <fmt/core.h>

namespace wpcsh::cli {

Result<Options> parseArguments(std::span<char const* const> args) {
  Options options;
  if (!args.empty() && args[0] != nullptr && args[0][0] == '-') {
    options.login_ = true;
  }

  for (size_t i = 1; i < args.size(); ++i) {
    std::string_view arg{args[i]};
    if (arg == "-c" || arg == "--command") {
      if (i + 1 >= args.size()) {
        return invalidInput(fmt::format("option {} requires an argument", arg));
      }
      options.command_ = args[++i];
    } else if (arg == "-l" || arg == "--login") {
      options.login_ = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose_ = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help_ = true;
    } else if (arg == "--version") {
      options.version_ = true;
    } else {
      return invalidInput(fmt::format("unknown option: {}", arg));
    }
  }
  return options;
}

std::string usage(std::string_view program) {
  return fmt::format(
      "Usage: {} [options]\n"
      "\n"
      "Options:\n"
      "  -c, --command COMMAND  Execute COMMAND and exit\n"
      "  -l, --login            Run as a login shell (source ~/{})\n"
      "  -v, --verbose          Trace executed lines and processes\n"
      "  -h, --help             Show this help and exit\n"
      "      --version          Show version information and exit\n",
      program,
      PROFILE_FILE
  );
}

} // namespace wpcsh::cli
