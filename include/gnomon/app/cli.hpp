#pragma once

#include <gnomon/app/config.hpp>
#include <expected>
#include <ostream>
#include <string>

namespace gnomon::app {

/// Parsed command line: the layered config, or a request for help.
struct CommandLine {
  bool show_help{false};
  OptimizeConfig config;
};

void print_usage(std::ostream& os);

/// Parse argv (argv[0] is the program name). Settings come from defaults, then the
/// --config file if given, then each flag in order, so flags override the file.
/// Unknown options and options missing their value are errors. Does not validate.
std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const* argv);

/// Full command-line run: parse, validate, optimize. Returns the process exit code
/// (0 on success or --help, 1 on a usage, validation or directory error).
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace gnomon::app
