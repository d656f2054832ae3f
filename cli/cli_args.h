#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace condkit::cli {

/// Captures CLI arguments so main can dispatch without re-parsing argv.
/// Optional fields are unset when the flag was not given, so config-file
/// settings can fill them in afterwards.
struct CliOptions {
  std::string condition;
  std::string data;
  std::string lines;
  bool to_chain = false;
  bool list_operators = false;
  std::optional<std::string> output_mode;
  std::optional<bool> color;
  std::optional<bool> extensions;
  std::string config_path;
  bool show_help = false;
};

/// Prints the brief help shown when no arguments are provided.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing flag values and invalid values.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace condkit::cli
