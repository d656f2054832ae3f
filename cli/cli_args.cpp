#include "cli_args.h"

#include <string>

namespace condkit::cli {

namespace {

/// Parses an on/off flag value.
/// MUST accept only the lowercase words on and off.
/// Inputs are raw values; outputs are written to out on success.
bool parse_on_off(const std::string& value, bool& out) {
  if (value == "on") {
    out = true;
    return true;
  }
  if (value == "off") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace

/// Prints the startup help shown when no flags are given.
/// MUST keep examples aligned with current CLI flags.
/// Inputs are the output stream; side effects are writing text.
void print_startup_help(std::ostream& os) {
  os << "condkit - evaluate JSON conditions against key/value records\n\n";
  os << "Usage:\n";
  os << "  condkit --condition <json|@file> --data <json|@file|->\n";
  os << "  condkit --condition <json|@file> --lines <file|->\n";
  os << "  condkit --condition <json|@file> --to-chain\n";
  os << "  condkit --list-operators\n\n";
  os << "Examples:\n";
  os << "  condkit --condition '{\"key\":\"age\",\"operator\":\"gt\",\"value\":18}' "
        "--data '{\"age\":25}'\n";
  os << "  condkit --condition @rule.json --lines ./events.jsonl\n";
  os << "  condkit --condition @rule.json --to-chain\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags and exit codes.
/// Inputs are the output stream; side effects are writing text.
void print_help(std::ostream& os) {
  os << "Usage: condkit --condition <json|@file> --data <json|@file|->\n";
  os << "       condkit --condition <json|@file> --lines <file|->\n";
  os << "       condkit --condition <json|@file> --to-chain\n";
  os << "       condkit --list-operators\n";
  os << "Options:\n";
  os << "  --extensions on|off   Install the stock custom operators (iequal, regex, ...)\n";
  os << "  --output plain|json   Result format\n";
  os << "  --config <path>       Settings file (default: $CONDKIT_CONFIG or\n";
  os << "                        ~/.config/condkit/config.toml)\n";
  os << "  --color=disabled      Disable ANSI colors\n";
  os << "  --help                Show this help\n";
  os << "Exit status: 0 when the condition holds (or on success for --lines,\n";
  os << "--to-chain and --list-operators), 1 when it does not, 2 on errors.\n";
}

/// Parses argv into CLI options.
/// MUST leave options untouched when any flag is invalid.
/// Inputs are argc/argv; outputs are options or an error message.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--condition" || arg == "--data" || arg == "--lines" || arg == "--output" ||
        arg == "--extensions" || arg == "--config") {
      if (!has_value) {
        error = "Missing value for " + arg;
        return false;
      }
      std::string value = argv[++i];
      if (arg == "--condition") {
        parsed.condition = value;
      } else if (arg == "--data") {
        parsed.data = value;
      } else if (arg == "--lines") {
        parsed.lines = value;
      } else if (arg == "--config") {
        parsed.config_path = value;
      } else if (arg == "--output") {
        if (value != "plain" && value != "json") {
          error = "Invalid --output value (use plain|json)";
          return false;
        }
        parsed.output_mode = value;
      } else {
        bool enabled = false;
        if (!parse_on_off(value, enabled)) {
          error = "Invalid --extensions value (use on|off)";
          return false;
        }
        parsed.extensions = enabled;
      }
    } else if (arg == "--to-chain") {
      parsed.to_chain = true;
    } else if (arg == "--list-operators") {
      parsed.list_operators = true;
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!parsed.data.empty() && !parsed.lines.empty()) {
    error = "--data and --lines cannot be combined";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace condkit::cli
