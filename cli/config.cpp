#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "util/string_util.h"

namespace condkit::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

/// Accepts bare or quoted values; empty values are rejected.
bool parse_string_value(const std::string& raw, std::string& out) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) return false;
  char quote = trimmed.front();
  if (quote == '"' || quote == '\'') {
    if (trimmed.size() < 2 || trimmed.back() != quote) return false;
    out = trimmed.substr(1, trimmed.size() - 2);
    return true;
  }
  out = trimmed;
  return true;
}

}  // namespace

/// Resolves the settings file location.
/// MUST honor $CONDKIT_CONFIG before XDG and HOME defaults.
/// Inputs are environment variables; outputs are paths.
std::string resolve_config_path() {
  std::string override = get_env("CONDKIT_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "condkit" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "condkit" / "config.toml").string();
  }
  return "condkit.config.toml";
}

/// Loads a TOML-style settings file.
/// MUST report invalid values with key and line number.
/// Inputs are paths; outputs are settings or an error message.
bool load_cli_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.size() >= 2 && trimmed[0] == '/' && trimmed[1] == '/') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    std::string where = " at line " + std::to_string(line_no);

    if (full_key == "cli.output") {
      std::string parsed;
      if (!parse_string_value(value, parsed) || (parsed != "plain" && parsed != "json")) {
        error = "Invalid cli.output" + where + " (use plain|json)";
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "cli.color" || full_key == "eval.extensions" ||
               full_key == "eval.report_faults") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid " + full_key + where + " (use true|false)";
        return false;
      }
      if (full_key == "cli.color") {
        out.color = parsed;
      } else if (full_key == "eval.extensions") {
        out.extensions = parsed;
      } else {
        out.report_faults = parsed;
      }
    }
  }
  return true;
}

/// Merges defaults, file settings and flags.
/// MUST let command line flags win over file settings.
/// Inputs are settings and options; outputs are effective options.
ResolvedOptions resolve_options(const CliSettings& settings, const CliOptions& options) {
  ResolvedOptions out;
  if (settings.output_mode.has_value()) out.output_mode = *settings.output_mode;
  if (settings.color.has_value()) out.color = *settings.color;
  if (settings.extensions.has_value()) out.extensions = *settings.extensions;
  if (settings.report_faults.has_value()) out.report_faults = *settings.report_faults;

  if (options.output_mode.has_value()) out.output_mode = *options.output_mode;
  if (options.color.has_value()) out.color = *options.color;
  if (options.extensions.has_value()) out.extensions = *options.extensions;
  return out;
}

}  // namespace condkit::cli
