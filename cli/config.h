#pragma once

#include <optional>
#include <string>

#include "cli_args.h"

namespace condkit::cli {

/// Values read from the settings file; unset fields keep CLI defaults.
struct CliSettings {
  std::optional<std::string> output_mode;
  std::optional<bool> color;
  std::optional<bool> extensions;
  std::optional<bool> report_faults;
};

/// Effective configuration after merging defaults, the settings file and flags.
struct ResolvedOptions {
  std::string output_mode = "plain";
  bool color = true;
  bool extensions = false;
  bool report_faults = true;
};

/// Resolves the settings path: $CONDKIT_CONFIG, then XDG, then ~/.config.
std::string resolve_config_path();
/// Loads a TOML-style settings file.
/// A missing file returns false with an empty error; invalid values return
/// false with an error naming the key and line.
bool load_cli_config(const std::string& path, CliSettings& out, std::string& error);
/// Merges settings and flags; command line flags win.
ResolvedOptions resolve_options(const CliSettings& settings, const CliOptions& options);

}  // namespace condkit::cli
