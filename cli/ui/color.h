#pragma once

namespace condkit::cli {

/// ANSI escape codes for diagnostics and result highlighting.
/// MUST stay ASCII-only for terminal compatibility.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* dim = "\033[2m";
};

/// Shared palette; immutable in normal use.
extern const Color kColor;

/// Returns code when enabled, or an empty string so output stays plain.
const char* color_on(const char* code, bool enabled);

}  // namespace condkit::cli
