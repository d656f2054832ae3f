#include "color.h"

namespace condkit::cli {

const Color kColor{};

/// Selects an ANSI code or nothing.
/// MUST return an empty string when color is disabled.
/// Inputs are code and flag; outputs are static strings.
const char* color_on(const char* code, bool enabled) {
  return enabled ? code : "";
}

}  // namespace condkit::cli
