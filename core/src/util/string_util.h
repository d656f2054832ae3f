#pragma once

#include <string>

namespace condkit::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep evaluation deterministic.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for keyword matching (logic connectors).
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);

}  // namespace condkit::util
