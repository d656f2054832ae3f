#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace condkit::util {

namespace {

char ascii_lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char ascii_upper(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out(s.size(), '\0');
  std::transform(s.begin(), s.end(), out.begin(), ascii_lower);
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out(s.size(), '\0');
  std::transform(s.begin(), s.end(), out.begin(), ascii_upper);
  return out;
}

/// Trims ASCII whitespace from both ends.
/// MUST return an empty string for all-whitespace input.
/// Inputs are strings; outputs are trimmed copies.
std::string trim_ws(const std::string& s) {
  static const char kSpace[] = " \t\n\v\f\r";
  size_t start = s.find_first_not_of(kSpace);
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(kSpace);
  return s.substr(start, end - start + 1);
}

}  // namespace condkit::util
