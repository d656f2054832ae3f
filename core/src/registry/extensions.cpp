#include "condkit/extensions.h"

#include <regex>

#include "condkit/coerce.h"
#include "../util/string_util.h"

namespace condkit {

namespace {

/// Case-insensitive equality of the text forms.
/// MUST fold ASCII case only.
/// Inputs are field and expected value; outputs are boolean.
bool iequal(const Value& field, const Value& expected) {
  return util::to_lower(to_string(field)) == util::to_lower(to_string(expected));
}

/// Matches the part after the single '@' of an address.
bool email_domain(const Value& field, const Value& expected) {
  std::string email = to_string(field);
  size_t at = email.find('@');
  if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) return false;
  return email.substr(at + 1) == to_string(expected);
}

// std::regex recurses per input character; longer fields never match.
constexpr size_t kMaxRegexInput = 4096;

/// ECMAScript search of the field text against the expected pattern.
/// MUST return false for invalid patterns and for fields over kMaxRegexInput bytes.
/// Inputs are record and condition values; no side effects.
bool regex_search(const Value& field, const Value& expected) {
  std::string text = to_string(field);
  if (text.size() > kMaxRegexInput) return false;
  try {
    std::regex re(to_string(expected), std::regex::ECMAScript);
    return std::regex_search(text, re);
  } catch (const std::regex_error&) {
    return false;
  }
}

/// Checks that the field text has at least the expected length.
/// MUST return false when the expected length is not numeric.
/// Inputs are field and length; outputs are boolean.
bool min_length(const Value& field, const Value& expected) {
  auto min = to_number(expected);
  if (!min.has_value()) return false;
  return static_cast<double>(to_string(field).size()) >= *min;
}

/// Checks whether two sequences share an element.
/// MUST return false unless both sides are sequences.
/// Inputs are field and candidates; outputs are boolean.
bool contains_any(const Value& field, const Value& expected) {
  if (field.kind() != Value::Kind::Sequence || expected.kind() != Value::Kind::Sequence) {
    return false;
  }
  for (const auto& want : expected.as_list()) {
    std::string needle = to_string(want);
    for (const auto& have : field.as_list()) {
      if (to_string(have) == needle) return true;
    }
  }
  return false;
}

/// Classifies a numeric age as child, teen, adult or senior.
/// MUST compare as doubles so NaN and huge values stay well defined.
/// Inputs are age and group name; outputs are boolean.
bool age_group(const Value& field, const Value& expected) {
  auto age = to_number(field);
  if (!age.has_value()) return false;
  double years = *age;
  std::string group = to_string(expected);
  if (group == "child") return years < 13;
  if (group == "teen") return years >= 13 && years < 20;
  if (group == "adult") return years >= 20 && years < 65;
  if (group == "senior") return years >= 65;
  return false;
}

struct Extension {
  const char* id;
  bool (*fn)(const Value&, const Value&);
};

const Extension kExtensions[] = {
    {"iequal", iequal},
    {"email_domain", email_domain},
    {"regex", regex_search},
    {"min_length", min_length},
    {"contains_any", contains_any},
    {"age_group", age_group},
};

}  // namespace

/// Installs every stock extension into the registry.
/// MUST replace existing entries with the same ids.
/// Inputs are the registry; side effects are registry writes.
void register_standard_extensions(OperatorRegistry& registry) {
  for (const auto& ext : kExtensions) {
    registry.register_operator(ext.id, ext.fn);
  }
}

std::vector<std::string> standard_extension_names() {
  std::vector<std::string> out;
  for (const auto& ext : kExtensions) {
    out.emplace_back(ext.id);
  }
  return out;
}

}  // namespace condkit
