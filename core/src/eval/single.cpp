#include "eval_internal.h"

#include <exception>

#include "condkit/coerce.h"
#include "condkit/condkit.h"
#include "../util/string_util.h"

namespace condkit::eval_internal {

namespace {

/// Membership test for in/nin.
/// Sequences match by element, mappings by key, strings by substring.
bool is_in(const Value& field, const Value& collection) {
  switch (collection.kind()) {
    case Value::Kind::Sequence:
      for (const auto& item : collection.as_list()) {
        if (is_equal(field, item)) return true;
      }
      return false;
    case Value::Kind::Mapping:
      for (const auto& entry : collection.as_map()) {
        if (is_equal(field, Value(entry.first))) return true;
      }
      return false;
    case Value::Kind::String:
      return collection.as_string().find(to_string(field)) != std::string::npos;
    default:
      return false;
  }
}

/// Substring test over the text forms of both values.
/// MUST return false when either side is Null.
/// Inputs are field and needle; outputs are boolean with no side effects.
bool contains(const Value& haystack, const Value& needle) {
  if (haystack.is_null() || needle.is_null()) return false;
  return to_string(haystack).find(to_string(needle)) != std::string::npos;
}

/// Applies a LIKE pattern to the field text.
/// MUST fold case on both sides when case_insensitive is set.
/// Inputs are field and pattern; outputs are boolean with no side effects.
bool like(const Value& field, const Value& pattern, bool case_insensitive) {
  if (field.is_null() || pattern.is_null()) return false;
  std::string text = to_string(field);
  std::string pat = to_string(pattern);
  if (case_insensitive) {
    text = util::to_lower(text);
    pat = util::to_lower(pat);
  }
  return like_match(text, pat);
}

bool starts_with(const Value& field, const Value& prefix) {
  if (field.is_null() || prefix.is_null()) return false;
  std::string text = to_string(field);
  std::string pre = to_string(prefix);
  if (pre.size() > text.size()) return false;
  return text.compare(0, pre.size(), pre) == 0;
}

bool ends_with(const Value& field, const Value& suffix) {
  if (field.is_null() || suffix.is_null()) return false;
  std::string text = to_string(field);
  std::string suf = to_string(suffix);
  if (suf.size() > text.size()) return false;
  return text.compare(text.size() - suf.size(), suf.size(), suf) == 0;
}

/// Inclusive range test against a `[min, max]` pair.
/// MUST return false for anything but a two-element sequence.
bool between(const Value& field, const Value& bounds) {
  if (field.is_null() || bounds.kind() != Value::Kind::Sequence) return false;
  const auto& pair = bounds.as_list();
  if (pair.size() != 2) return false;
  return compare_values(field, pair[0]) >= 0 && compare_values(field, pair[1]) <= 0;
}

}  // namespace

/// Matches SQL LIKE wildcards over the whole text without recursion.
/// MUST run in O(text * pattern) time and MUST treat every byte other than
/// `%` and `_` literally, newlines included.
/// Inputs are raw byte strings; no side effects.
bool like_match(const std::string& text, const std::string& pattern) {
  size_t t = 0;
  size_t p = 0;
  size_t star = std::string::npos;
  size_t resume = 0;
  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '%') {
      star = p++;
      resume = t;
    } else if (p < pattern.size() && (pattern[p] == '_' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (star != std::string::npos) {
      // Let the last `%` absorb one more byte and retry from there.
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '%') ++p;
  return p == pattern.size();
}

/// Evaluates existence and state operators.
/// MUST be defined for absent keys, where field is Null.
/// Inputs are operator, field and presence; outputs are nullopt for other operators.
std::optional<bool> apply_state_operator(BuiltinOp op, const Value& field, bool exists) {
  switch (op) {
    case BuiltinOp::IsNull:
      return !exists || field.is_null();
    case BuiltinOp::IsNotNull:
      return exists && !field.is_null();
    case BuiltinOp::IsEmpty:
      return is_empty(field);
    case BuiltinOp::IsNotEmpty:
      return !is_empty(field);
    case BuiltinOp::IsTrue:
      return to_bool(field);
    case BuiltinOp::IsFalse:
      return !to_bool(field);
    default:
      return std::nullopt;
  }
}

/// Dispatches a built-in comparison on a present field.
/// MUST be total over every value kind and MUST never throw.
/// Inputs are operator, field and expected value; outputs are boolean.
bool apply_builtin(BuiltinOp op, const Value& field, const Value& expected) {
  switch (op) {
    case BuiltinOp::Eq:
      return is_equal(field, expected);
    case BuiltinOp::Neq:
      return !is_equal(field, expected);
    case BuiltinOp::Gt:
      return compare_values(field, expected) > 0;
    case BuiltinOp::Gte:
      return compare_values(field, expected) >= 0;
    case BuiltinOp::Lt:
      return compare_values(field, expected) < 0;
    case BuiltinOp::Lte:
      return compare_values(field, expected) <= 0;
    case BuiltinOp::In:
      return is_in(field, expected);
    case BuiltinOp::Nin:
      return !is_in(field, expected);
    case BuiltinOp::Contains:
      return contains(field, expected);
    case BuiltinOp::NContains:
      return !contains(field, expected);
    case BuiltinOp::Like:
      return like(field, expected, false);
    case BuiltinOp::ILike:
      return like(field, expected, true);
    case BuiltinOp::NLike:
      return !like(field, expected, false);
    case BuiltinOp::StartsWith:
      return starts_with(field, expected);
    case BuiltinOp::EndsWith:
      return ends_with(field, expected);
    case BuiltinOp::Between:
      return between(field, expected);
    case BuiltinOp::NotBetween:
      return !between(field, expected);
    case BuiltinOp::IsNull:
    case BuiltinOp::IsNotNull:
    case BuiltinOp::IsEmpty:
    case BuiltinOp::IsNotEmpty:
    case BuiltinOp::IsTrue:
    case BuiltinOp::IsFalse:
      return apply_state_operator(op, field, true).value_or(false);
  }
  return false;
}

/// Runs a registered validator inside the fault boundary.
/// MUST resolve unknown operators and thrown exceptions to false.
/// Inputs are registry, operator and operands; side effects are the validator's and fault reports.
bool invoke_custom(const OperatorRegistry& registry,
                   const std::string& op,
                   const Value& field,
                   const Value& expected) {
  // The copy is taken under the registry lock; the call happens outside it.
  OperatorValidator validator = registry.find(op);
  if (!validator) return false;
  try {
    return validator(field, expected);
  } catch (const std::exception& ex) {
    registry.report_fault(op, ex.what());
  } catch (...) {
    registry.report_fault(op, "non-standard exception");
  }
  return false;
}

}  // namespace condkit::eval_internal

namespace condkit {

/// Evaluates one (key, operator, value) comparison against the record.
/// MUST check state operators before key presence and MUST never mutate the record.
/// Inputs are the leaf fields and record; outputs are boolean.
bool Evaluator::evaluate_leaf(const std::string& key,
                              const std::string& op,
                              const Value& expected,
                              const DataRecord& data) const {
  static const Value kAbsent;
  auto it = data.find(key);
  bool exists = it != data.end();
  const Value& field = exists ? it->second : kAbsent;

  auto builtin = parse_builtin_operator(op);
  if (builtin.has_value()) {
    auto state = eval_internal::apply_state_operator(*builtin, field, exists);
    if (state.has_value()) return *state;
  }

  if (!exists) {
    // Built-in comparisons need the key; custom operators see Null instead.
    return eval_internal::invoke_custom(registry_, op, field, expected);
  }

  if (builtin.has_value()) {
    return eval_internal::apply_builtin(*builtin, field, expected);
  }
  return eval_internal::invoke_custom(registry_, op, field, expected);
}

}  // namespace condkit
