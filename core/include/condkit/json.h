#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "condkit/condition.h"
#include "condkit/value.h"

namespace condkit {

/// Raised when JSON input does not describe a valid condition or record.
/// The message names the offending location as a JSON path (e.g. `$.children[2].logic`).
class ParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Maps JSON scalars/arrays/objects onto Value kinds.
/// Strings stay strings; time-like strings are interpreted at comparison time.
Value value_from_json(const nlohmann::json& j);
/// Inverse of value_from_json; Time renders as an RFC 3339 string.
nlohmann::json value_to_json(const Value& v);

/// Reads a data record from a JSON object. Throws ParseError otherwise.
DataRecord record_from_json(const nlohmann::json& j);

/// Reads the nested tree form: `logic`, `children`, `key`, `operator`, `value`.
/// MUST reject unknown logic names and mistyped fields with ParseError.
Condition condition_from_json(const nlohmann::json& j);
/// Writes the nested tree form, omitting empty fields.
nlohmann::json condition_to_json(const Condition& condition);

/// Reads the flat form: `{"conditions": [{key, operator, value | group, next_logic}]}`.
ConditionChain chain_from_json(const nlohmann::json& j);
nlohmann::json chain_to_json(const ConditionChain& chain);

/// Objects carrying a `conditions` member are chains; anything else is a tree.
AnyCondition any_condition_from_json(const nlohmann::json& j);
nlohmann::json any_condition_to_json(const AnyCondition& condition);

}  // namespace condkit
