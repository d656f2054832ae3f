#pragma once

#include <optional>
#include <string>

#include "condkit/condition.h"
#include "condkit/operator_registry.h"
#include "condkit/value.h"

namespace condkit::eval_internal {

/// Applies a built-in comparison to a present field.
/// MUST be total: unsupported operand shapes yield false, never an exception.
bool apply_builtin(BuiltinOp op, const Value& field, const Value& expected);

/// Applies a state operator (isnull, isempty, istrue, ...) that is defined
/// whether or not the key exists. Returns nullopt for any other operator.
std::optional<bool> apply_state_operator(BuiltinOp op, const Value& field, bool exists);

/// Invokes a custom validator inside the fault boundary.
/// Unknown operators and faulting validators both yield false.
bool invoke_custom(const OperatorRegistry& registry,
                   const std::string& op,
                   const Value& field,
                   const Value& expected);

/// SQL LIKE match (`%` any run, `_` any single character) over the whole string.
bool like_match(const std::string& text, const std::string& pattern);

}  // namespace condkit::eval_internal
