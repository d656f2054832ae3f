#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "condkit/value.h"

namespace condkit {

/// Logical connector between conditions.
enum class Logic { And, Or };

/// Returns "AND" or "OR".
const char* logic_name(Logic logic);

/// Operators evaluated directly by the engine.
/// These identifiers are reserved and can never be registered as custom operators.
enum class BuiltinOp {
  Eq,
  Neq,
  Gt,
  Gte,
  Lt,
  Lte,
  In,
  Nin,
  Contains,
  NContains,
  IsNull,
  IsNotNull,
  IsEmpty,
  IsNotEmpty,
  IsTrue,
  IsFalse,
  Like,
  ILike,
  NLike,
  StartsWith,
  EndsWith,
  Between,
  NotBetween,
};

/// Maps an operator identifier to a built-in operator.
/// Accepts the word forms ("eq", "gte", ...) and the symbolic aliases
/// ("==", "!=", ">", ">=", "<", "<="). Matching is exact.
std::optional<BuiltinOp> parse_builtin_operator(std::string_view id);
/// Canonical word form of a built-in operator.
const char* builtin_operator_name(BuiltinOp op);
bool is_builtin_operator(std::string_view id);
/// Canonical names of every built-in operator, in declaration order.
std::vector<std::string> builtin_operator_names();

/// Nested condition tree node.
/// A node is a Group when logic is set and children is non-empty, a Leaf when
/// key and op are both non-empty, and Empty otherwise. Empty nodes evaluate
/// to true.
struct Condition {
  enum class Kind { Group, Leaf, Empty };

  std::optional<Logic> logic;
  std::vector<Condition> children;

  std::string key;
  std::string op;
  Value value;

  Kind kind() const;

  static Condition leaf(std::string key, std::string op, Value value = Value());
  static Condition all_of(std::vector<Condition> children);
  static Condition any_of(std::vector<Condition> children);
};

struct ConditionChain;

/// One element of a flat chain: either a leaf comparison or a nested chain,
/// joined to the following link by next_logic (AND when unset).
struct ChainLink {
  std::string key;
  std::string op;
  Value value;

  std::shared_ptr<const ConditionChain> group;

  std::optional<Logic> next_logic;

  bool is_group() const { return group != nullptr; }

  static ChainLink leaf(std::string key,
                        std::string op,
                        Value value = Value(),
                        std::optional<Logic> next_logic = std::nullopt);
  static ChainLink nested(ConditionChain chain, std::optional<Logic> next_logic = std::nullopt);
};

/// Flat condition list folded left to right with per-link connectives.
struct ConditionChain {
  std::vector<ChainLink> links;

  static ConditionChain of(std::vector<ChainLink> links);
};

/// Either representation, for callers that accept both.
using AnyCondition = std::variant<Condition, ConditionChain>;

}  // namespace condkit
