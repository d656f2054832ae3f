#pragma once

#include <string>
#include <vector>

#include "condkit/coerce.h"
#include "condkit/condition.h"
#include "condkit/operator_registry.h"
#include "condkit/value.h"

namespace condkit {

/// Evaluates conditions against records using the operators of one registry.
/// MUST be side-effect free apart from invoking custom validators, and MUST
/// always produce a boolean: custom-operator faults resolve the leaf to false.
/// The registry must outlive the evaluator.
class Evaluator {
 public:
  explicit Evaluator(const OperatorRegistry& registry) : registry_(registry) {}

  /// Nested tree: AND/OR groups short-circuit left to right; empty nodes are true.
  bool evaluate(const Condition& condition, const DataRecord& data) const;
  /// Flat chain: left fold over every link using the previous link's next_logic.
  bool evaluate_chain(const ConditionChain& chain, const DataRecord& data) const;
  /// Dispatches on the stored alternative.
  bool evaluate_either(const AnyCondition& condition, const DataRecord& data) const;
  /// Single (key, op, value) comparison.
  bool evaluate_leaf(const std::string& key,
                     const std::string& op,
                     const Value& expected,
                     const DataRecord& data) const;

  const OperatorRegistry& registry() const { return registry_; }

 private:
  const OperatorRegistry& registry_;
};

bool evaluate(const Condition& condition,
              const DataRecord& data,
              const OperatorRegistry& registry = default_registry());
bool evaluate_chain(const ConditionChain& chain,
                    const DataRecord& data,
                    const OperatorRegistry& registry = default_registry());
bool evaluate_either(const AnyCondition& condition,
                     const DataRecord& data,
                     const OperatorRegistry& registry = default_registry());

/// Rewrites a tree as an equivalent chain: each group becomes one link per
/// child joined by the group's logic, leaves stay leaves, and empty nodes
/// become empty nested chains.
ConditionChain convert_tree_to_chain(const Condition& condition);

/// Free-function registry access on default_registry().
void register_operator(const std::string& id, OperatorValidator validator);
void unregister_operator(const std::string& id);
std::vector<std::string> list_operators();

}  // namespace condkit
