#include "condkit/condkit.h"

namespace condkit {

/// Evaluates a condition tree recursively.
/// MUST short-circuit groups left to right and MUST treat empty nodes as true.
/// Inputs are the tree and record; side effects are custom validator calls only.
bool Evaluator::evaluate(const Condition& condition, const DataRecord& data) const {
  switch (condition.kind()) {
    case Condition::Kind::Group:
      if (*condition.logic == Logic::Or) {
        for (const auto& child : condition.children) {
          if (evaluate(child, data)) return true;
        }
        return false;
      }
      for (const auto& child : condition.children) {
        if (!evaluate(child, data)) return false;
      }
      return true;
    case Condition::Kind::Leaf:
      return evaluate_leaf(condition.key, condition.op, condition.value, data);
    case Condition::Kind::Empty:
      // Identity element: a node with neither a group nor a comparison holds.
      return true;
  }
  return true;
}

/// Dispatches to the tree or chain evaluator.
/// MUST follow the stored alternative.
/// Inputs are either representation and a record; outputs are boolean.
bool Evaluator::evaluate_either(const AnyCondition& condition, const DataRecord& data) const {
  if (const auto* chain = std::get_if<ConditionChain>(&condition)) {
    return evaluate_chain(*chain, data);
  }
  return evaluate(std::get<Condition>(condition), data);
}

bool evaluate(const Condition& condition, const DataRecord& data, const OperatorRegistry& registry) {
  return Evaluator(registry).evaluate(condition, data);
}

bool evaluate_either(const AnyCondition& condition,
                     const DataRecord& data,
                     const OperatorRegistry& registry) {
  return Evaluator(registry).evaluate_either(condition, data);
}

void register_operator(const std::string& id, OperatorValidator validator) {
  default_registry().register_operator(id, std::move(validator));
}

void unregister_operator(const std::string& id) {
  default_registry().unregister_operator(id);
}

std::vector<std::string> list_operators() {
  return default_registry().list();
}

}  // namespace condkit
