#include "condkit/condkit.h"

namespace condkit {

namespace {

/// Converts one group child into a chain link.
/// MUST keep leaves as leaves and nest every other node.
/// Inputs are the child and its connective; outputs are links.
ChainLink link_for_child(const Condition& child, std::optional<Logic> next_logic) {
  if (child.kind() == Condition::Kind::Leaf) {
    return ChainLink::leaf(child.key, child.op, child.value, next_logic);
  }
  return ChainLink::nested(convert_tree_to_chain(child), next_logic);
}

}  // namespace

/// Folds a chain left to right using each link's next_logic.
/// MUST evaluate every link and MUST treat an unset connective as AND.
/// Inputs are the chain and record; side effects are custom validator calls only.
bool Evaluator::evaluate_chain(const ConditionChain& chain, const DataRecord& data) const {
  if (chain.links.empty()) return true;

  auto eval_link = [&](const ChainLink& link) {
    if (link.is_group()) return evaluate_chain(*link.group, data);
    return evaluate_leaf(link.key, link.op, link.value, data);
  };

  bool result = eval_link(chain.links.front());
  for (size_t i = 1; i < chain.links.size(); ++i) {
    // Every link runs, even when the outcome is already fixed.
    bool current = eval_link(chain.links[i]);
    Logic logic = chain.links[i - 1].next_logic.value_or(Logic::And);
    if (logic == Logic::Or) {
      result = result || current;
    } else {
      result = result && current;
    }
  }
  return result;
}

bool evaluate_chain(const ConditionChain& chain,
                    const DataRecord& data,
                    const OperatorRegistry& registry) {
  return Evaluator(registry).evaluate_chain(chain, data);
}

/// Rewrites a condition tree as an equivalent chain.
/// MUST give every link but the last its group's logic.
/// Inputs are trees; outputs are chains with no side effects.
ConditionChain convert_tree_to_chain(const Condition& condition) {
  ConditionChain out;
  switch (condition.kind()) {
    case Condition::Kind::Leaf:
      out.links.push_back(ChainLink::leaf(condition.key, condition.op, condition.value));
      break;
    case Condition::Kind::Group: {
      const auto& children = condition.children;
      out.links.reserve(children.size());
      for (size_t i = 0; i < children.size(); ++i) {
        std::optional<Logic> next;
        if (i + 1 < children.size()) next = condition.logic;
        out.links.push_back(link_for_child(children[i], next));
      }
      break;
    }
    case Condition::Kind::Empty:
      break;
  }
  return out;
}

}  // namespace condkit
