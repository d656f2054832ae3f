#include "condkit/condition.h"

namespace condkit {

const char* logic_name(Logic logic) {
  return logic == Logic::Or ? "OR" : "AND";
}

/// Classifies a node as Group, Leaf or Empty.
/// MUST require both logic and children for a Group.
/// Inputs are the node; outputs are the kind with no side effects.
Condition::Kind Condition::kind() const {
  if (logic.has_value() && !children.empty()) return Kind::Group;
  if (!key.empty() && !op.empty()) return Kind::Leaf;
  return Kind::Empty;
}

Condition Condition::leaf(std::string key, std::string op, Value value) {
  Condition out;
  out.key = std::move(key);
  out.op = std::move(op);
  out.value = std::move(value);
  return out;
}

Condition Condition::all_of(std::vector<Condition> children) {
  Condition out;
  out.logic = Logic::And;
  out.children = std::move(children);
  return out;
}

Condition Condition::any_of(std::vector<Condition> children) {
  Condition out;
  out.logic = Logic::Or;
  out.children = std::move(children);
  return out;
}

ChainLink ChainLink::leaf(std::string key,
                          std::string op,
                          Value value,
                          std::optional<Logic> next_logic) {
  ChainLink out;
  out.key = std::move(key);
  out.op = std::move(op);
  out.value = std::move(value);
  out.next_logic = next_logic;
  return out;
}

ChainLink ChainLink::nested(ConditionChain chain, std::optional<Logic> next_logic) {
  ChainLink out;
  out.group = std::make_shared<const ConditionChain>(std::move(chain));
  out.next_logic = next_logic;
  return out;
}

ConditionChain ConditionChain::of(std::vector<ChainLink> links) {
  ConditionChain out;
  out.links = std::move(links);
  return out;
}

}  // namespace condkit
