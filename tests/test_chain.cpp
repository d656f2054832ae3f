#include "test_harness.h"

#include <random>
#include <string>

#include "condkit/condkit.h"

using condkit::ChainLink;
using condkit::Condition;
using condkit::ConditionChain;
using condkit::DataRecord;
using condkit::Logic;
using condkit::Value;

namespace {

DataRecord profile() {
  return DataRecord{{"age", 25}, {"country", "TH"}, {"status", "active"}};
}

void test_chain_mixed_logic() {
  condkit::OperatorRegistry registry;
  ConditionChain chain = ConditionChain::of({
      ChainLink::leaf("age", "gt", 30, Logic::Or),
      ChainLink::leaf("country", "eq", "TH"),
  });
  expect_true(condkit::evaluate_chain(chain, profile(), registry), "false OR true");

  ConditionChain left_fold = ConditionChain::of({
      ChainLink::leaf("age", "gt", 30, Logic::Or),
      ChainLink::leaf("country", "eq", "TH", Logic::And),
      ChainLink::leaf("status", "eq", "inactive"),
  });
  expect_true(!condkit::evaluate_chain(left_fold, profile(), registry),
              "(false OR true) AND false folds left");

  ConditionChain or_last = ConditionChain::of({
      ChainLink::leaf("age", "gt", 30, Logic::And),
      ChainLink::leaf("country", "eq", "SG", Logic::Or),
      ChainLink::leaf("status", "eq", "active"),
  });
  expect_true(condkit::evaluate_chain(or_last, profile(), registry),
              "(false AND false) OR true");
}

void test_chain_defaults_to_and() {
  condkit::OperatorRegistry registry;
  ConditionChain chain = ConditionChain::of({
      ChainLink::leaf("age", "gt", 18),
      ChainLink::leaf("country", "eq", "SG"),
  });
  expect_true(!condkit::evaluate_chain(chain, profile(), registry), "missing next_logic is AND");

  ConditionChain trailing = ConditionChain::of({ChainLink::leaf("age", "gt", 18, Logic::Or)});
  expect_true(condkit::evaluate_chain(trailing, profile(), registry),
              "next_logic on the last link is ignored");
  expect_true(condkit::evaluate_chain(ConditionChain{}, profile(), registry), "empty chain holds");
}

void test_chain_nested_groups() {
  condkit::OperatorRegistry registry;
  ConditionChain inner = ConditionChain::of({
      ChainLink::leaf("country", "eq", "SG", Logic::Or),
      ChainLink::leaf("status", "eq", "active"),
  });
  ConditionChain chain = ConditionChain::of({
      ChainLink::leaf("age", "gt", 18, Logic::And),
      ChainLink::nested(inner),
  });
  expect_true(condkit::evaluate_chain(chain, profile(), registry), "AND with nested OR");

  ConditionChain with_empty = ConditionChain::of({
      ChainLink::nested(ConditionChain{}, Logic::And),
      ChainLink::leaf("age", "lt", 18),
  });
  expect_true(!condkit::evaluate_chain(with_empty, profile(), registry), "empty nested chain");
}

void test_chain_evaluates_every_link() {
  condkit::OperatorRegistry registry;
  int calls = 0;
  registry.register_operator("probe", [&calls](const Value&, const Value&) {
    ++calls;
    return false;
  });
  ConditionChain chain = ConditionChain::of({
      ChainLink::leaf("age", "gt", 18, Logic::Or),
      ChainLink::leaf("age", "probe", Value(), Logic::Or),
      ChainLink::leaf("age", "probe", Value()),
  });
  expect_true(condkit::evaluate_chain(chain, profile(), registry), "true OR false OR false");
  expect_eq(static_cast<size_t>(calls), 2, "no short-circuit in chains");
}

void test_evaluate_either_dispatch() {
  condkit::OperatorRegistry registry;
  condkit::AnyCondition tree = Condition::leaf("age", "eq", 25);
  condkit::AnyCondition chain = ConditionChain::of({ChainLink::leaf("age", "eq", 26)});
  expect_true(condkit::evaluate_either(tree, profile(), registry), "tree alternative");
  expect_true(!condkit::evaluate_either(chain, profile(), registry), "chain alternative");
}

void test_convert_tree_shape() {
  Condition tree = Condition::all_of({
      Condition::leaf("age", "gt", 18),
      Condition::any_of({Condition::leaf("country", "eq", "SG"),
                         Condition::leaf("status", "eq", "active")}),
      Condition::leaf("score", "gte", 50),
  });
  ConditionChain chain = condkit::convert_tree_to_chain(tree);
  expect_eq(chain.links.size(), 3, "one link per child");
  if (chain.links.size() != 3) return;
  expect_true(!chain.links[0].is_group() && chain.links[0].key == "age", "leaf stays a leaf");
  expect_true(chain.links[0].next_logic == Logic::And, "group logic on first link");
  expect_true(chain.links[1].is_group(), "subgroup becomes nested chain");
  expect_true(chain.links[1].next_logic == Logic::And, "group logic on middle link");
  expect_true(!chain.links[2].next_logic.has_value(), "last link has no connective");
  if (chain.links[1].is_group()) {
    const ConditionChain& inner = *chain.links[1].group;
    expect_eq(inner.links.size(), 2, "nested links");
    if (inner.links.size() == 2) {
      expect_true(inner.links[0].next_logic == Logic::Or, "nested logic");
      expect_true(!inner.links[1].next_logic.has_value(), "nested last link");
    }
  }

  ConditionChain single = condkit::convert_tree_to_chain(Condition::leaf("age", "gt", 18));
  expect_eq(single.links.size(), 1, "leaf converts to one link");
  expect_eq(condkit::convert_tree_to_chain(Condition{}).links.size(), 0,
            "empty node converts to empty chain");
}

class TreeGenerator {
 public:
  explicit TreeGenerator(unsigned seed) : rng_(seed) {}

  Condition tree(int depth) {
    int roll = pick(10);
    if (depth <= 0 || roll < 4) return leaf();
    if (roll == 4) return Condition{};
    Condition group;
    group.logic = pick(2) == 0 ? Logic::And : Logic::Or;
    int count = 1 + pick(4);
    for (int i = 0; i < count; ++i) {
      group.children.push_back(tree(depth - 1));
    }
    return group;
  }

  DataRecord record() {
    static const char* kKeys[] = {"a", "b", "c"};
    DataRecord out;
    for (const char* key : kKeys) {
      int roll = pick(6);
      if (roll == 0) continue;
      if (roll == 1) {
        out.emplace(key, nullptr);
      } else {
        out.emplace(key, pick(4));
      }
    }
    return out;
  }

 private:
  int pick(int n) { return std::uniform_int_distribution<int>(0, n - 1)(rng_); }

  Condition leaf() {
    static const char* kKeys[] = {"a", "b", "c", "d"};
    static const char* kOps[] = {"eq", "neq", "gt", "lte", "isnull", "istrue", "in", "between"};
    const char* op = kOps[pick(8)];
    Value expected = pick(4);
    if (std::string(op) == "in") expected = Value::list({pick(4), pick(4)});
    if (std::string(op) == "between") expected = Value::list({pick(2), 1 + pick(3)});
    return Condition::leaf(kKeys[pick(4)], op, expected);
  }

  std::mt19937 rng_;
};

void test_conversion_preserves_meaning() {
  condkit::OperatorRegistry registry;
  condkit::Evaluator evaluator(registry);
  TreeGenerator gen(20240601u);
  size_t mismatches = 0;
  for (int t = 0; t < 100; ++t) {
    Condition tree = gen.tree(4);
    ConditionChain chain = condkit::convert_tree_to_chain(tree);
    for (int r = 0; r < 20; ++r) {
      DataRecord data = gen.record();
      if (evaluator.evaluate(tree, data) != evaluator.evaluate_chain(chain, data)) ++mismatches;
    }
  }
  expect_eq(mismatches, 0, "tree and converted chain agree");
}

}  // namespace

void register_chain_tests(std::vector<TestCase>& tests) {
  tests.push_back({"chain_mixed_logic", test_chain_mixed_logic});
  tests.push_back({"chain_defaults_to_and", test_chain_defaults_to_and});
  tests.push_back({"chain_nested_groups", test_chain_nested_groups});
  tests.push_back({"chain_evaluates_every_link", test_chain_evaluates_every_link});
  tests.push_back({"evaluate_either_dispatch", test_evaluate_either_dispatch});
  tests.push_back({"convert_tree_shape", test_convert_tree_shape});
  tests.push_back({"conversion_preserves_meaning", test_conversion_preserves_meaning});
}
