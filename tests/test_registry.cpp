#include "test_harness.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "condkit/condkit.h"

using condkit::Condition;
using condkit::DataRecord;
using condkit::Value;

namespace {

bool iequal(const Value& field, const Value& expected) {
  std::string a = condkit::to_string(field);
  std::string b = condkit::to_string(expected);
  auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
  std::transform(a.begin(), a.end(), a.begin(), lower);
  std::transform(b.begin(), b.end(), b.begin(), lower);
  return a == b;
}

template <typename Fn>
bool throws_invalid_argument(Fn fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void test_register_and_unregister() {
  condkit::OperatorRegistry registry;
  DataRecord data{{"name", "John Doe"}};
  Condition cond = Condition::leaf("name", "case_insensitive_eq", "john doe");
  expect_true(!condkit::evaluate(cond, data, registry), "unknown before registration");

  registry.register_operator("case_insensitive_eq", iequal);
  expect_true(registry.contains("case_insensitive_eq"), "registered");
  expect_true(condkit::evaluate(cond, data, registry), "custom operator applies");
  expect_true(!condkit::evaluate(Condition::leaf("name", "case_insensitive_eq", "jane"), data, registry),
              "custom operator can fail");

  registry.unregister_operator("case_insensitive_eq");
  expect_true(!registry.contains("case_insensitive_eq"), "removed");
  expect_true(!condkit::evaluate(cond, data, registry), "unknown after removal");
  registry.unregister_operator("never_registered");
  expect_eq(registry.size(), 0, "removing unknown ids is a no-op");
}

void test_register_replaces_entry() {
  condkit::OperatorRegistry registry;
  registry.register_operator("flag", [](const Value&, const Value&) { return false; });
  registry.register_operator("flag", [](const Value&, const Value&) { return true; });
  expect_eq(registry.size(), 1, "one entry per id");
  expect_true(condkit::evaluate(Condition::leaf("x", "flag", Value()), DataRecord{{"x", 1}}, registry),
              "latest validator wins");
}

void test_list_operators() {
  condkit::OperatorRegistry registry;
  registry.register_operator("case_insensitive_eq", iequal);
  registry.register_operator("email_domain", [](const Value&, const Value&) { return true; });
  registry.register_operator("in_range", [](const Value&, const Value&) { return true; });
  auto ids = registry.list();
  std::sort(ids.begin(), ids.end());
  expect_eq(ids.size(), 3, "three operators");
  if (ids.size() == 3) {
    expect_eq(ids[0], "case_insensitive_eq", "first id");
    expect_eq(ids[1], "email_domain", "second id");
    expect_eq(ids[2], "in_range", "third id");
  }
}

void test_register_rejects_misuse() {
  condkit::OperatorRegistry registry;
  expect_true(throws_invalid_argument([&] { registry.register_operator("empty", nullptr); }),
              "empty validator");
  expect_true(throws_invalid_argument([&] { registry.register_operator("", iequal); }), "empty id");
  expect_true(throws_invalid_argument([&] { registry.register_operator("eq", iequal); }),
              "built-in word form");
  expect_true(throws_invalid_argument([&] { registry.register_operator(">=", iequal); }),
              "built-in alias");
  expect_eq(registry.size(), 0, "nothing stored");
}

void test_absent_key_reaches_custom_operator() {
  condkit::OperatorRegistry registry;
  registry.register_operator("handle_missing", [](const Value& field, const Value& expected) {
    return field.is_null() && condkit::to_string(expected) == "missing";
  });
  DataRecord data{{"age", 25}};
  expect_true(condkit::evaluate(Condition::leaf("nonexistent", "handle_missing", "missing"), data,
                                registry),
              "absent key passed as null");
  expect_true(!condkit::evaluate(Condition::leaf("age", "handle_missing", "missing"), data, registry),
              "present key passed through");
}

void test_faulting_operator_is_contained() {
  condkit::OperatorRegistry registry;
  registry.register_operator("panic_operator", [](const Value&, const Value&) -> bool {
    throw std::runtime_error("validator exploded");
  });
  registry.register_operator("odd_throw", [](const Value&, const Value&) -> bool { throw 42; });
  DataRecord data{{"value", "test"}};

  expect_true(!condkit::evaluate(Condition::leaf("value", "panic_operator", Value()), data, registry),
              "fault without handler is false");

  std::string seen_op;
  std::string seen_message;
  int faults = 0;
  registry.set_fault_handler([&](const std::string& op, const std::string& message) {
    seen_op = op;
    seen_message = message;
    ++faults;
  });
  expect_true(!condkit::evaluate(Condition::leaf("value", "panic_operator", Value()), data, registry),
              "fault with handler is false");
  expect_eq(seen_op, "panic_operator", "handler sees operator id");
  expect_eq(seen_message, "validator exploded", "handler sees message");
  expect_true(!condkit::evaluate(Condition::leaf("value", "odd_throw", Value()), data, registry),
              "non-standard exception is contained");
  expect_eq(static_cast<size_t>(faults), 2, "both faults reported");

  Condition group = Condition::any_of({Condition::leaf("value", "panic_operator", Value()),
                                       Condition::leaf("value", "eq", "test")});
  expect_true(condkit::evaluate(group, data, registry), "fault does not poison siblings");
}

void test_throwing_fault_handler_is_contained() {
  condkit::OperatorRegistry registry;
  registry.register_operator("boom", [](const Value&, const Value&) -> bool {
    throw std::runtime_error("validator failed");
  });
  int handled = 0;
  registry.set_fault_handler([&handled](const std::string&, const std::string&) {
    ++handled;
    throw std::runtime_error("handler threw");
  });
  DataRecord data{{"k", 1}};
  Condition tree = Condition::any_of({Condition::leaf("k", "boom", 1), Condition::leaf("k", "eq", 1)});
  bool result = false;
  bool escaped = false;
  try {
    result = condkit::evaluate(tree, data, registry);
  } catch (const std::exception&) {
    escaped = true;
  }
  expect_true(!escaped, "handler exception stays inside evaluation");
  expect_true(result, "sibling OR branch still decides");
  expect_eq(static_cast<size_t>(handled), 1, "handler was called");

  registry.set_fault_handler([](const std::string&, const std::string&) { throw 7; });
  escaped = false;
  try {
    result = condkit::evaluate(Condition::leaf("k", "boom", 1), data, registry);
  } catch (...) {
    escaped = true;
  }
  expect_true(!escaped && !result, "non-standard handler exception is contained");
}

void test_concurrent_evaluation_and_registration() {
  condkit::OperatorRegistry registry;
  std::atomic<int> calls{0};
  registry.register_operator("thread_safe", [&calls](const Value& field, const Value&) {
    ++calls;
    return condkit::to_string(field) == "test";
  });
  DataRecord data{{"value", "test"}};
  Condition cond = Condition::leaf("value", "thread_safe", Value());

  constexpr int kThreads = 4;
  constexpr int kIterations = 10000;
  std::atomic<int> wrong{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      condkit::Evaluator evaluator(registry);
      for (int i = 0; i < kIterations; ++i) {
        if (!evaluator.evaluate(cond, data)) ++wrong;
      }
    });
  }
  workers.emplace_back([&] {
    for (int i = 0; i < kIterations; ++i) {
      std::string id = "churn_" + std::to_string(i % 8);
      registry.register_operator(id, [](const Value&, const Value&) { return true; });
      registry.unregister_operator(id);
      (void)registry.list();
    }
  });
  for (auto& worker : workers) worker.join();

  expect_eq(static_cast<size_t>(wrong.load()), 0, "every evaluation succeeded");
  expect_eq(static_cast<size_t>(calls.load()), static_cast<size_t>(kThreads * kIterations),
            "every call reached the validator");
  expect_eq(registry.size(), 1, "churn left no entries");
}

void test_validator_may_use_registry() {
  condkit::OperatorRegistry registry;
  registry.register_operator("self_registering", [&registry](const Value&, const Value&) {
    registry.register_operator("late", [](const Value&, const Value&) { return true; });
    return registry.contains("late");
  });
  DataRecord data{{"k", 1}};
  expect_true(condkit::evaluate(Condition::leaf("k", "self_registering", Value()), data, registry),
              "registry usable inside a validator");
  expect_true(condkit::evaluate(Condition::leaf("k", "late", Value()), data, registry),
              "operator registered during evaluation");
}

}  // namespace

void register_registry_tests(std::vector<TestCase>& tests) {
  tests.push_back({"registry_register_and_unregister", test_register_and_unregister});
  tests.push_back({"registry_register_replaces_entry", test_register_replaces_entry});
  tests.push_back({"registry_list_operators", test_list_operators});
  tests.push_back({"registry_rejects_misuse", test_register_rejects_misuse});
  tests.push_back({"registry_absent_key_reaches_custom_operator",
                   test_absent_key_reaches_custom_operator});
  tests.push_back({"registry_faulting_operator_is_contained", test_faulting_operator_is_contained});
  tests.push_back({"registry_throwing_fault_handler_is_contained",
                   test_throwing_fault_handler_is_contained});
  tests.push_back({"registry_concurrent_evaluation_and_registration",
                   test_concurrent_evaluation_and_registration});
  tests.push_back({"registry_validator_may_use_registry", test_validator_may_use_registry});
}
