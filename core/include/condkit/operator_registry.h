#pragma once

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "condkit/value.h"

namespace condkit {

/// Custom operator: receives the record's field value (Null when the key is
/// absent) and the condition's expected value.
using OperatorValidator = std::function<bool(const Value& field, const Value& expected)>;

/// Observer for custom operators that throw during evaluation.
/// Inputs are the operator id and the exception message.
using OperatorFaultHandler = std::function<void(const std::string& op, const std::string& message)>;

/// Thread-safe table of runtime-registered operators.
/// MUST never hold its lock while a validator runs and MUST never hand out
/// references into the table; lookups return copies.
class OperatorRegistry {
 public:
  OperatorRegistry() = default;
  OperatorRegistry(const OperatorRegistry&) = delete;
  OperatorRegistry& operator=(const OperatorRegistry&) = delete;

  /// Stores or replaces the validator for id.
  /// Throws std::invalid_argument when the validator is empty, the id is
  /// empty, or the id names a built-in operator. These are programming errors.
  void register_operator(const std::string& id, OperatorValidator validator);
  /// Removes id if present.
  void unregister_operator(const std::string& id);
  /// Snapshot of the registered ids, in no particular order.
  std::vector<std::string> list() const;
  /// Returns a copy of the validator, or an empty function when id is unknown.
  OperatorValidator find(const std::string& id) const;
  bool contains(const std::string& id) const;
  size_t size() const;

  void set_fault_handler(OperatorFaultHandler handler);
  /// Forwards a validator fault to the installed handler, if any.
  /// MUST NOT propagate exceptions thrown by the handler; they are dropped.
  /// Inputs are the operator id and the fault message; side effects are the handler's.
  void report_fault(const std::string& op, const std::string& message) const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, OperatorValidator> operators_;
  OperatorFaultHandler fault_handler_;
};

/// Process-wide registry used by the free-function API in condkit.h.
OperatorRegistry& default_registry();

}  // namespace condkit
