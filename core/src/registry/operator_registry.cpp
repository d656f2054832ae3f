#include "condkit/operator_registry.h"

#include <exception>
#include <mutex>
#include <stdexcept>

#include "condkit/condition.h"

namespace condkit {

/// Stores or replaces a custom operator.
/// MUST validate arguments before taking the write lock.
/// Inputs are id and validator; side effects are a table write.
void OperatorRegistry::register_operator(const std::string& id, OperatorValidator validator) {
  if (!validator) {
    throw std::invalid_argument("custom operator validator cannot be empty: " + id);
  }
  if (id.empty()) {
    throw std::invalid_argument("custom operator id cannot be empty");
  }
  if (is_builtin_operator(id)) {
    throw std::invalid_argument("cannot register built-in operator: " + id);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  operators_[id] = std::move(validator);
}

void OperatorRegistry::unregister_operator(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  operators_.erase(id);
}

/// Snapshots the registered ids.
/// MUST copy under a shared lock and never expose the table.
/// Inputs are none; outputs are a fresh vector.
std::vector<std::string> OperatorRegistry::list() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(operators_.size());
  for (const auto& entry : operators_) {
    out.push_back(entry.first);
  }
  return out;
}

/// Returns a copy of the validator for id.
/// MUST return a copy so callers can invoke it without the lock.
/// Inputs are ids; outputs are empty functions for unknown ids.
OperatorValidator OperatorRegistry::find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = operators_.find(id);
  if (it == operators_.end()) return {};
  return it->second;
}

bool OperatorRegistry::contains(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return operators_.find(id) != operators_.end();
}

size_t OperatorRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return operators_.size();
}

void OperatorRegistry::set_fault_handler(OperatorFaultHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  fault_handler_ = std::move(handler);
}

/// Forwards a validator fault to the installed handler.
/// MUST call the handler outside the lock and MUST NOT let it throw out.
/// Inputs are operator id and message; side effects are the handler's.
void OperatorRegistry::report_fault(const std::string& op, const std::string& message) const {
  OperatorFaultHandler handler;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    handler = fault_handler_;
  }
  if (!handler) return;
  // Handler failures are dropped; the leaf result is already false.
  try {
    handler(op, message);
  } catch (const std::exception&) {
    return;
  } catch (...) {
    return;
  }
}

/// Returns the process-wide registry behind the free functions.
/// MUST be initialized once, on first use.
/// Inputs are none; outputs are a reference with static lifetime.
OperatorRegistry& default_registry() {
  static OperatorRegistry registry;
  return registry;
}

}  // namespace condkit
