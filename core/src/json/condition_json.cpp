#include "condkit/json.h"

#include <cstdint>

#include "condkit/coerce.h"
#include "../util/string_util.h"

namespace condkit {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& path, const std::string& message) {
  throw ParseError(path + ": " + message);
}

/// Converts a JSON node into a Value.
/// MUST keep integers integral and degrade oversized unsigned values to Float.
/// Inputs are JSON and its path; outputs are values or ParseError.
Value value_at(const json& j, const std::string& path) {
  switch (j.type()) {
    case json::value_t::null:
      return Value();
    case json::value_t::boolean:
      return Value(j.get<bool>());
    case json::value_t::number_integer:
      return Value(j.get<int64_t>());
    case json::value_t::number_unsigned:
      return Value(j.get<uint64_t>());
    case json::value_t::number_float:
      return Value(j.get<double>());
    case json::value_t::string:
      return Value(j.get<std::string>());
    case json::value_t::array: {
      ValueList items;
      items.reserve(j.size());
      for (size_t i = 0; i < j.size(); ++i) {
        items.push_back(value_at(j[i], path + "[" + std::to_string(i) + "]"));
      }
      return Value(std::move(items));
    }
    case json::value_t::object: {
      ValueMap entries;
      for (auto it = j.begin(); it != j.end(); ++it) {
        entries.emplace(it.key(), value_at(it.value(), path + "." + it.key()));
      }
      return Value(std::move(entries));
    }
    default:
      fail(path, "unsupported JSON value type");
  }
}

/// Reads an optional string member; null and missing both yield "".
std::string string_member(const json& obj, const char* name, const std::string& path) {
  auto it = obj.find(name);
  if (it == obj.end() || it->is_null()) return "";
  if (!it->is_string()) fail(path + "." + name, "expected a string");
  return it->get<std::string>();
}

/// Reads a logic connector; empty strings mean "not set".
std::optional<Logic> logic_member(const json& obj, const char* name, const std::string& path) {
  std::string raw = string_member(obj, name, path);
  if (raw.empty()) return std::nullopt;
  std::string upper = util::to_upper(raw);
  if (upper == "AND") return Logic::And;
  if (upper == "OR") return Logic::Or;
  fail(path + "." + name, "unknown logic '" + raw + "' (use AND or OR)");
}

const json* array_member(const json& obj, const char* name, const std::string& path) {
  auto it = obj.find(name);
  if (it == obj.end() || it->is_null()) return nullptr;
  if (!it->is_array()) fail(path + "." + name, "expected an array");
  return &*it;
}

Value value_member(const json& obj, const std::string& path) {
  auto it = obj.find("value");
  if (it == obj.end()) return Value();
  return value_at(*it, path + ".value");
}

/// Reads one tree node and its children.
/// MUST treat JSON null as an empty node.
/// Inputs are JSON and its path; outputs are conditions or ParseError.
Condition condition_at(const json& j, const std::string& path) {
  Condition out;
  if (j.is_null()) return out;
  if (!j.is_object()) fail(path, "condition must be an object");
  out.logic = logic_member(j, "logic", path);
  if (const json* children = array_member(j, "children", path)) {
    out.children.reserve(children->size());
    for (size_t i = 0; i < children->size(); ++i) {
      out.children.push_back(
          condition_at((*children)[i], path + ".children[" + std::to_string(i) + "]"));
    }
  }
  out.key = string_member(j, "key", path);
  out.op = string_member(j, "operator", path);
  out.value = value_member(j, path);
  return out;
}

ConditionChain chain_at(const json& j, const std::string& path);

/// Reads one chain link, leaf or nested group.
/// MUST prefer a non-null group over leaf fields.
/// Inputs are JSON and its path; outputs are links or ParseError.
ChainLink link_at(const json& j, const std::string& path) {
  if (!j.is_object()) fail(path, "chain link must be an object");
  ChainLink out;
  auto group = j.find("group");
  if (group != j.end() && !group->is_null()) {
    out.group = std::make_shared<const ConditionChain>(chain_at(*group, path + ".group"));
  }
  out.key = string_member(j, "key", path);
  out.op = string_member(j, "operator", path);
  out.value = value_member(j, path);
  out.next_logic = logic_member(j, "next_logic", path);
  return out;
}

ConditionChain chain_at(const json& j, const std::string& path) {
  if (!j.is_object()) fail(path, "condition chain must be an object");
  ConditionChain out;
  if (const json* links = array_member(j, "conditions", path)) {
    out.links.reserve(links->size());
    for (size_t i = 0; i < links->size(); ++i) {
      out.links.push_back(link_at((*links)[i], path + ".conditions[" + std::to_string(i) + "]"));
    }
  }
  return out;
}

}  // namespace

Value value_from_json(const json& j) {
  return value_at(j, "$");
}

json value_to_json(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:
      return nullptr;
    case Value::Kind::Bool:
      return v.as_bool();
    case Value::Kind::Int:
      return v.as_int();
    case Value::Kind::Float:
      return v.as_float();
    case Value::Kind::String:
      return v.as_string();
    case Value::Kind::Time:
      return format_time(v.as_time());
    case Value::Kind::Sequence: {
      json out = json::array();
      for (const auto& item : v.as_list()) {
        out.push_back(value_to_json(item));
      }
      return out;
    }
    case Value::Kind::Mapping: {
      json out = json::object();
      for (const auto& entry : v.as_map()) {
        out[entry.first] = value_to_json(entry.second);
      }
      return out;
    }
  }
  return nullptr;
}

DataRecord record_from_json(const json& j) {
  if (!j.is_object()) fail("$", "data record must be an object");
  DataRecord out;
  for (auto it = j.begin(); it != j.end(); ++it) {
    out.emplace(it.key(), value_at(it.value(), "$." + it.key()));
  }
  return out;
}

Condition condition_from_json(const json& j) {
  return condition_at(j, "$");
}

/// Writes the nested tree form.
/// MUST omit unset logic, empty children and empty leaf fields.
/// Inputs are conditions; outputs are JSON objects.
json condition_to_json(const Condition& condition) {
  json out = json::object();
  if (condition.logic.has_value()) out["logic"] = logic_name(*condition.logic);
  if (!condition.children.empty()) {
    json children = json::array();
    for (const auto& child : condition.children) {
      children.push_back(condition_to_json(child));
    }
    out["children"] = std::move(children);
  }
  if (!condition.key.empty()) out["key"] = condition.key;
  if (!condition.op.empty()) out["operator"] = condition.op;
  if (!condition.value.is_null()) out["value"] = value_to_json(condition.value);
  return out;
}

ConditionChain chain_from_json(const json& j) {
  return chain_at(j, "$");
}

/// Writes the flat chain form.
/// MUST write nested chains under "group" and omit unset connectives.
/// Inputs are chains; outputs are JSON objects.
json chain_to_json(const ConditionChain& chain) {
  json links = json::array();
  for (const auto& link : chain.links) {
    json item = json::object();
    if (link.is_group()) {
      item["group"] = chain_to_json(*link.group);
    } else {
      if (!link.key.empty()) item["key"] = link.key;
      if (!link.op.empty()) item["operator"] = link.op;
      if (!link.value.is_null()) item["value"] = value_to_json(link.value);
    }
    if (link.next_logic.has_value()) item["next_logic"] = logic_name(*link.next_logic);
    links.push_back(std::move(item));
  }
  json out = json::object();
  out["conditions"] = std::move(links);
  return out;
}

AnyCondition any_condition_from_json(const json& j) {
  if (j.is_object() && j.contains("conditions")) {
    return chain_from_json(j);
  }
  return condition_from_json(j);
}

json any_condition_to_json(const AnyCondition& condition) {
  if (const auto* chain = std::get_if<ConditionChain>(&condition)) {
    return chain_to_json(*chain);
  }
  return condition_to_json(std::get<Condition>(condition));
}

}  // namespace condkit
