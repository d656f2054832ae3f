#include "condkit/condition.h"

namespace condkit {

namespace {

struct OperatorName {
  const char* id;
  BuiltinOp op;
};

// Canonical names first, then the symbolic aliases. builtin_operator_name and
// builtin_operator_names only look at the canonical block.
const OperatorName kOperatorNames[] = {
    {"eq", BuiltinOp::Eq},
    {"neq", BuiltinOp::Neq},
    {"gt", BuiltinOp::Gt},
    {"gte", BuiltinOp::Gte},
    {"lt", BuiltinOp::Lt},
    {"lte", BuiltinOp::Lte},
    {"in", BuiltinOp::In},
    {"nin", BuiltinOp::Nin},
    {"contains", BuiltinOp::Contains},
    {"ncontains", BuiltinOp::NContains},
    {"isnull", BuiltinOp::IsNull},
    {"isnotnull", BuiltinOp::IsNotNull},
    {"isempty", BuiltinOp::IsEmpty},
    {"isnotempty", BuiltinOp::IsNotEmpty},
    {"istrue", BuiltinOp::IsTrue},
    {"isfalse", BuiltinOp::IsFalse},
    {"like", BuiltinOp::Like},
    {"ilike", BuiltinOp::ILike},
    {"nlike", BuiltinOp::NLike},
    {"startswith", BuiltinOp::StartsWith},
    {"endswith", BuiltinOp::EndsWith},
    {"between", BuiltinOp::Between},
    {"notbetween", BuiltinOp::NotBetween},
    {"==", BuiltinOp::Eq},
    {"!=", BuiltinOp::Neq},
    {">", BuiltinOp::Gt},
    {">=", BuiltinOp::Gte},
    {"<", BuiltinOp::Lt},
    {"<=", BuiltinOp::Lte},
};

constexpr size_t kCanonicalCount = 23;

}  // namespace

/// Looks up an operator identifier in the built-in table.
/// MUST match exactly, without case folding.
/// Inputs are identifiers; outputs are nullopt for custom or unknown ids.
std::optional<BuiltinOp> parse_builtin_operator(std::string_view id) {
  for (const auto& entry : kOperatorNames) {
    if (id == entry.id) return entry.op;
  }
  return std::nullopt;
}

const char* builtin_operator_name(BuiltinOp op) {
  for (size_t i = 0; i < kCanonicalCount; ++i) {
    if (kOperatorNames[i].op == op) return kOperatorNames[i].id;
  }
  return "";
}

bool is_builtin_operator(std::string_view id) {
  return parse_builtin_operator(id).has_value();
}

/// Lists the canonical built-in names in declaration order.
/// MUST exclude the symbolic aliases.
/// Inputs are none; outputs are a fresh vector.
std::vector<std::string> builtin_operator_names() {
  std::vector<std::string> out;
  out.reserve(kCanonicalCount);
  for (size_t i = 0; i < kCanonicalCount; ++i) {
    out.emplace_back(kOperatorNames[i].id);
  }
  return out;
}

}  // namespace condkit
