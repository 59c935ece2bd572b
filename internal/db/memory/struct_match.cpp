#include "struct_match.hpp"

namespace jobstore::db::memory {

namespace {

using google::protobuf::Value;

const Value* Lookup(const google::protobuf::Struct& body, const std::string& field) {
  auto it = body.fields().find(field);
  if (it == body.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

template <typename T>
bool Apply(CompareOp op, const T& lhs, const T& rhs) {
  switch (op) {
    case CompareOp::Eq:
      return lhs == rhs;
    case CompareOp::Ne:
      return lhs != rhs;
    case CompareOp::Lt:
      return lhs < rhs;
    case CompareOp::Le:
      return lhs <= rhs;
    case CompareOp::Gt:
      return lhs > rhs;
    case CompareOp::Ge:
      return lhs >= rhs;
  }
  return false;
}

int Rank(const Value* v) {
  if (!v) return 0;
  switch (v->kind_case()) {
    case Value::kBoolValue:
      return 1;
    case Value::kNumberValue:
      return 2;
    case Value::kStringValue:
      return 3;
    default:
      return 4;
  }
}

} // namespace

bool Matches(const google::protobuf::Struct& body, const Predicate& predicate) {
  const Value* field = Lookup(body, predicate.field);

  if (field) {
    if (const auto* s = std::get_if<std::string>(&predicate.value); s && field->kind_case() == Value::kStringValue) {
      return Apply(predicate.op, field->string_value(), *s);
    }
    if (const auto* d = std::get_if<double>(&predicate.value); d && field->kind_case() == Value::kNumberValue) {
      return Apply(predicate.op, field->number_value(), *d);
    }
    if (const auto* b = std::get_if<bool>(&predicate.value); b && field->kind_case() == Value::kBoolValue) {
      if (predicate.op == CompareOp::Eq) return field->bool_value() == *b;
      if (predicate.op == CompareOp::Ne) return field->bool_value() != *b;
      return false;
    }
  }

  return predicate.op == CompareOp::Ne;
}

bool MatchesAll(const google::protobuf::Struct& body, const std::vector<Predicate>& predicates) {
  for (const auto& p : predicates) {
    if (!Matches(body, p)) return false;
  }
  return true;
}

int CompareFields(const google::protobuf::Struct& a, const google::protobuf::Struct& b, const std::string& field) {
  const Value* va = Lookup(a, field);
  const Value* vb = Lookup(b, field);

  const int ra = Rank(va);
  const int rb = Rank(vb);
  if (ra != rb) return ra < rb ? -1 : 1;

  switch (ra) {
    case 1:
      return static_cast<int>(va->bool_value()) - static_cast<int>(vb->bool_value());
    case 2:
      return va->number_value() < vb->number_value() ? -1 : (va->number_value() > vb->number_value() ? 1 : 0);
    case 3:
      return va->string_value().compare(vb->string_value());
    default:
      return 0;
  }
}

} // namespace jobstore::db::memory
