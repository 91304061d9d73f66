#include "servant/common/value_ops.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace servant::ops {

namespace {

thread_local uint32_t call_depth = 0;

[[noreturn]] void ThrowBadOperands(
    const char* op, const Value& lhs, const Value& rhs) {
  throw EvalError(
      fmt::format(
          "bad operands for '{}': {} and {}", op, ToString(lhs.Kind()),
          ToString(rhs.Kind())));
}

auto CheckedInt(const char* op, bool overflowed, int64_t result) -> Value {
  if (overflowed) {
    throw EvalError(fmt::format("integer overflow in '{}'", op));
  }
  return Value::Int(result);
}

// A map operand for builtins that accept nil as the empty map.
auto MapOrEmpty(const Value& map, const char* fn) -> ValueMap {
  if (map.IsNil()) {
    return {};
  }
  if (!map.IsMap()) {
    throw EvalError(
        fmt::format(
            "{}: expected map, got {}", fn, ToString(map.Kind())));
  }
  return map.AsMap();
}

}  // namespace

auto Truthy(const Value& v) -> bool {
  if (v.IsNil()) {
    return false;
  }
  if (v.IsBool()) {
    return v.AsBool();
  }
  return true;
}

auto Add(const Value& lhs, const Value& rhs) -> Value {
  if (lhs.IsInt() && rhs.IsInt()) {
    int64_t result = 0;
    bool overflowed =
        __builtin_add_overflow(lhs.AsInt(), rhs.AsInt(), &result);
    return CheckedInt("+", overflowed, result);
  }
  if (lhs.IsString() && rhs.IsString()) {
    return Value::String(lhs.AsString() + rhs.AsString());
  }
  ThrowBadOperands("+", lhs, rhs);
}

auto Sub(const Value& lhs, const Value& rhs) -> Value {
  if (!lhs.IsInt() || !rhs.IsInt()) {
    ThrowBadOperands("-", lhs, rhs);
  }
  int64_t result = 0;
  bool overflowed = __builtin_sub_overflow(lhs.AsInt(), rhs.AsInt(), &result);
  return CheckedInt("-", overflowed, result);
}

auto Mul(const Value& lhs, const Value& rhs) -> Value {
  if (!lhs.IsInt() || !rhs.IsInt()) {
    ThrowBadOperands("*", lhs, rhs);
  }
  int64_t result = 0;
  bool overflowed = __builtin_mul_overflow(lhs.AsInt(), rhs.AsInt(), &result);
  return CheckedInt("*", overflowed, result);
}

auto Div(const Value& lhs, const Value& rhs) -> Value {
  if (!lhs.IsInt() || !rhs.IsInt()) {
    ThrowBadOperands("/", lhs, rhs);
  }
  if (rhs.AsInt() == 0) {
    throw EvalError("division by zero");
  }
  if (lhs.AsInt() == std::numeric_limits<int64_t>::min() &&
      rhs.AsInt() == -1) {
    throw EvalError("integer overflow in '/'");
  }
  return Value::Int(lhs.AsInt() / rhs.AsInt());
}

auto Mod(const Value& lhs, const Value& rhs) -> Value {
  if (!lhs.IsInt() || !rhs.IsInt()) {
    ThrowBadOperands("%", lhs, rhs);
  }
  if (rhs.AsInt() == 0) {
    throw EvalError("division by zero");
  }
  if (rhs.AsInt() == -1) {
    return Value::Int(0);
  }
  return Value::Int(lhs.AsInt() % rhs.AsInt());
}

auto Neg(const Value& operand) -> Value {
  if (!operand.IsInt()) {
    throw EvalError(
        fmt::format(
            "bad operand for unary '-': {}", ToString(operand.Kind())));
  }
  if (operand.AsInt() == std::numeric_limits<int64_t>::min()) {
    throw EvalError("integer overflow in unary '-'");
  }
  return Value::Int(-operand.AsInt());
}

auto Not(const Value& operand) -> Value {
  return Value::Bool(!Truthy(operand));
}

auto Eq(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(lhs == rhs);
}

auto Ne(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(!(lhs == rhs));
}

auto Lt(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(lhs < rhs);
}

auto Le(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(!(rhs < lhs));
}

auto Gt(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(rhs < lhs);
}

auto Ge(const Value& lhs, const Value& rhs) -> Value {
  return Value::Bool(!(lhs < rhs));
}

auto Get(const Value& map, const Value& key) -> Value {
  if (map.IsNil()) {
    return Value::Nil();
  }
  if (!map.IsMap()) {
    throw EvalError(
        fmt::format("cannot index into {} value", ToString(map.Kind())));
  }
  const auto& entries = map.AsMap();
  auto it = entries.find(key);
  if (it == entries.end()) {
    return Value::Nil();
  }
  return it->second;
}

auto Put(const Value& map, const Value& key, const Value& item) -> Value {
  ValueMap entries = MapOrEmpty(map, "put");
  entries.insert_or_assign(key, item);
  return Value::Map(std::move(entries));
}

auto Has(const Value& map, const Value& key) -> Value {
  if (map.IsNil()) {
    return Value::Bool(false);
  }
  if (!map.IsMap()) {
    throw EvalError(
        fmt::format("has: expected map, got {}", ToString(map.Kind())));
  }
  return Value::Bool(map.AsMap().contains(key));
}

auto Delete(const Value& map, const Value& key) -> Value {
  ValueMap entries = MapOrEmpty(map, "delete");
  entries.erase(key);
  return Value::Map(std::move(entries));
}

auto Size(const Value& map) -> Value {
  if (map.IsString()) {
    return Value::Int(static_cast<int64_t>(map.AsString().size()));
  }
  return Value::Int(static_cast<int64_t>(MapOrEmpty(map, "size").size()));
}

void Raise(const Value& message) {
  throw EvalError(ToDisplayString(message));
}

void NoMatchingClause(
    std::string_view function, const std::vector<Value>& args) {
  std::string rendered;
  for (const auto& arg : args) {
    if (!rendered.empty()) {
      rendered += ", ";
    }
    rendered += ToString(arg);
  }
  throw EvalError(
      fmt::format("no clause of {} matches ({})", function, rendered));
}

CallDepthGuard::CallDepthGuard(std::string_view function, uint32_t arity) {
  if (call_depth >= kMaxCallDepth) {
    throw EvalError(
        fmt::format(
            "recursion too deep in {}/{}: more than {} nested calls",
            function, arity, kMaxCallDepth));
  }
  ++call_depth;
}

CallDepthGuard::~CallDepthGuard() {
  --call_depth;
}

auto CallDepthGuard::Depth() -> uint32_t {
  return call_depth;
}

}  // namespace servant::ops
