#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "servant/common/value.hpp"

// Operations shared by the implementation interpreter and by generated C++
// code, so that both renditions of a service compute identical results.
// Every operation is pure; failures throw EvalError.
namespace servant::ops {

// nil and false are falsy; every other value is truthy.
auto Truthy(const Value& v) -> bool;

auto Add(const Value& lhs, const Value& rhs) -> Value;
auto Sub(const Value& lhs, const Value& rhs) -> Value;
auto Mul(const Value& lhs, const Value& rhs) -> Value;
auto Div(const Value& lhs, const Value& rhs) -> Value;
auto Mod(const Value& lhs, const Value& rhs) -> Value;
auto Neg(const Value& operand) -> Value;
auto Not(const Value& operand) -> Value;

auto Eq(const Value& lhs, const Value& rhs) -> Value;
auto Ne(const Value& lhs, const Value& rhs) -> Value;
auto Lt(const Value& lhs, const Value& rhs) -> Value;
auto Le(const Value& lhs, const Value& rhs) -> Value;
auto Gt(const Value& lhs, const Value& rhs) -> Value;
auto Ge(const Value& lhs, const Value& rhs) -> Value;

// Map lookup; nil when the key is absent or the container itself is nil.
auto Get(const Value& map, const Value& key) -> Value;
auto Put(const Value& map, const Value& key, const Value& item) -> Value;
auto Has(const Value& map, const Value& key) -> Value;
auto Delete(const Value& map, const Value& key) -> Value;
auto Size(const Value& map) -> Value;

[[noreturn]] void Raise(const Value& message);

// Deepest chain of nested helper calls one thread may run. Deeper recursion
// fails with EvalError instead of exhausting the thread's stack.
inline constexpr uint32_t kMaxCallDepth = 1000;

// Counts one helper call on the current thread for as long as it lives;
// throws EvalError when the chain would exceed kMaxCallDepth.
class CallDepthGuard {
 public:
  CallDepthGuard(std::string_view function, uint32_t arity);
  ~CallDepthGuard();

  CallDepthGuard(const CallDepthGuard&) = delete;
  auto operator=(const CallDepthGuard&) -> CallDepthGuard& = delete;
  CallDepthGuard(CallDepthGuard&&) = delete;
  auto operator=(CallDepthGuard&&) -> CallDepthGuard& = delete;

  // Nested helper calls active on the current thread.
  [[nodiscard]] static auto Depth() -> uint32_t;
};

// No clause of `function` (written as name/arity) accepts `args`.
[[noreturn]] void NoMatchingClause(
    std::string_view function, const std::vector<Value>& args);

}  // namespace servant::ops
