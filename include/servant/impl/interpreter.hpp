#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "servant/common/value.hpp"
#include "servant/decl/fwd.hpp"
#include "servant/impl/module.hpp"
#include "servant/runtime/reply.hpp"

namespace servant::impl {

using Reply = runtime::NormalizedReply<Value, Value>;

// Evaluates the functions of a lowered module. Evaluation is pure: the same
// state and arguments always give an equal reply, and nothing outside the
// returned reply is changed. Failures throw EvalError.
//
// Safe to share between threads; the interpreter holds no mutable state.
class Interpreter {
 public:
  explicit Interpreter(std::shared_ptr<const Module> module);

  // Invoke public function `function` on `state`. `args` excludes the state.
  [[nodiscard]] auto Invoke(
      const Function& function, const Value& state,
      const std::vector<Value>& args) const -> Reply;

  // Same, looked up by name and client argument count.
  [[nodiscard]] auto Invoke(
      std::string_view name, const Value& state,
      const std::vector<Value>& args) const -> Reply;

  // Call a private helper.
  [[nodiscard]] auto CallHelper(
      std::string_view name, const std::vector<Value>& args) const -> Value;

  [[nodiscard]] auto GetModule() const -> const Module& {
    return *module_;
  }

 private:
  struct Binding {
    std::string_view name;
    Value value;
  };
  using Env = std::vector<Binding>;

  // Picks the first clause whose patterns and guard accept `args`, binding
  // its parameters into `env`.
  auto SelectClause(
      const Function& function, const std::vector<Value>& args, Env& env) const
      -> const decl::FunctionClause&;

  auto EvalTail(decl::ExpressionId id, Env& env) const -> Reply;
  auto Eval(decl::ExpressionId id, Env& env) const -> Value;
  auto CallFunction(const Function& function, std::vector<Value> args) const
      -> Value;

  [[nodiscard]] static auto Lookup(const Env& env, std::string_view name)
      -> const Value&;

  std::shared_ptr<const Module> module_;
};

}  // namespace servant::impl
