#include "servant/impl/interpreter.hpp"

#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "servant/common/internal_error.hpp"
#include "servant/common/value_ops.hpp"
#include "servant/decl/expression.hpp"

namespace servant::impl {

namespace {

auto ApplyBinary(decl::BinaryOp op, const Value& lhs, const Value& rhs)
    -> Value {
  switch (op) {
    case decl::BinaryOp::kMul:
      return ops::Mul(lhs, rhs);
    case decl::BinaryOp::kDiv:
      return ops::Div(lhs, rhs);
    case decl::BinaryOp::kMod:
      return ops::Mod(lhs, rhs);
    case decl::BinaryOp::kAdd:
      return ops::Add(lhs, rhs);
    case decl::BinaryOp::kSub:
      return ops::Sub(lhs, rhs);
    case decl::BinaryOp::kEqual:
      return ops::Eq(lhs, rhs);
    case decl::BinaryOp::kNotEqual:
      return ops::Ne(lhs, rhs);
    case decl::BinaryOp::kLess:
      return ops::Lt(lhs, rhs);
    case decl::BinaryOp::kLessEqual:
      return ops::Le(lhs, rhs);
    case decl::BinaryOp::kGreater:
      return ops::Gt(lhs, rhs);
    case decl::BinaryOp::kGreaterEqual:
      return ops::Ge(lhs, rhs);
    case decl::BinaryOp::kLogicalAnd:
    case decl::BinaryOp::kLogicalOr:
      break;
  }
  common::ThrowInternalError(
      "ApplyBinary", "logical operators are evaluated lazily");
}

auto ApplyBuiltin(decl::Builtin builtin, const std::vector<Value>& args)
    -> Value {
  switch (builtin) {
    case decl::Builtin::kPut:
      return ops::Put(args[0], args[1], args[2]);
    case decl::Builtin::kGet:
      return ops::Get(args[0], args[1]);
    case decl::Builtin::kHas:
      return ops::Has(args[0], args[1]);
    case decl::Builtin::kDelete:
      return ops::Delete(args[0], args[1]);
    case decl::Builtin::kSize:
      return ops::Size(args[0]);
    case decl::Builtin::kRaise:
      ops::Raise(args[0]);
  }
  common::ThrowInternalError("ApplyBuiltin", "unknown builtin");
}

}  // namespace

Interpreter::Interpreter(std::shared_ptr<const Module> module)
    : module_(std::move(module)) {
}

auto Interpreter::Invoke(
    const Function& function, const Value& state,
    const std::vector<Value>& args) const -> Reply {
  if (!function.IsPublic()) {
    common::ThrowInternalError(
        "Interpreter::Invoke",
        fmt::format("'{}' is not a public function", function.name));
  }
  std::vector<Value> full_args;
  full_args.reserve(args.size() + 1);
  full_args.push_back(state);
  full_args.insert(full_args.end(), args.begin(), args.end());

  Env env;
  const auto& clause = SelectClause(function, full_args, env);
  return EvalTail(clause.body, env);
}

auto Interpreter::Invoke(
    std::string_view name, const Value& state,
    const std::vector<Value>& args) const -> Reply {
  const Function* function =
      module_->FindPublic(name, static_cast<uint32_t>(args.size()));
  if (function == nullptr) {
    throw EvalError(
        fmt::format("no public function {}/{}", name, args.size()));
  }
  return Invoke(*function, state, args);
}

auto Interpreter::CallHelper(
    std::string_view name, const std::vector<Value>& args) const -> Value {
  const Function* function =
      module_->FindFunction(name, static_cast<uint32_t>(args.size()));
  if (function == nullptr || function->IsPublic()) {
    throw EvalError(fmt::format("no helper {}/{}", name, args.size()));
  }
  return CallFunction(*function, args);
}

auto Interpreter::SelectClause(
    const Function& function, const std::vector<Value>& args, Env& env) const
    -> const decl::FunctionClause& {
  for (const auto& clause : function.clauses) {
    env.clear();
    bool matched = true;
    for (size_t i = 0; i < clause.params.size() && matched; ++i) {
      const auto& pattern = clause.params[i];
      switch (pattern.kind) {
        case decl::PatternKind::kBind:
          env.push_back(Binding{.name = pattern.name, .value = args[i]});
          break;
        case decl::PatternKind::kWildcard:
          break;
        case decl::PatternKind::kLiteral:
          matched = pattern.literal == args[i];
          break;
      }
    }
    if (!matched) {
      continue;
    }
    if (clause.guard && !ops::Truthy(Eval(*clause.guard, env))) {
      continue;
    }
    return clause;
  }
  ops::NoMatchingClause(
      fmt::format("{}/{}", function.name, function.CallerArity()),
      function.IsPublic()
          ? std::vector<Value>(args.begin() + 1, args.end())
          : args);
}

auto Interpreter::EvalTail(decl::ExpressionId id, Env& env) const -> Reply {
  const decl::Expression& expr = module_->arena[id];

  switch (expr.kind) {
    case decl::ExpressionKind::kLet: {
      const auto& data = std::get<decl::LetExpressionData>(expr.data);
      Value value = Eval(data.value, env);
      env.push_back(Binding{.name = data.name, .value = std::move(value)});
      Reply reply = EvalTail(data.body, env);
      env.pop_back();
      return reply;
    }

    case decl::ExpressionKind::kIf: {
      const auto& data = std::get<decl::IfExpressionData>(expr.data);
      if (ops::Truthy(Eval(data.condition, env))) {
        return EvalTail(data.then_expr, env);
      }
      if (data.else_expr) {
        return EvalTail(*data.else_expr, env);
      }
      return runtime::Plain<Value>{.value = Value::Nil()};
    }

    case decl::ExpressionKind::kReply: {
      const auto& data = std::get<decl::ReplyExpressionData>(expr.data);
      if (data.kind == decl::ReplyKind::kPlain) {
        return runtime::Plain<Value>{.value = Eval(*data.value, env)};
      }
      Value new_state = Eval(*data.new_state, env);
      Value value = data.value ? Eval(*data.value, env) : new_state;
      return runtime::WithState<Value, Value>{
          .value = std::move(value), .new_state = std::move(new_state)};
    }

    default:
      common::ThrowInternalError(
          "Interpreter::EvalTail", "tail position holds no reply");
  }
}

auto Interpreter::Eval(decl::ExpressionId id, Env& env) const -> Value {
  const decl::Expression& expr = module_->arena[id];

  switch (expr.kind) {
    case decl::ExpressionKind::kLiteral:
      return std::get<decl::LiteralExpressionData>(expr.data).value;

    case decl::ExpressionKind::kMapLiteral: {
      const auto& data = std::get<decl::MapLiteralExpressionData>(expr.data);
      ValueMap entries;
      for (const auto& [key, value] : data.entries) {
        Value k = Eval(key, env);
        entries.insert_or_assign(std::move(k), Eval(value, env));
      }
      return Value::Map(std::move(entries));
    }

    case decl::ExpressionKind::kNameRef:
      return Lookup(env, std::get<decl::NameRefExpressionData>(expr.data).name);

    case decl::ExpressionKind::kUnaryOp: {
      const auto& data = std::get<decl::UnaryExpressionData>(expr.data);
      Value operand = Eval(data.operand, env);
      return data.op == decl::UnaryOp::kNegate ? ops::Neg(operand)
                                               : ops::Not(operand);
    }

    case decl::ExpressionKind::kBinaryOp: {
      const auto& data = std::get<decl::BinaryExpressionData>(expr.data);
      if (data.op == decl::BinaryOp::kLogicalAnd) {
        return Value::Bool(
            ops::Truthy(Eval(data.lhs, env)) &&
            ops::Truthy(Eval(data.rhs, env)));
      }
      if (data.op == decl::BinaryOp::kLogicalOr) {
        return Value::Bool(
            ops::Truthy(Eval(data.lhs, env)) ||
            ops::Truthy(Eval(data.rhs, env)));
      }
      Value lhs = Eval(data.lhs, env);
      return ApplyBinary(data.op, lhs, Eval(data.rhs, env));
    }

    case decl::ExpressionKind::kIndex: {
      const auto& data = std::get<decl::IndexExpressionData>(expr.data);
      Value base = Eval(data.base, env);
      return ops::Get(base, Eval(data.key, env));
    }

    case decl::ExpressionKind::kCall: {
      const auto& data = std::get<decl::CallExpressionData>(expr.data);
      std::vector<Value> args;
      args.reserve(data.arguments.size());
      for (auto arg : data.arguments) {
        args.push_back(Eval(arg, env));
      }
      if (data.callee_kind == decl::CalleeKind::kBuiltin) {
        return ApplyBuiltin(data.builtin, args);
      }
      const Function* helper = module_->FindFunction(
          data.callee, static_cast<uint32_t>(args.size()));
      if (helper == nullptr || data.callee_kind != decl::CalleeKind::kHelper) {
        common::ThrowInternalError(
            "Interpreter::Eval",
            fmt::format("unresolved call to '{}'", data.callee));
      }
      return CallFunction(*helper, std::move(args));
    }

    case decl::ExpressionKind::kIf: {
      const auto& data = std::get<decl::IfExpressionData>(expr.data);
      if (ops::Truthy(Eval(data.condition, env))) {
        return Eval(data.then_expr, env);
      }
      return data.else_expr ? Eval(*data.else_expr, env) : Value::Nil();
    }

    case decl::ExpressionKind::kLet: {
      const auto& data = std::get<decl::LetExpressionData>(expr.data);
      Value value = Eval(data.value, env);
      env.push_back(Binding{.name = data.name, .value = std::move(value)});
      Value result = Eval(data.body, env);
      env.pop_back();
      return result;
    }

    case decl::ExpressionKind::kSetState:
    case decl::ExpressionKind::kReply:
      break;
  }
  common::ThrowInternalError(
      "Interpreter::Eval", "reply form outside tail position");
}

auto Interpreter::CallFunction(
    const Function& function, std::vector<Value> args) const -> Value {
  ops::CallDepthGuard depth(function.name, function.CallerArity());
  Env env;
  const auto& clause = SelectClause(function, args, env);
  return Eval(clause.body, env);
}

auto Interpreter::Lookup(const Env& env, std::string_view name)
    -> const Value& {
  for (auto it = env.rbegin(); it != env.rend(); ++it) {
    if (it->name == name) {
      return it->value;
    }
  }
  common::ThrowInternalError(
      "Interpreter::Lookup", fmt::format("unbound name '{}'", name));
}

}  // namespace servant::impl
