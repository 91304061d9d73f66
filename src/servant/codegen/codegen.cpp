#include "servant/codegen/codegen.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "servant/common/internal_error.hpp"
#include "servant/decl/expression.hpp"

namespace servant::codegen {

namespace {

constexpr std::string_view kCppKeywords[] = {
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
    "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
    "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
    "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
};

// Names the generated client class uses for itself.
constexpr std::string_view kReservedMembers[] = {
    "Run",   "Service", "GetState", "InitialState", "DefaultOptions",
    "Value", "Reply",   "Runtime",  "service",
};

auto OpsFunction(decl::BinaryOp op) -> const char* {
  switch (op) {
    case decl::BinaryOp::kMul:
      return "Mul";
    case decl::BinaryOp::kDiv:
      return "Div";
    case decl::BinaryOp::kMod:
      return "Mod";
    case decl::BinaryOp::kAdd:
      return "Add";
    case decl::BinaryOp::kSub:
      return "Sub";
    case decl::BinaryOp::kEqual:
      return "Eq";
    case decl::BinaryOp::kNotEqual:
      return "Ne";
    case decl::BinaryOp::kLess:
      return "Lt";
    case decl::BinaryOp::kLessEqual:
      return "Le";
    case decl::BinaryOp::kGreater:
      return "Gt";
    case decl::BinaryOp::kGreaterEqual:
      return "Ge";
    case decl::BinaryOp::kLogicalAnd:
    case decl::BinaryOp::kLogicalOr:
      break;
  }
  common::ThrowInternalError("OpsFunction", "logical operator");
}

auto OpsFunction(decl::Builtin builtin) -> const char* {
  switch (builtin) {
    case decl::Builtin::kPut:
      return "Put";
    case decl::Builtin::kGet:
      return "Get";
    case decl::Builtin::kHas:
      return "Has";
    case decl::Builtin::kDelete:
      return "Delete";
    case decl::Builtin::kSize:
      return "Size";
    case decl::Builtin::kRaise:
      return "Raise";
  }
  common::ThrowInternalError("OpsFunction", "unknown builtin");
}

auto ModeEnumerator(ServiceMode mode) -> const char* {
  switch (mode) {
    case ServiceMode::kInline:
      return "kInline";
    case ServiceMode::kAnonymous:
      return "kAnonymous";
    case ServiceMode::kNamed:
      return "kNamed";
    case ServiceMode::kPooled:
      return "kPooled";
  }
  return "kAnonymous";
}

auto Join(const std::vector<std::string>& parts, std::string_view sep)
    -> std::string {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result += sep;
    }
    result += parts[i];
  }
  return result;
}

auto ImplParams(uint32_t arity) -> std::string {
  std::vector<std::string> params;
  for (uint32_t i = 0; i < arity; ++i) {
    params.push_back(fmt::format("const Value& a{}", i));
  }
  return Join(params, ", ");
}

auto ReturnType(const impl::Function& function) -> const char* {
  return function.IsPublic() ? "Reply" : "Value";
}

}  // namespace

auto QuoteString(std::string_view text) -> std::string {
  std::string quoted = "\"";
  for (char c : text) {
    switch (c) {
      case '"':
        quoted += "\\\"";
        break;
      case '\\':
        quoted += "\\\\";
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\t':
        quoted += "\\t";
        break;
      case '\r':
        quoted += "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          quoted += fmt::format("\\{:03o}", static_cast<unsigned char>(c));
        } else {
          quoted += c;
        }
    }
  }
  quoted += '"';
  return quoted;
}

auto RenderValue(const Value& value) -> std::string {
  switch (value.Kind()) {
    case ValueKind::kNil:
      return "Value::Nil()";
    case ValueKind::kBool:
      return value.AsBool() ? "Value::Bool(true)" : "Value::Bool(false)";
    case ValueKind::kInt:
      if (value.AsInt() == std::numeric_limits<int64_t>::min()) {
        return "Value::Int(-9223372036854775807LL - 1)";
      }
      return fmt::format("Value::Int({})", value.AsInt());
    case ValueKind::kString:
      return fmt::format("Value::String({})", QuoteString(value.AsString()));
    case ValueKind::kMap: {
      std::vector<std::string> entries;
      for (const auto& [k, v] : value.AsMap()) {
        entries.push_back(
            fmt::format("{{{}, {}}}", RenderValue(k), RenderValue(v)));
      }
      return fmt::format(
          "Value::Map(servant::ValueMap{{{}}})", Join(entries, ", "));
    }
  }
  common::ThrowInternalError("RenderValue", "unknown value kind");
}

auto CppIdentifier(std::string_view name) -> std::string {
  std::string id(name);
  for (auto keyword : kCppKeywords) {
    if (keyword == name) {
      return id + "_";
    }
  }
  for (auto reserved : kReservedMembers) {
    if (reserved == name) {
      return id + "_";
    }
  }
  return id;
}

auto SnakeCase(std::string_view name) -> std::string {
  std::string result;
  for (size_t i = 0; i < name.size(); ++i) {
    auto c = static_cast<unsigned char>(name[i]);
    if (std::isupper(c) != 0) {
      bool after_lower =
          i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1])) !=
                        0 ||
                    std::isdigit(static_cast<unsigned char>(name[i - 1])) !=
                        0);
      bool acronym_end =
          i > 0 && i + 1 < name.size() &&
          std::isupper(static_cast<unsigned char>(name[i - 1])) != 0 &&
          std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
      if (after_lower || acronym_end) {
        result += '_';
      }
      result += static_cast<char>(std::tolower(c));
    } else {
      result += static_cast<char>(c);
    }
  }
  return CppIdentifier(result);
}

auto Codegen::Generate(const impl::Module& module, std::string_view source_name)
    -> std::string {
  module_ = &module;
  out_.str("");
  indent_ = 0;
  next_binding_ = 0;
  scope_.clear();

  EmitPrologue(source_name);
  EmitImplementation();
  EmitClient();
  EmitEpilogue();

  return out_.str();
}

void Codegen::Line(const std::string& text) {
  out_ << std::string(static_cast<size_t>(indent_) * 2, ' ') << text << "\n";
}

void Codegen::Blank() {
  out_ << "\n";
}

void Codegen::EmitPrologue(std::string_view source_name) {
  Line(
      fmt::format(
          "// Generated by servantc from {}. Do not edit.", source_name));
  Line("#pragma once");
  Blank();
  Line("#include <chrono>");
  Line("#include <memory>");
  Line("#include <string>");
  Line("#include <utility>");
  Blank();
  Line("#include \"servant/common/service_mode.hpp\"");
  Line("#include \"servant/common/value.hpp\"");
  Line("#include \"servant/common/value_ops.hpp\"");
  Line("#include \"servant/runtime/reply.hpp\"");
  Line("#include \"servant/runtime/strategies.hpp\"");
  Blank();
  Line(
      fmt::format(
          "namespace servant::generated::{} {{",
          SnakeCase(module_->spec.module_name)));
  Blank();
  Line("using servant::Value;");
  Line("using Reply = servant::runtime::NormalizedReply<Value, Value>;");
  Blank();
}

void Codegen::EmitImplementation() {
  Line("namespace impl {");
  Blank();
  // Helpers may call each other in any order.
  bool any_helper = false;
  for (const auto& function : module_->functions) {
    if (!function.IsPublic()) {
      EmitFunctionDeclaration(function);
      any_helper = true;
    }
  }
  if (any_helper) {
    Blank();
  }
  for (const auto& function : module_->functions) {
    EmitFunction(function);
  }
  Line("}  // namespace impl");
  Blank();
}

void Codegen::EmitFunctionDeclaration(const impl::Function& function) {
  Line(
      fmt::format(
          "inline auto {}({}) -> {};", CppIdentifier(function.name),
          ImplParams(function.arity), ReturnType(function)));
}

void Codegen::EmitFunction(const impl::Function& function) {
  Line(
      fmt::format(
          "inline auto {}({}) -> {} {{", CppIdentifier(function.name),
          ImplParams(function.arity), ReturnType(function)));
  ++indent_;
  if (!function.IsPublic()) {
    Line(
        fmt::format(
            "servant::ops::CallDepthGuard depth_guard({}, {});",
            QuoteString(function.name), function.CallerArity()));
  }
  for (const auto& clause : function.clauses) {
    EmitClause(function, clause);
  }

  std::vector<std::string> args;
  for (uint32_t i = function.IsPublic() ? 1 : 0; i < function.arity; ++i) {
    args.push_back(fmt::format("a{}", i));
  }
  Line(
      fmt::format(
          "servant::ops::NoMatchingClause({}, {{{}}});",
          QuoteString(
              fmt::format("{}/{}", function.name, function.CallerArity())),
          Join(args, ", ")));
  --indent_;
  Line("}");
  Blank();
}

void Codegen::EmitClause(
    const impl::Function& function, const decl::FunctionClause& clause) {
  std::vector<std::string> checks;
  for (size_t i = 0; i < clause.params.size(); ++i) {
    if (clause.params[i].kind == decl::PatternKind::kLiteral) {
      checks.push_back(
          fmt::format("a{} == {}", i, RenderValue(clause.params[i].literal)));
    }
  }
  Line(checks.empty() ? "{" : fmt::format("if ({}) {{", Join(checks, " && ")));
  ++indent_;

  auto scope_size = scope_.size();
  for (size_t i = 0; i < clause.params.size(); ++i) {
    if (clause.params[i].kind == decl::PatternKind::kBind) {
      auto cpp_name = Bind(clause.params[i].name);
      Line(
          fmt::format(
              "[[maybe_unused]] const Value& {} = a{};", cpp_name, i));
    }
  }

  bool guarded = clause.guard.has_value();
  if (guarded) {
    Line(
        fmt::format(
            "if (servant::ops::Truthy({})) {{", Expr(*clause.guard)));
    ++indent_;
  }
  if (function.IsPublic()) {
    EmitReplyTail(clause.body);
  } else {
    EmitValueTail(clause.body);
  }
  if (guarded) {
    --indent_;
    Line("}");
  }
  scope_.resize(scope_size);

  --indent_;
  Line("}");
}

void Codegen::EmitReplyTail(decl::ExpressionId id) {
  const decl::Expression& expr = module_->arena[id];

  switch (expr.kind) {
    case decl::ExpressionKind::kLet: {
      const auto& data = std::get<decl::LetExpressionData>(expr.data);
      std::string value = Expr(data.value);
      auto scope_size = scope_.size();
      Line(fmt::format("const Value {} = {};", Bind(data.name), value));
      EmitReplyTail(data.body);
      scope_.resize(scope_size);
      return;
    }

    case decl::ExpressionKind::kIf: {
      const auto& data = std::get<decl::IfExpressionData>(expr.data);
      Line(
          fmt::format(
              "if (servant::ops::Truthy({})) {{", Expr(data.condition)));
      ++indent_;
      EmitReplyTail(data.then_expr);
      --indent_;
      Line("} else {");
      ++indent_;
      if (data.else_expr) {
        EmitReplyTail(*data.else_expr);
      } else {
        Line("return servant::runtime::Plain<Value>{Value::Nil()};");
      }
      --indent_;
      Line("}");
      return;
    }

    case decl::ExpressionKind::kReply: {
      const auto& data = std::get<decl::ReplyExpressionData>(expr.data);
      if (data.kind == decl::ReplyKind::kPlain) {
        Line(
            fmt::format(
                "return servant::runtime::Plain<Value>{{{}}};",
                Expr(*data.value)));
        return;
      }
      std::string new_state =
          fmt::format("new_state_{}", next_binding_++);
      Line(
          fmt::format(
              "const Value {} = {};", new_state, Expr(*data.new_state)));
      std::string value = data.value ? Expr(*data.value) : new_state;
      Line(
          fmt::format(
              "return servant::runtime::WithState<Value, Value>{{{}, {}}};",
              value, new_state));
      return;
    }

    default:
      common::ThrowInternalError(
          "Codegen::EmitReplyTail", "tail position holds no reply");
  }
}

void Codegen::EmitValueTail(decl::ExpressionId id) {
  const decl::Expression& expr = module_->arena[id];

  switch (expr.kind) {
    case decl::ExpressionKind::kLet: {
      const auto& data = std::get<decl::LetExpressionData>(expr.data);
      std::string value = Expr(data.value);
      auto scope_size = scope_.size();
      Line(fmt::format("const Value {} = {};", Bind(data.name), value));
      EmitValueTail(data.body);
      scope_.resize(scope_size);
      return;
    }

    case decl::ExpressionKind::kIf: {
      const auto& data = std::get<decl::IfExpressionData>(expr.data);
      Line(
          fmt::format(
              "if (servant::ops::Truthy({})) {{", Expr(data.condition)));
      ++indent_;
      EmitValueTail(data.then_expr);
      --indent_;
      Line("} else {");
      ++indent_;
      if (data.else_expr) {
        EmitValueTail(*data.else_expr);
      } else {
        Line("return Value::Nil();");
      }
      --indent_;
      Line("}");
      return;
    }

    default:
      Line(fmt::format("return {};", Expr(id)));
      return;
  }
}

auto Codegen::Expr(decl::ExpressionId id) -> std::string {
  const decl::Expression& expr = module_->arena[id];

  switch (expr.kind) {
    case decl::ExpressionKind::kLiteral:
      return RenderValue(std::get<decl::LiteralExpressionData>(expr.data).value);

    case decl::ExpressionKind::kMapLiteral: {
      const auto& data = std::get<decl::MapLiteralExpressionData>(expr.data);
      std::vector<std::string> entries;
      for (const auto& [key, value] : data.entries) {
        entries.push_back(fmt::format("{{{}, {}}}", Expr(key), Expr(value)));
      }
      return fmt::format(
          "Value::Map(servant::ValueMap{{{}}})", Join(entries, ", "));
    }

    case decl::ExpressionKind::kNameRef:
      return Resolve(std::get<decl::NameRefExpressionData>(expr.data).name);

    case decl::ExpressionKind::kUnaryOp: {
      const auto& data = std::get<decl::UnaryExpressionData>(expr.data);
      return fmt::format(
          "servant::ops::{}({})",
          data.op == decl::UnaryOp::kNegate ? "Neg" : "Not",
          Expr(data.operand));
    }

    case decl::ExpressionKind::kBinaryOp: {
      const auto& data = std::get<decl::BinaryExpressionData>(expr.data);
      if (data.op == decl::BinaryOp::kLogicalAnd ||
          data.op == decl::BinaryOp::kLogicalOr) {
        return fmt::format(
            "Value::Bool(servant::ops::Truthy({}) {} servant::ops::Truthy({}))",
            Expr(data.lhs),
            data.op == decl::BinaryOp::kLogicalAnd ? "&&" : "||",
            Expr(data.rhs));
      }
      return Apply(
          fmt::format("servant::ops::{}", OpsFunction(data.op)),
          {data.lhs, data.rhs});
    }

    case decl::ExpressionKind::kIndex: {
      const auto& data = std::get<decl::IndexExpressionData>(expr.data);
      return Apply("servant::ops::Get", {data.base, data.key});
    }

    case decl::ExpressionKind::kCall: {
      const auto& data = std::get<decl::CallExpressionData>(expr.data);
      if (data.callee_kind == decl::CalleeKind::kBuiltin) {
        if (data.builtin == decl::Builtin::kRaise) {
          return fmt::format(
              "[&]() -> Value {{ servant::ops::Raise({}); }}()",
              Expr(data.arguments[0]));
        }
        return Apply(
            fmt::format("servant::ops::{}", OpsFunction(data.builtin)),
            data.arguments);
      }
      if (data.callee_kind != decl::CalleeKind::kHelper) {
        common::ThrowInternalError(
            "Codegen::Expr",
            fmt::format("unresolved call to '{}'", data.callee));
      }
      return Apply(CppIdentifier(data.callee), data.arguments);
    }

    case decl::ExpressionKind::kIf: {
      const auto& data = std::get<decl::IfExpressionData>(expr.data);
      return fmt::format(
          "(servant::ops::Truthy({}) ? {} : {})", Expr(data.condition),
          Expr(data.then_expr),
          data.else_expr ? Expr(*data.else_expr) : "Value::Nil()");
    }

    case decl::ExpressionKind::kLet: {
      const auto& data = std::get<decl::LetExpressionData>(expr.data);
      std::string value = Expr(data.value);
      auto scope_size = scope_.size();
      std::string name = Bind(data.name);
      std::string body = Expr(data.body);
      scope_.resize(scope_size);
      return fmt::format(
          "[&]() -> Value {{ const Value {} = {}; return {}; }}()", name,
          value, body);
    }

    case decl::ExpressionKind::kSetState:
    case decl::ExpressionKind::kReply:
      break;
  }
  common::ThrowInternalError(
      "Codegen::Expr", "reply form outside tail position");
}

auto Codegen::Apply(
    std::string_view callee, const std::vector<decl::ExpressionId>& operands)
    -> std::string {
  // Names and literals cannot fail, so their order is unobservable.
  auto may_fail = [&](decl::ExpressionId id) {
    auto kind = module_->arena[id].kind;
    return kind != decl::ExpressionKind::kLiteral &&
           kind != decl::ExpressionKind::kNameRef;
  };
  if (std::ranges::count_if(operands, may_fail) < 2) {
    std::vector<std::string> args;
    for (auto operand : operands) {
      args.push_back(Expr(operand));
    }
    return fmt::format("{}({})", callee, Join(args, ", "));
  }

  // Function arguments are unsequenced in C++; temporaries fix the order.
  std::string body;
  std::vector<std::string> temps;
  for (auto operand : operands) {
    temps.push_back(fmt::format("t_{}", next_binding_++));
    body += fmt::format("const Value {} = {}; ", temps.back(), Expr(operand));
  }
  return fmt::format(
      "[&]() -> Value {{ {}return {}({}); }}()", body, callee,
      Join(temps, ", "));
}

auto Codegen::Bind(const std::string& name) -> std::string {
  std::string cpp_name = fmt::format("{}_{}", name, next_binding_++);
  scope_.emplace_back(name, cpp_name);
  return cpp_name;
}

auto Codegen::Resolve(const std::string& name) const -> const std::string& {
  for (auto it = scope_.rbegin(); it != scope_.rend(); ++it) {
    if (it->first == name) {
      return it->second;
    }
  }
  common::ThrowInternalError(
      "Codegen::Resolve", fmt::format("unbound name '{}'", name));
}

auto Codegen::ClientParams(const impl::Function& function) const
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (uint32_t i = 1; i < function.arity; ++i) {
    // A clause-independent name when every clause binds the same one.
    std::string name;
    for (const auto& clause : function.clauses) {
      const auto& param = clause.params[i];
      std::string candidate =
          param.kind == decl::PatternKind::kBind ? param.name : "";
      if (&clause == &function.clauses.front()) {
        name = candidate;
      } else if (candidate != name) {
        name.clear();
      }
    }
    std::string chosen = name.empty() ? fmt::format("arg{}", i)
                                      : CppIdentifier(name);
    if (chosen == module_->spec.state_name || chosen == "state") {
      chosen += "_";
    }
    names.push_back(chosen);
  }
  return names;
}

void Codegen::EmitClient() {
  const auto& spec = module_->spec;
  std::string class_name = CppIdentifier(spec.module_name);

  Line(fmt::format("class {} {{", class_name));
  Line(" public:");
  ++indent_;
  Line("using Runtime = servant::runtime::ServiceRuntime<Value>;");
  Blank();
  Line(
      fmt::format(
          "static constexpr servant::ServiceMode kMode = "
          "servant::ServiceMode::{};",
          ModeEnumerator(spec.mode)));
  Blank();
  Line("static auto InitialState() -> Value {");
  ++indent_;
  Line(fmt::format("return {};", RenderValue(spec.initial_state)));
  --indent_;
  Line("}");
  Blank();

  if (spec.mode != ServiceMode::kInline) {
    EmitOptions();

    Line(
        "static auto Run(servant::runtime::RuntimeOptions options = "
        "DefaultOptions())");
    Line("    -> std::shared_ptr<Runtime> {");
    ++indent_;
    Line("return Run(InitialState(), std::move(options));");
    --indent_;
    Line("}");
    Blank();
    Line(
        "static auto Run(Value initial_state, "
        "servant::runtime::RuntimeOptions options = DefaultOptions())");
    Line("    -> std::shared_ptr<Runtime> {");
    ++indent_;
    Line(
        "return servant::runtime::MakeRuntime<Value>(kMode, "
        "std::move(initial_state), std::move(options));");
    --indent_;
    Line("}");
    Blank();
  }

  if (spec.mode == ServiceMode::kNamed) {
    Line("static auto Service() -> std::shared_ptr<Runtime> {");
    ++indent_;
    Line(
        fmt::format(
            "return servant::runtime::Registry::Instance().Lookup<Value>({});",
            QuoteString(*spec.service_name)));
    --indent_;
    Line("}");
    Blank();
    Line("static auto GetState() -> Value {");
    ++indent_;
    Line("return Service()->GetState();");
    --indent_;
    Line("}");
    Blank();
  }

  for (const auto& function : module_->functions) {
    if (function.IsPublic()) {
      EmitClientMethod(function);
    }
  }

  --indent_;
  Line("};");
  Blank();
}

void Codegen::EmitOptions() {
  const auto& spec = module_->spec;
  Line("static auto DefaultOptions() -> servant::runtime::RuntimeOptions {");
  ++indent_;
  Line("servant::runtime::RuntimeOptions options;");
  Line(fmt::format("options.label = {};", QuoteString(spec.module_name)));
  if (spec.service_name) {
    Line(
        fmt::format(
            "options.service_name = std::string({});",
            QuoteString(*spec.service_name)));
  }
  if (spec.pool) {
    Line(
        fmt::format(
            "options.pool = {{.min = {}, .max = {}}};", spec.pool->min,
            spec.pool->max));
    if (spec.pool->checkout_timeout) {
      Line(
          fmt::format(
              "options.checkout_timeout = std::chrono::milliseconds({});",
              spec.pool->checkout_timeout->count()));
    }
    if (spec.pool->idle_grace) {
      Line(
          fmt::format(
              "options.idle_grace = std::chrono::milliseconds({});",
              spec.pool->idle_grace->count()));
    }
  }
  if (spec.call_timeout) {
    Line(
        fmt::format(
            "options.call_timeout = std::chrono::milliseconds({});",
            spec.call_timeout->count()));
  }
  if (spec.restart.max_restarts) {
    Line(
        fmt::format(
            "options.restart.max_restarts = {};", *spec.restart.max_restarts));
  }
  if (spec.restart.window) {
    Line(
        fmt::format(
            "options.restart.window = std::chrono::milliseconds({});",
            spec.restart.window->count()));
  }
  Line("return options;");
  --indent_;
  Line("}");
  Blank();
}

void Codegen::EmitClientMethod(const impl::Function& function) {
  const auto& spec = module_->spec;
  std::string name = CppIdentifier(function.name);
  auto params = ClientParams(function);

  std::vector<std::string> declared;
  std::vector<std::string> forwarded = {"state"};
  for (const auto& param : params) {
    declared.push_back(fmt::format("const Value& {}", param));
    forwarded.push_back(param);
  }
  std::string impl_call =
      fmt::format("impl::{}({})", name, Join(forwarded, ", "));

  switch (spec.mode) {
    case ServiceMode::kInline: {
      std::string state = CppIdentifier(spec.state_name);
      declared.insert(declared.begin(), fmt::format("Value& {}", state));
      forwarded.front() = state;
      Line(
          fmt::format(
              "static auto {}({}) -> Value {{", name, Join(declared, ", ")));
      ++indent_;
      Line(
          fmt::format(
              "return servant::runtime::Commit<Value, Value>("
              "impl::{}({}), {});",
              name, Join(forwarded, ", "), state));
      --indent_;
      Line("}");
      break;
    }
    case ServiceMode::kNamed:
      Line(
          fmt::format(
              "static auto {}({}) -> Value {{", name, Join(declared, ", ")));
      ++indent_;
      Line("return Service()->Call<Value>(");
      Line(
          fmt::format(
              "    [=](const Value& state) {{ return {}; }});", impl_call));
      --indent_;
      Line("}");
      break;
    case ServiceMode::kAnonymous:
    case ServiceMode::kPooled:
      declared.insert(declared.begin(), "Runtime& service");
      Line(
          fmt::format(
              "static auto {}({}) -> Value {{", name, Join(declared, ", ")));
      ++indent_;
      Line("return service.Call<Value>(");
      Line(
          fmt::format(
              "    [=](const Value& state) {{ return {}; }});", impl_call));
      --indent_;
      Line("}");
      break;
  }
  Blank();
}

void Codegen::EmitEpilogue() {
  Line(
      fmt::format(
          "}}  // namespace servant::generated::{}",
          SnakeCase(module_->spec.module_name)));
}

}  // namespace servant::codegen
