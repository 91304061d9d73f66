#include "servant/lowering/impl_generator.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/decl/expression.hpp"
#include "servant/decl/operator.hpp"
#include "servant/lowering/response_translator.hpp"

namespace servant::lowering {

namespace {

auto FindFunction(
    std::vector<impl::Function>& functions, const std::string& name,
    uint32_t arity) -> impl::Function* {
  auto it = std::ranges::find_if(functions, [&](const impl::Function& f) {
    return f.name == name && f.arity == arity;
  });
  return it == functions.end() ? nullptr : &*it;
}

class NameResolver {
 public:
  NameResolver(
      decl::Arena& arena, const std::vector<impl::Function>& functions,
      const decl::ServiceSpec& spec, DiagnosticSink& sink)
      : arena_(arena), functions_(functions), spec_(spec), sink_(sink) {
  }

  void ResolveClause(decl::FunctionClause& clause) {
    scope_.clear();
    in_public_ = clause.visibility == decl::Visibility::kPublic;
    for (const auto& param : clause.params) {
      if (param.kind == decl::PatternKind::kBind) {
        scope_.push_back(param.name);
      }
    }
    if (clause.guard) {
      Resolve(*clause.guard);
    }
    Resolve(clause.body);
  }

 private:
  [[nodiscard]] auto InScope(const std::string& name) const -> bool {
    return std::ranges::find(scope_, name) != scope_.end();
  }

  void Resolve(decl::ExpressionId id) {
    decl::Expression& expr = arena_[id];
    SourceSpan span = expr.span;

    switch (expr.kind) {
      case decl::ExpressionKind::kLiteral:
        return;

      case decl::ExpressionKind::kMapLiteral: {
        auto entries = std::get<decl::MapLiteralExpressionData>(expr.data).entries;
        std::vector<Value> seen;
        for (const auto& [key, value] : entries) {
          const decl::Expression& key_expr = arena_[key];
          if (key_expr.kind == decl::ExpressionKind::kLiteral) {
            const auto& literal =
                std::get<decl::LiteralExpressionData>(key_expr.data).value;
            if (std::ranges::find(seen, literal) != seen.end()) {
              sink_.Error(
                  key_expr.span,
                  fmt::format("duplicate map key {}", ToString(literal)));
            }
            seen.push_back(literal);
          }
          Resolve(key);
          Resolve(value);
        }
        return;
      }

      case decl::ExpressionKind::kNameRef: {
        const auto& name = std::get<decl::NameRefExpressionData>(expr.data).name;
        if (InScope(name)) {
          return;
        }
        if (!in_public_ && name == spec_.state_name) {
          sink_.Report(
              Diagnostic::Error(span, fmt::format("unknown name '{}'", name))
                  .WithNote(
                      "the state is only bound in public functions; pass it "
                      "to the helper as an argument"));
          return;
        }
        sink_.Error(span, fmt::format("unknown name '{}'", name));
        return;
      }

      case decl::ExpressionKind::kUnaryOp:
        Resolve(std::get<decl::UnaryExpressionData>(expr.data).operand);
        return;

      case decl::ExpressionKind::kBinaryOp: {
        auto data = std::get<decl::BinaryExpressionData>(expr.data);
        Resolve(data.lhs);
        Resolve(data.rhs);
        return;
      }

      case decl::ExpressionKind::kIndex: {
        auto data = std::get<decl::IndexExpressionData>(expr.data);
        Resolve(data.base);
        Resolve(data.key);
        return;
      }

      case decl::ExpressionKind::kCall: {
        auto& data = std::get<decl::CallExpressionData>(expr.data);
        auto arguments = data.arguments;
        ResolveCallee(data, span);
        for (auto arg : arguments) {
          Resolve(arg);
        }
        return;
      }

      case decl::ExpressionKind::kIf: {
        auto data = std::get<decl::IfExpressionData>(expr.data);
        Resolve(data.condition);
        Resolve(data.then_expr);
        if (data.else_expr) {
          Resolve(*data.else_expr);
        }
        return;
      }

      case decl::ExpressionKind::kLet: {
        auto data = std::get<decl::LetExpressionData>(expr.data);
        Resolve(data.value);
        scope_.push_back(data.name);
        Resolve(data.body);
        scope_.pop_back();
        return;
      }

      case decl::ExpressionKind::kSetState: {
        // Only reachable when the translator already reported it.
        auto data = std::get<decl::SetStateExpressionData>(expr.data);
        Resolve(data.new_state);
        if (data.result) {
          Resolve(*data.result);
        }
        return;
      }

      case decl::ExpressionKind::kReply: {
        auto data = std::get<decl::ReplyExpressionData>(expr.data);
        if (data.value) {
          Resolve(*data.value);
        }
        if (data.new_state) {
          Resolve(*data.new_state);
        }
        return;
      }
    }
  }

  void ResolveCallee(decl::CallExpressionData& call, SourceSpan span) {
    auto arity = static_cast<uint32_t>(call.arguments.size());

    bool name_is_public = false;
    bool name_is_private = false;
    for (const auto& function : functions_) {
      if (function.name != call.callee) {
        continue;
      }
      if (function.IsPublic()) {
        name_is_public = true;
        continue;
      }
      name_is_private = true;
      if (function.arity == arity) {
        call.callee_kind = decl::CalleeKind::kHelper;
        return;
      }
    }

    if (name_is_private) {
      sink_.Error(
          span, fmt::format(
                    "no helper '{}' takes {} argument(s)", call.callee, arity));
      return;
    }
    // Builtins win over a public function of the same name.
    if (const auto* builtin = decl::FindBuiltin(call.callee)) {
      if (builtin->arity != arity) {
        sink_.Error(
            span, fmt::format(
                      "builtin '{}' takes {} argument(s), got {}", call.callee,
                      builtin->arity, arity));
        return;
      }
      call.callee_kind = decl::CalleeKind::kBuiltin;
      call.builtin = builtin->builtin;
      return;
    }
    if (name_is_public) {
      sink_.Report(
          Diagnostic::Error(
              span,
              fmt::format("cannot call public function '{}'", call.callee))
              .WithNote(
                  "public functions run inside the service; move the shared "
                  "logic into a defp helper"));
      return;
    }
    sink_.Error(span, fmt::format("unknown function '{}'", call.callee));
  }

  decl::Arena& arena_;
  const std::vector<impl::Function>& functions_;
  const decl::ServiceSpec& spec_;
  DiagnosticSink& sink_;
  std::vector<std::string> scope_;
  bool in_public_ = false;
};

void CheckParameters(
    const decl::FunctionClause& clause, const decl::ServiceSpec& spec,
    DiagnosticSink& sink) {
  std::vector<std::string> seen;
  bool is_public = clause.visibility == decl::Visibility::kPublic;
  for (size_t i = 0; i < clause.params.size(); ++i) {
    const auto& param = clause.params[i];
    if (param.kind != decl::PatternKind::kBind) {
      continue;
    }
    if (is_public && i > 0 && param.name == spec.state_name) {
      sink.Report(
          Diagnostic::Error(
              param.span,
              fmt::format(
                  "parameter '{}' shadows the state name", param.name))
              .WithNote(
                  fmt::format(
                      "'{}' is bound to the service state in every public "
                      "function",
                      spec.state_name)));
      continue;
    }
    if (std::ranges::find(seen, param.name) != seen.end()) {
      sink.Error(
          param.span, fmt::format("duplicate parameter '{}'", param.name));
      continue;
    }
    seen.push_back(param.name);
  }
}

}  // namespace

auto GenerateImplementation(decl::Declaration declaration, DiagnosticSink& sink)
    -> impl::Module {
  impl::Module module{
      .spec = std::move(declaration.spec),
      .functions = {},
      .arena = std::move(declaration.arena),
      .file = declaration.file,
  };

  for (auto& clause : declaration.clauses) {
    CheckParameters(clause, module.spec, sink);
    if (clause.visibility == decl::Visibility::kPrivate &&
        decl::FindBuiltin(clause.name) != nullptr) {
      sink.Error(
          clause.span,
          fmt::format("helper '{}' has the name of a builtin", clause.name));
      continue;
    }
    bool conflicting = std::ranges::any_of(
        module.functions, [&](const impl::Function& f) {
          return f.name == clause.name && f.visibility != clause.visibility;
        });
    if (conflicting) {
      sink.Error(
          clause.span,
          fmt::format(
              "'{}' is declared both def and defp", clause.name));
      continue;
    }

    TranslateResponse(module.arena, clause, sink);

    auto arity = static_cast<uint32_t>(clause.params.size());
    impl::Function* function = FindFunction(module.functions, clause.name, arity);
    if (function == nullptr) {
      module.functions.push_back(
          impl::Function{
              .name = clause.name,
              .visibility = clause.visibility,
              .arity = arity,
              .clauses = {},
          });
      function = &module.functions.back();
    }
    function->clauses.push_back(std::move(clause));
  }

  NameResolver resolver(module.arena, module.functions, module.spec, sink);
  for (auto& function : module.functions) {
    for (auto& clause : function.clauses) {
      resolver.ResolveClause(clause);
    }
  }

  bool has_public = std::ranges::any_of(
      module.functions, [](const impl::Function& f) { return f.IsPublic(); });
  if (!has_public) {
    sink.Warning(
        module.spec.span,
        fmt::format(
            "service '{}' declares no public functions",
            module.spec.module_name));
  }

  spdlog::debug(
      "generated implementation for '{}': {} function(s)",
      module.spec.module_name, module.functions.size());
  return module;
}

auto LowerDeclaration(decl::Declaration declaration) -> Result<impl::Module> {
  DiagnosticSink sink;
  auto module = GenerateImplementation(std::move(declaration), sink);
  if (const Diagnostic* error = sink.FirstError()) {
    return std::unexpected(*error);
  }
  return module;
}

}  // namespace servant::lowering
