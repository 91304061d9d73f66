#include "servant/decl/dumper.hpp"

#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "servant/common/internal_error.hpp"
#include "servant/decl/expression.hpp"

namespace servant::decl {

Dumper::Dumper(const Arena* arena, std::ostream* out)
    : arena_(arena), out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  if (indent_ == 0) {
    throw common::InternalError("Dumper::Dedent", "indent underflow");
  }
  --indent_;
}

void Dumper::Dump(const Declaration& declaration) {
  Dump(declaration.spec);
  for (const auto& clause : declaration.clauses) {
    Dump(clause);
  }
}

void Dumper::Dump(const ServiceSpec& spec) {
  *out_ << fmt::format("service {} {{\n", spec.module_name);
  Indent();
  PrintIndent();
  *out_ << fmt::format("mode: {}\n", ToString(spec.mode));
  PrintIndent();
  *out_ << fmt::format("state: {}\n", ToString(spec.initial_state));
  PrintIndent();
  *out_ << fmt::format("state_name: {}\n", spec.state_name);
  if (spec.service_name) {
    PrintIndent();
    *out_ << fmt::format("service_name: {}\n", *spec.service_name);
  }
  if (spec.pool) {
    PrintIndent();
    *out_ << fmt::format("pool: {{min: {}, max: {}", spec.pool->min, spec.pool->max);
    if (spec.pool->checkout_timeout) {
      *out_ << fmt::format(
          ", checkout_timeout: {}", spec.pool->checkout_timeout->count());
    }
    if (spec.pool->idle_grace) {
      *out_ << fmt::format(", idle_grace: {}", spec.pool->idle_grace->count());
    }
    *out_ << "}\n";
  }
  if (spec.diagnostics) {
    PrintIndent();
    *out_ << "diagnostics: true\n";
  }
  if (spec.call_timeout) {
    PrintIndent();
    *out_ << fmt::format("call_timeout: {}\n", spec.call_timeout->count());
  }
  if (spec.restart.max_restarts || spec.restart.window) {
    PrintIndent();
    *out_ << "restart: {";
    std::string_view sep;
    if (spec.restart.max_restarts) {
      *out_ << fmt::format("max_restarts: {}", *spec.restart.max_restarts);
      sep = ", ";
    }
    if (spec.restart.window) {
      *out_ << fmt::format("{}window: {}", sep, spec.restart.window->count());
    }
    *out_ << "}\n";
  }
  Dedent();
  *out_ << "}\n";
}

void Dumper::Dump(const FunctionClause& clause) {
  std::string params;
  for (const auto& param : clause.params) {
    if (!params.empty()) {
      params += ", ";
    }
    params += RenderPattern(param);
  }
  PrintIndent();
  *out_ << fmt::format(
      "{} {}({})",
      clause.visibility == Visibility::kPublic ? "def" : "defp", clause.name,
      params);
  if (clause.guard) {
    *out_ << fmt::format(" when {}", Render(*clause.guard));
  }
  *out_ << "\n";
  Indent();
  Dump(clause.body);
  Dedent();
}

void Dumper::Dump(ExpressionId id) {
  const Expression& expr = (*arena_)[id];
  PrintIndent();

  switch (expr.kind) {
    case ExpressionKind::kLet: {
      const auto& data = std::get<LetExpressionData>(expr.data);
      *out_ << fmt::format("let {} = {}\n", data.name, Render(data.value));
      Dump(data.body);
      return;
    }
    case ExpressionKind::kIf: {
      const auto& data = std::get<IfExpressionData>(expr.data);
      *out_ << fmt::format("if {}\n", Render(data.condition));
      Indent();
      Dump(data.then_expr);
      Dedent();
      if (data.else_expr) {
        PrintIndent();
        *out_ << "else\n";
        Indent();
        Dump(*data.else_expr);
        Dedent();
      }
      return;
    }
    case ExpressionKind::kSetState: {
      const auto& data = std::get<SetStateExpressionData>(expr.data);
      *out_ << fmt::format("set_state {}\n", Render(data.new_state));
      if (data.result) {
        Indent();
        Dump(*data.result);
        Dedent();
      }
      return;
    }
    case ExpressionKind::kReply: {
      const auto& data = std::get<ReplyExpressionData>(expr.data);
      if (data.kind == ReplyKind::kPlain) {
        *out_ << fmt::format("reply {}\n", Render(*data.value));
      } else {
        *out_ << fmt::format(
            "reply {} with_state {}\n",
            data.value ? Render(*data.value) : std::string("<new state>"),
            Render(*data.new_state));
      }
      return;
    }
    default:
      *out_ << Render(id) << "\n";
      return;
  }
}

auto Dumper::RenderPattern(const Pattern& pattern) const -> std::string {
  switch (pattern.kind) {
    case PatternKind::kBind:
      return pattern.name;
    case PatternKind::kWildcard:
      return "_";
    case PatternKind::kLiteral:
      return ToString(pattern.literal);
  }
  return "?";
}

auto Dumper::Render(ExpressionId id) const -> std::string {
  const Expression& expr = (*arena_)[id];

  switch (expr.kind) {
    case ExpressionKind::kLiteral:
      return ToString(std::get<LiteralExpressionData>(expr.data).value);

    case ExpressionKind::kMapLiteral: {
      const auto& data = std::get<MapLiteralExpressionData>(expr.data);
      std::string text = "{";
      for (size_t i = 0; i < data.entries.size(); ++i) {
        if (i > 0) {
          text += ", ";
        }
        text += fmt::format(
            "{}: {}", Render(data.entries[i].first),
            Render(data.entries[i].second));
      }
      return text + "}";
    }

    case ExpressionKind::kNameRef:
      return std::get<NameRefExpressionData>(expr.data).name;

    case ExpressionKind::kUnaryOp: {
      const auto& data = std::get<UnaryExpressionData>(expr.data);
      return fmt::format("{}{}", ToString(data.op), Render(data.operand));
    }

    case ExpressionKind::kBinaryOp: {
      const auto& data = std::get<BinaryExpressionData>(expr.data);
      return fmt::format(
          "({} {} {})", Render(data.lhs), ToString(data.op), Render(data.rhs));
    }

    case ExpressionKind::kIndex: {
      const auto& data = std::get<IndexExpressionData>(expr.data);
      return fmt::format("{}[{}]", Render(data.base), Render(data.key));
    }

    case ExpressionKind::kCall: {
      const auto& data = std::get<CallExpressionData>(expr.data);
      std::string args;
      for (ExpressionId arg : data.arguments) {
        if (!args.empty()) {
          args += ", ";
        }
        args += Render(arg);
      }
      return fmt::format("{}({})", data.callee, args);
    }

    case ExpressionKind::kIf: {
      const auto& data = std::get<IfExpressionData>(expr.data);
      std::string text = fmt::format(
          "if {} {{ {} }}", Render(data.condition), Render(data.then_expr));
      if (data.else_expr) {
        text += fmt::format(" else {{ {} }}", Render(*data.else_expr));
      }
      return text;
    }

    case ExpressionKind::kLet: {
      const auto& data = std::get<LetExpressionData>(expr.data);
      return fmt::format(
          "let {} = {}; {}", data.name, Render(data.value), Render(data.body));
    }

    case ExpressionKind::kSetState: {
      const auto& data = std::get<SetStateExpressionData>(expr.data);
      if (data.result) {
        return fmt::format(
            "set_state({}) {{ {} }}", Render(data.new_state),
            Render(*data.result));
      }
      return fmt::format("set_state({})", Render(data.new_state));
    }

    case ExpressionKind::kReply: {
      const auto& data = std::get<ReplyExpressionData>(expr.data);
      if (data.kind == ReplyKind::kPlain) {
        return fmt::format("reply({})", Render(*data.value));
      }
      if (data.value) {
        return fmt::format(
            "reply_with_state({}, {})", Render(*data.value),
            Render(*data.new_state));
      }
      return fmt::format("reply_with_state({})", Render(*data.new_state));
    }
  }
  throw common::InternalError("Dumper::Render", "unknown expression kind");
}

}  // namespace servant::decl
