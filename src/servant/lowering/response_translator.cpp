#include "servant/lowering/response_translator.hpp"

#include <optional>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "servant/common/overloaded.hpp"
#include "servant/decl/expression.hpp"

namespace servant::lowering {

namespace {

class ResponseTranslator {
 public:
  ResponseTranslator(decl::Arena& arena, DiagnosticSink& sink)
      : arena_(arena), sink_(sink) {
  }

  // Returns the id of the translated tail expression.
  auto TranslateTail(decl::ExpressionId id) -> decl::ExpressionId {
    // Copy out: AddExpression may reallocate the arena.
    decl::Expression expr = arena_[id];

    switch (expr.kind) {
      case decl::ExpressionKind::kLet: {
        auto data = std::get<decl::LetExpressionData>(expr.data);
        CheckNoSetState(data.value, "a let value");
        data.body = TranslateTail(data.body);
        arena_[id].data = data;
        return id;
      }

      case decl::ExpressionKind::kIf: {
        auto data = std::get<decl::IfExpressionData>(expr.data);
        CheckNoSetState(data.condition, "an if condition");
        data.then_expr = TranslateTail(data.then_expr);
        if (data.else_expr) {
          data.else_expr = TranslateTail(*data.else_expr);
        } else {
          auto nil = arena_.AddExpression(
              decl::Expression{
                  .kind = decl::ExpressionKind::kLiteral,
                  .span = expr.span,
                  .data = decl::LiteralExpressionData{.value = Value::Nil()},
              });
          data.else_expr = MakePlainReply(nil, expr.span);
        }
        arena_[id].data = data;
        return id;
      }

      case decl::ExpressionKind::kSetState: {
        const auto& data = std::get<decl::SetStateExpressionData>(expr.data);
        CheckNoSetState(data.new_state, "a set_state argument");
        if (data.result) {
          CheckNoSetState(*data.result, "a set_state result");
        }
        return arena_.AddExpression(
            decl::Expression{
                .kind = decl::ExpressionKind::kReply,
                .span = expr.span,
                .data =
                    decl::ReplyExpressionData{
                        .kind = decl::ReplyKind::kWithState,
                        .value = data.result,
                        .new_state = data.new_state,
                    },
            });
      }

      case decl::ExpressionKind::kReply:
        return id;

      default:
        CheckNoSetState(id, "an operand");
        return MakePlainReply(id, expr.span);
    }
  }

  // Reports every set_state reachable from `id`. Stops descending at the
  // first one found on each path.
  void CheckNoSetState(decl::ExpressionId id, std::string_view where) {
    const decl::Expression& expr = arena_[id];
    if (expr.kind == decl::ExpressionKind::kSetState) {
      sink_.Report(
          Diagnostic::Error(
              expr.span, fmt::format("set_state is not allowed in {}", where))
              .WithNote(
                  "set_state may only appear in tail position of a public "
                  "function"));
      return;
    }
    std::visit(
        Overloaded{
            [](const decl::LiteralExpressionData&) {},
            [](const decl::NameRefExpressionData&) {},
            [&](const decl::MapLiteralExpressionData& data) {
              for (const auto& [key, value] : data.entries) {
                CheckNoSetState(key, where);
                CheckNoSetState(value, where);
              }
            },
            [&](const decl::UnaryExpressionData& data) {
              CheckNoSetState(data.operand, where);
            },
            [&](const decl::BinaryExpressionData& data) {
              CheckNoSetState(data.lhs, where);
              CheckNoSetState(data.rhs, where);
            },
            [&](const decl::IndexExpressionData& data) {
              CheckNoSetState(data.base, where);
              CheckNoSetState(data.key, where);
            },
            [&](const decl::CallExpressionData& data) {
              for (auto arg : data.arguments) {
                CheckNoSetState(arg, where);
              }
            },
            [&](const decl::IfExpressionData& data) {
              CheckNoSetState(data.condition, where);
              CheckNoSetState(data.then_expr, where);
              if (data.else_expr) {
                CheckNoSetState(*data.else_expr, where);
              }
            },
            [&](const decl::LetExpressionData& data) {
              CheckNoSetState(data.value, where);
              CheckNoSetState(data.body, where);
            },
            [](const decl::SetStateExpressionData&) {},
            [](const decl::ReplyExpressionData&) {},
        },
        expr.data);
  }

 private:
  auto MakePlainReply(decl::ExpressionId value, SourceSpan span)
      -> decl::ExpressionId {
    return arena_.AddExpression(
        decl::Expression{
            .kind = decl::ExpressionKind::kReply,
            .span = span,
            .data =
                decl::ReplyExpressionData{
                    .kind = decl::ReplyKind::kPlain,
                    .value = value,
                    .new_state = std::nullopt,
                },
        });
  }

  decl::Arena& arena_;
  DiagnosticSink& sink_;
};

}  // namespace

void TranslateResponse(
    decl::Arena& arena, decl::FunctionClause& clause, DiagnosticSink& sink) {
  ResponseTranslator translator(arena, sink);
  if (clause.guard) {
    translator.CheckNoSetState(*clause.guard, "a guard");
  }
  if (clause.visibility == decl::Visibility::kPrivate) {
    translator.CheckNoSetState(
        clause.body, fmt::format("private function '{}'", clause.name));
    return;
  }
  clause.body = translator.TranslateTail(clause.body);
}

}  // namespace servant::lowering
