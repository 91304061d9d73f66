#include "servant/lowering/response_translator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "servant/common/diagnostic/diagnostic_sink.hpp"
#include "servant/common/source_manager.hpp"
#include "servant/decl/expression.hpp"
#include "servant/frontend/parser.hpp"

namespace servant::lowering {
namespace {

auto ParseOrDie(SourceManager& sources, const std::string& text)
    -> decl::Declaration {
  FileId file = sources.AddFile("test.svc", text);
  auto result =
      frontend::ParseDeclaration(file, sources.GetFile(file)->content);
  if (!result) {
    ADD_FAILURE() << result.error().primary.message;
    return {};
  }
  return std::move(*result);
}

auto ReplyOf(const decl::Arena& arena, decl::ExpressionId id)
    -> const decl::ReplyExpressionData& {
  const auto& expr = arena[id];
  EXPECT_EQ(expr.kind, decl::ExpressionKind::kReply);
  return std::get<decl::ReplyExpressionData>(expr.data);
}

TEST(ResponseTranslatorTest, PlainExpressionBecomesPlainReply) {
  SourceManager sources;
  auto declaration = ParseOrDie(sources, "service S {}\ndef f(x) { x + 1 }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  EXPECT_FALSE(sink.HasErrors());
  const auto& reply = ReplyOf(declaration.arena, declaration.clauses[0].body);
  EXPECT_EQ(reply.kind, decl::ReplyKind::kPlain);
  ASSERT_TRUE(reply.value.has_value());
  EXPECT_EQ(declaration.arena[*reply.value].kind, decl::ExpressionKind::kBinaryOp);
}

TEST(ResponseTranslatorTest, SetStateBecomesStateReply) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources, "service S {}\ndef f(x) { set_state(x) { state } }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  EXPECT_FALSE(sink.HasErrors());
  const auto& reply = ReplyOf(declaration.arena, declaration.clauses[0].body);
  EXPECT_EQ(reply.kind, decl::ReplyKind::kWithState);
  EXPECT_TRUE(reply.value.has_value());
  EXPECT_TRUE(reply.new_state.has_value());
}

TEST(ResponseTranslatorTest, EveryTailBranchIsTranslated) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources,
      "service S {}\n"
      "def f(x) { let y = x * 2; if y > 4 { set_state(y) } else { y } }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);
  ASSERT_FALSE(sink.HasErrors());

  const auto& arena = declaration.arena;
  const auto& let = arena[declaration.clauses[0].body];
  ASSERT_EQ(let.kind, decl::ExpressionKind::kLet);
  const auto& branch =
      arena[std::get<decl::LetExpressionData>(let.data).body];
  ASSERT_EQ(branch.kind, decl::ExpressionKind::kIf);
  const auto& data = std::get<decl::IfExpressionData>(branch.data);
  EXPECT_EQ(ReplyOf(arena, data.then_expr).kind, decl::ReplyKind::kWithState);
  ASSERT_TRUE(data.else_expr.has_value());
  EXPECT_EQ(ReplyOf(arena, *data.else_expr).kind, decl::ReplyKind::kPlain);
}

TEST(ResponseTranslatorTest, MissingElseRepliesNil) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources, "service S {}\ndef f(x) { if x { set_state(x) } }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);
  ASSERT_FALSE(sink.HasErrors());

  const auto& branch = declaration.arena[declaration.clauses[0].body];
  const auto& data = std::get<decl::IfExpressionData>(branch.data);
  ASSERT_TRUE(data.else_expr.has_value());
  const auto& reply = ReplyOf(declaration.arena, *data.else_expr);
  EXPECT_EQ(reply.kind, decl::ReplyKind::kPlain);
  const auto& literal = declaration.arena[*reply.value];
  EXPECT_TRUE(
      std::get<decl::LiteralExpressionData>(literal.data).value.IsNil());
}

TEST(ResponseTranslatorTest, RejectsSetStateInOperand) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources, "service S {}\ndef f(x) { 1 + set_state(x) }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  ASSERT_TRUE(sink.HasErrors());
  EXPECT_EQ(
      sink.GetDiagnostics()[0].primary.message,
      "set_state is not allowed in an operand");
}

TEST(ResponseTranslatorTest, RejectsSetStateInCondition) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources, "service S {}\ndef f(x) { if set_state(x) { 1 } else { 2 } }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  ASSERT_TRUE(sink.HasErrors());
  EXPECT_EQ(
      sink.GetDiagnostics()[0].primary.message,
      "set_state is not allowed in an if condition");
}

TEST(ResponseTranslatorTest, RejectsSetStateInHelper) {
  SourceManager sources;
  auto declaration = ParseOrDie(
      sources, "service S {}\ndefp bump(x) { set_state(x) }\n");
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  ASSERT_TRUE(sink.HasErrors());
  const auto& diag = sink.GetDiagnostics()[0];
  EXPECT_EQ(
      diag.primary.message,
      "set_state is not allowed in private function 'bump'");
  ASSERT_EQ(diag.notes.size(), 1U);
}

TEST(ResponseTranslatorTest, HelperBodiesStayAsWritten) {
  SourceManager sources;
  auto declaration = ParseOrDie(sources, "service S {}\ndefp twice(x) { x * 2 }\n");
  auto body = declaration.clauses[0].body;
  DiagnosticSink sink;
  TranslateResponse(declaration.arena, declaration.clauses[0], sink);

  EXPECT_FALSE(sink.HasErrors());
  EXPECT_EQ(declaration.clauses[0].body, body);
  EXPECT_EQ(declaration.arena[body].kind, decl::ExpressionKind::kBinaryOp);
}

}  // namespace
}  // namespace servant::lowering
