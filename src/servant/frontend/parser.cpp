#include "servant/frontend/parser.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/decl/expression.hpp"
#include "servant/frontend/lexer.hpp"

namespace servant::frontend {

namespace {

constexpr std::string_view kKnownOptions =
    "mode, state, state_name, service_name, pool, diagnostics, "
    "call_timeout, restart";

}  // namespace

auto Parser::ParseDeclaration() -> decl::Declaration {
  decl::Declaration declaration;
  declaration.file = file_;
  ParseServiceHeader(declaration.spec);

  if (auto checked = CheckServiceSpec(declaration.spec); !checked) {
    throw DiagnosticException(std::move(checked.error()));
  }

  while (!Check(TokenKind::kEndOfFile)) {
    declaration.clauses.push_back(ParseClause(declaration.spec));
  }
  declaration.arena = std::move(arena_);
  return declaration;
}

auto Parser::ParseCallLiteral() -> std::pair<std::string, std::vector<Value>> {
  const Token& name = Expect(TokenKind::kIdentifier, "function name");
  std::pair<std::string, std::vector<Value>> call{name.text, {}};
  Expect(TokenKind::kLeftParen, "after function name");
  if (!Check(TokenKind::kRightParen)) {
    do {
      call.second.push_back(ParseConstant());
    } while (Match(TokenKind::kComma));
  }
  Expect(TokenKind::kRightParen, "to close argument list");
  Expect(TokenKind::kEndOfFile, "after call");
  return call;
}

void Parser::ParseServiceHeader(decl::ServiceSpec& spec) {
  const Token& keyword =
      Expect(TokenKind::kService, "at start of declaration");
  const Token& name = Expect(TokenKind::kIdentifier, "for service name");
  spec.module_name = name.text;
  spec.span = Join(keyword.span, name.span);

  Expect(TokenKind::kLeftBrace, "to open service options");
  std::vector<std::string> seen;
  while (!Check(TokenKind::kRightBrace)) {
    ParseOption(spec, seen);
    Match(TokenKind::kComma);
  }
  Expect(TokenKind::kRightBrace, "to close service options");
}

void Parser::ParseOption(
    decl::ServiceSpec& spec, std::vector<std::string>& seen) {
  const Token& key = Expect(TokenKind::kIdentifier, "for option name");
  std::string name = key.text;
  SourceSpan key_span = key.span;
  if (std::ranges::find(seen, name) != seen.end()) {
    Fail(key_span, fmt::format("duplicate option '{}'", name));
  }
  seen.push_back(name);
  Expect(TokenKind::kColon, "after option name");

  if (name == "mode") {
    const Token& value = Expect(TokenKind::kIdentifier, "for mode");
    auto mode = ParseServiceMode(value.text);
    if (!mode) {
      throw DiagnosticException(
          Diagnostic::Error(
              value.span, fmt::format("unknown mode '{}'", value.text))
              .WithNote("expected one of: inline, anonymous, named, pooled"));
    }
    spec.mode = *mode;
  } else if (name == "state") {
    spec.initial_state = ParseConstant();
  } else if (name == "state_name") {
    spec.state_name = Expect(TokenKind::kIdentifier, "for state_name").text;
  } else if (name == "service_name") {
    if (Check(TokenKind::kString)) {
      spec.service_name = Advance().text;
    } else {
      spec.service_name =
          Expect(TokenKind::kIdentifier, "for service_name").text;
    }
  } else if (name == "pool") {
    spec.pool = ParsePoolOption(key_span);
  } else if (name == "diagnostics") {
    if (Match(TokenKind::kTrue)) {
      spec.diagnostics = true;
    } else {
      Expect(TokenKind::kFalse, "for diagnostics (true or false)");
      spec.diagnostics = false;
    }
  } else if (name == "call_timeout") {
    spec.call_timeout = ParseDuration();
  } else if (name == "restart") {
    spec.restart = ParseRestartOption();
  } else {
    throw DiagnosticException(
        Diagnostic::Error(key_span, fmt::format("unknown option '{}'", name))
            .WithNote(fmt::format("known options: {}", kKnownOptions)));
  }
}

auto Parser::ParsePoolOption(SourceSpan span) -> decl::PoolSpec {
  decl::PoolSpec pool;
  pool.span = span;
  bool has_min = false;
  bool has_max = false;
  Expect(TokenKind::kLeftBrace, "to open pool options");
  while (!Check(TokenKind::kRightBrace)) {
    const Token& key = Expect(TokenKind::kIdentifier, "for pool option");
    std::string name = key.text;
    SourceSpan key_span = key.span;
    Expect(TokenKind::kColon, "after pool option name");
    if (name == "min") {
      pool.min = ParseCount();
      has_min = true;
    } else if (name == "max") {
      pool.max = ParseCount();
      has_max = true;
    } else if (name == "checkout_timeout") {
      pool.checkout_timeout = ParseDuration();
    } else if (name == "idle_grace") {
      pool.idle_grace = ParseDuration();
    } else {
      throw DiagnosticException(
          Diagnostic::Error(
              key_span, fmt::format("unknown pool option '{}'", name))
              .WithNote("known pool options: min, max, checkout_timeout, "
                        "idle_grace"));
    }
    if (!Match(TokenKind::kComma)) {
      break;
    }
  }
  Expect(TokenKind::kRightBrace, "to close pool options");
  if (!has_min || !has_max) {
    Fail(span, "pool requires both 'min' and 'max'");
  }
  return pool;
}

auto Parser::ParseRestartOption() -> decl::RestartSpec {
  decl::RestartSpec restart;
  Expect(TokenKind::kLeftBrace, "to open restart options");
  while (!Check(TokenKind::kRightBrace)) {
    const Token& key = Expect(TokenKind::kIdentifier, "for restart option");
    std::string name = key.text;
    SourceSpan key_span = key.span;
    Expect(TokenKind::kColon, "after restart option name");
    if (name == "max_restarts") {
      restart.max_restarts = ParseCount();
    } else if (name == "window") {
      restart.window = ParseDuration();
    } else {
      throw DiagnosticException(
          Diagnostic::Error(
              key_span, fmt::format("unknown restart option '{}'", name))
              .WithNote("known restart options: max_restarts, window"));
    }
    if (!Match(TokenKind::kComma)) {
      break;
    }
  }
  Expect(TokenKind::kRightBrace, "to close restart options");
  return restart;
}

auto Parser::ParseClause(const decl::ServiceSpec& spec)
    -> decl::FunctionClause {
  decl::FunctionClause clause;
  const Token& keyword = Peek();
  SourceSpan start = keyword.span;
  if (Match(TokenKind::kDef)) {
    clause.visibility = decl::Visibility::kPublic;
  } else if (Match(TokenKind::kDefp)) {
    clause.visibility = decl::Visibility::kPrivate;
  } else {
    Fail(keyword.span, fmt::format(
                           "expected 'def' or 'defp', found {}",
                           ToString(keyword.kind)));
  }

  const Token& name = Expect(TokenKind::kIdentifier, "for function name");
  clause.name = name.text;

  if (clause.visibility == decl::Visibility::kPublic) {
    // The state parameter is implicit in the source; threading it
    // explicitly makes every public clause a function of the state.
    clause.params.push_back(
        decl::Pattern{
            .kind = decl::PatternKind::kBind,
            .name = spec.state_name,
            .literal = {},
            .span = name.span,
        });
  }

  Expect(TokenKind::kLeftParen, "after function name");
  if (!Check(TokenKind::kRightParen)) {
    do {
      clause.params.push_back(ParsePattern());
    } while (Match(TokenKind::kComma));
  }
  Expect(TokenKind::kRightParen, "to close parameter list");

  if (Match(TokenKind::kWhen)) {
    clause.guard = ParseExpression();
  }
  clause.body = ParseBlock();
  clause.span = Join(start, SpanOf(clause.body));
  return clause;
}

auto Parser::ParsePattern() -> decl::Pattern {
  const Token& token = Peek();
  if (token.kind == TokenKind::kIdentifier) {
    Advance();
    if (token.text == "_") {
      return decl::Pattern{
          .kind = decl::PatternKind::kWildcard,
          .name = {},
          .literal = {},
          .span = token.span};
    }
    return decl::Pattern{
        .kind = decl::PatternKind::kBind,
        .name = token.text,
        .literal = {},
        .span = token.span};
  }
  SourceSpan span = token.span;
  Value literal = ParseConstant();
  return decl::Pattern{
      .kind = decl::PatternKind::kLiteral,
      .name = {},
      .literal = std::move(literal),
      .span = Join(span, tokens_[pos_ - 1].span)};
}

auto Parser::ParseBlock() -> decl::ExpressionId {
  Expect(TokenKind::kLeftBrace, "to open block");
  auto body = ParseExpression();
  Expect(TokenKind::kRightBrace, "to close block");
  return body;
}

auto Parser::ParseExpression() -> decl::ExpressionId {
  if (Check(TokenKind::kLet)) {
    SourceSpan start = Advance().span;
    const Token& name = Expect(TokenKind::kIdentifier, "after 'let'");
    std::string binding = name.text;
    Expect(TokenKind::kAssign, "after let binding name");
    auto value = ParseExpression();
    Expect(TokenKind::kSemicolon, "after let value");
    auto body = ParseExpression();
    return Add(
        decl::ExpressionKind::kLet, Join(start, SpanOf(body)),
        decl::LetExpressionData{
            .name = std::move(binding), .value = value, .body = body});
  }
  return ParseOr();
}

auto Parser::ParseOr() -> decl::ExpressionId {
  auto lhs = ParseAnd();
  while (Match(TokenKind::kPipePipe)) {
    lhs = MakeBinary(decl::BinaryOp::kLogicalOr, lhs, ParseAnd());
  }
  return lhs;
}

auto Parser::ParseAnd() -> decl::ExpressionId {
  auto lhs = ParseComparison();
  while (Match(TokenKind::kAmpAmp)) {
    lhs = MakeBinary(decl::BinaryOp::kLogicalAnd, lhs, ParseComparison());
  }
  return lhs;
}

auto Parser::ParseComparison() -> decl::ExpressionId {
  auto lhs = ParseAdditive();
  std::optional<decl::BinaryOp> op;
  switch (Peek().kind) {
    case TokenKind::kEqual:
      op = decl::BinaryOp::kEqual;
      break;
    case TokenKind::kNotEqual:
      op = decl::BinaryOp::kNotEqual;
      break;
    case TokenKind::kLess:
      op = decl::BinaryOp::kLess;
      break;
    case TokenKind::kLessEqual:
      op = decl::BinaryOp::kLessEqual;
      break;
    case TokenKind::kGreater:
      op = decl::BinaryOp::kGreater;
      break;
    case TokenKind::kGreaterEqual:
      op = decl::BinaryOp::kGreaterEqual;
      break;
    default:
      return lhs;
  }
  Advance();
  return MakeBinary(*op, lhs, ParseAdditive());
}

auto Parser::ParseAdditive() -> decl::ExpressionId {
  auto lhs = ParseMultiplicative();
  while (true) {
    if (Match(TokenKind::kPlus)) {
      lhs = MakeBinary(decl::BinaryOp::kAdd, lhs, ParseMultiplicative());
    } else if (Match(TokenKind::kMinus)) {
      lhs = MakeBinary(decl::BinaryOp::kSub, lhs, ParseMultiplicative());
    } else {
      return lhs;
    }
  }
}

auto Parser::ParseMultiplicative() -> decl::ExpressionId {
  auto lhs = ParseUnary();
  while (true) {
    if (Match(TokenKind::kStar)) {
      lhs = MakeBinary(decl::BinaryOp::kMul, lhs, ParseUnary());
    } else if (Match(TokenKind::kSlash)) {
      lhs = MakeBinary(decl::BinaryOp::kDiv, lhs, ParseUnary());
    } else if (Match(TokenKind::kPercent)) {
      lhs = MakeBinary(decl::BinaryOp::kMod, lhs, ParseUnary());
    } else {
      return lhs;
    }
  }
}

auto Parser::ParseUnary() -> decl::ExpressionId {
  if (Check(TokenKind::kMinus) || Check(TokenKind::kBang)) {
    const Token& op_token = Advance();
    SourceSpan start = op_token.span;
    auto op = op_token.kind == TokenKind::kMinus ? decl::UnaryOp::kNegate
                                                 : decl::UnaryOp::kLogicalNot;
    auto operand = ParseUnary();
    return Add(
        decl::ExpressionKind::kUnaryOp, Join(start, SpanOf(operand)),
        decl::UnaryExpressionData{.op = op, .operand = operand});
  }
  return ParsePostfix();
}

auto Parser::ParsePostfix() -> decl::ExpressionId {
  auto base = ParsePrimary();
  while (Match(TokenKind::kLeftBracket)) {
    auto key = ParseExpression();
    const Token& close = Expect(TokenKind::kRightBracket, "to close index");
    base = Add(
        decl::ExpressionKind::kIndex, Join(SpanOf(base), close.span),
        decl::IndexExpressionData{.base = base, .key = key});
  }
  return base;
}

auto Parser::ParsePrimary() -> decl::ExpressionId {
  const Token& token = Peek();
  SourceSpan span = token.span;
  switch (token.kind) {
    case TokenKind::kInteger: {
      auto value = Value::Int(Advance().integer);
      return Add(
          decl::ExpressionKind::kLiteral, span,
          decl::LiteralExpressionData{.value = value});
    }
    case TokenKind::kString: {
      auto value = Value::String(Advance().text);
      return Add(
          decl::ExpressionKind::kLiteral, span,
          decl::LiteralExpressionData{.value = value});
    }
    case TokenKind::kNil:
      Advance();
      return Add(
          decl::ExpressionKind::kLiteral, span,
          decl::LiteralExpressionData{.value = Value::Nil()});
    case TokenKind::kTrue:
    case TokenKind::kFalse: {
      bool value = Advance().kind == TokenKind::kTrue;
      return Add(
          decl::ExpressionKind::kLiteral, span,
          decl::LiteralExpressionData{.value = Value::Bool(value)});
    }
    case TokenKind::kLeftBrace:
      return ParseMapLiteral();
    case TokenKind::kLeftParen: {
      Advance();
      auto inner = ParseExpression();
      Expect(TokenKind::kRightParen, "to close parenthesized expression");
      return inner;
    }
    case TokenKind::kIf:
      return ParseIf();
    case TokenKind::kSetState:
      return ParseSetState();
    case TokenKind::kIdentifier: {
      std::string name = Advance().text;
      if (!Match(TokenKind::kLeftParen)) {
        return Add(
            decl::ExpressionKind::kNameRef, span,
            decl::NameRefExpressionData{.name = std::move(name)});
      }
      std::vector<decl::ExpressionId> arguments;
      if (!Check(TokenKind::kRightParen)) {
        do {
          arguments.push_back(ParseExpression());
        } while (Match(TokenKind::kComma));
      }
      const Token& close =
          Expect(TokenKind::kRightParen, "to close argument list");
      return Add(
          decl::ExpressionKind::kCall, Join(span, close.span),
          decl::CallExpressionData{
              .callee = std::move(name),
              .arguments = std::move(arguments),
          });
    }
    default:
      Fail(span, fmt::format(
                     "expected expression, found {}", ToString(token.kind)));
  }
}

auto Parser::ParseIf() -> decl::ExpressionId {
  SourceSpan start = Expect(TokenKind::kIf, "").span;
  auto condition = ParseExpression();
  auto then_expr = ParseBlock();
  std::optional<decl::ExpressionId> else_expr;
  SourceSpan end = SpanOf(then_expr);
  if (Match(TokenKind::kElse)) {
    else_expr = Check(TokenKind::kIf) ? ParseIf() : ParseBlock();
    end = SpanOf(*else_expr);
  }
  return Add(
      decl::ExpressionKind::kIf, Join(start, end),
      decl::IfExpressionData{
          .condition = condition,
          .then_expr = then_expr,
          .else_expr = else_expr,
      });
}

auto Parser::ParseSetState() -> decl::ExpressionId {
  SourceSpan start = Expect(TokenKind::kSetState, "").span;
  Expect(TokenKind::kLeftParen, "after 'set_state'");
  auto new_state = ParseExpression();
  SourceSpan end = Expect(TokenKind::kRightParen, "to close set_state").span;
  std::optional<decl::ExpressionId> result;
  if (Check(TokenKind::kLeftBrace)) {
    result = ParseBlock();
    end = SpanOf(*result);
  }
  return Add(
      decl::ExpressionKind::kSetState, Join(start, end),
      decl::SetStateExpressionData{.new_state = new_state, .result = result});
}

auto Parser::ParseMapLiteral() -> decl::ExpressionId {
  SourceSpan start = Expect(TokenKind::kLeftBrace, "").span;
  decl::MapLiteralExpressionData data;
  while (!Check(TokenKind::kRightBrace)) {
    SourceSpan key_span = Peek().span;
    Value key = ParseMapKey();
    auto key_id = Add(
        decl::ExpressionKind::kLiteral, key_span,
        decl::LiteralExpressionData{.value = std::move(key)});
    Expect(TokenKind::kColon, "after map key");
    auto value_id = ParseExpression();
    data.entries.emplace_back(key_id, value_id);
    if (!Match(TokenKind::kComma)) {
      break;
    }
  }
  SourceSpan end = Expect(TokenKind::kRightBrace, "to close map literal").span;
  return Add(decl::ExpressionKind::kMapLiteral, Join(start, end), std::move(data));
}

auto Parser::ParseConstant() -> Value {
  const Token& token = Peek();
  switch (token.kind) {
    case TokenKind::kInteger:
      return Value::Int(Advance().integer);
    case TokenKind::kMinus: {
      Advance();
      const Token& number =
          Expect(TokenKind::kInteger, "after '-' in constant");
      return Value::Int(-number.integer);
    }
    case TokenKind::kString:
      return Value::String(Advance().text);
    case TokenKind::kNil:
      Advance();
      return Value::Nil();
    case TokenKind::kTrue:
      Advance();
      return Value::Bool(true);
    case TokenKind::kFalse:
      Advance();
      return Value::Bool(false);
    case TokenKind::kLeftBrace: {
      Advance();
      ValueMap entries;
      while (!Check(TokenKind::kRightBrace)) {
        Value key = ParseMapKey();
        Expect(TokenKind::kColon, "after map key");
        entries.insert_or_assign(std::move(key), ParseConstant());
        if (!Match(TokenKind::kComma)) {
          break;
        }
      }
      Expect(TokenKind::kRightBrace, "to close map constant");
      return Value::Map(std::move(entries));
    }
    default:
      Fail(token.span, fmt::format(
                           "expected constant value, found {}",
                           ToString(token.kind)));
  }
}

auto Parser::ParseMapKey() -> Value {
  if (Check(TokenKind::kIdentifier)) {
    return Value::String(Advance().text);
  }
  return ParseConstant();
}

auto Parser::ParseDuration() -> std::chrono::milliseconds {
  const Token& token =
      Expect(TokenKind::kInteger, "for duration in milliseconds");
  return std::chrono::milliseconds(token.integer);
}

auto Parser::ParseCount() -> uint32_t {
  const Token& token = Expect(TokenKind::kInteger, "for count");
  if (token.integer > UINT32_MAX) {
    Fail(token.span, "count is too large");
  }
  return static_cast<uint32_t>(token.integer);
}

auto Parser::MakeBinary(
    decl::BinaryOp op, decl::ExpressionId lhs, decl::ExpressionId rhs)
    -> decl::ExpressionId {
  return Add(
      decl::ExpressionKind::kBinaryOp, Join(SpanOf(lhs), SpanOf(rhs)),
      decl::BinaryExpressionData{.op = op, .lhs = lhs, .rhs = rhs});
}

auto Parser::Add(
    decl::ExpressionKind kind, SourceSpan span, decl::ExpressionData data)
    -> decl::ExpressionId {
  return arena_.AddExpression(
      decl::Expression{.kind = kind, .span = span, .data = std::move(data)});
}

auto Parser::SpanOf(decl::ExpressionId id) const -> SourceSpan {
  return arena_[id].span;
}

auto Parser::Join(SourceSpan first, SourceSpan last) const -> SourceSpan {
  return SourceSpan{
      .file_id = file_, .begin = first.begin, .end = last.end};
}

auto Parser::Peek(size_t ahead) const -> const Token& {
  size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
  return tokens_[index];
}

auto Parser::Advance() -> const Token& {
  const Token& token = tokens_[pos_];
  if (token.kind != TokenKind::kEndOfFile) {
    ++pos_;
  }
  return token;
}

auto Parser::Match(TokenKind kind) -> bool {
  if (!Check(kind)) {
    return false;
  }
  Advance();
  return true;
}

auto Parser::Expect(TokenKind kind, std::string_view context)
    -> const Token& {
  if (!Check(kind)) {
    const Token& found = Peek();
    std::string message =
        context.empty()
            ? fmt::format(
                  "expected {}, found {}", ToString(kind),
                  ToString(found.kind))
            : fmt::format(
                  "expected {} {}, found {}", ToString(kind), context,
                  ToString(found.kind));
    Fail(found.span, message);
  }
  return Advance();
}

void Parser::Fail(SourceSpan span, const std::string& message) const {
  throw DiagnosticException(Diagnostic::Error(span, message));
}

auto ParseDeclaration(FileId file, std::string_view source)
    -> Result<decl::Declaration> {
  try {
    Lexer lexer(file, source);
    Parser parser(file, lexer.Tokenize());
    auto declaration = parser.ParseDeclaration();
    spdlog::debug(
        "parsed service '{}' with {} clause(s)",
        declaration.spec.module_name, declaration.clauses.size());
    return declaration;
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto ParseCall(FileId file, std::string_view source)
    -> Result<std::pair<std::string, std::vector<Value>>> {
  try {
    Lexer lexer(file, source);
    Parser parser(file, lexer.Tokenize());
    return parser.ParseCallLiteral();
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
}

auto CheckServiceSpec(const decl::ServiceSpec& spec) -> Result<void> {
  if (spec.mode == ServiceMode::kPooled && !spec.pool) {
    return std::unexpected(
        Diagnostic::Error(spec.span, "pooled service requires a 'pool' option")
            .WithNote("for example: pool: {min: 1, max: 4}"));
  }
  if (spec.mode != ServiceMode::kPooled && spec.pool) {
    return std::unexpected(
        Diagnostic::Error(
            spec.pool->span,
            fmt::format(
                "'pool' is only valid for pooled services, not {}",
                ToString(spec.mode))));
  }
  if (spec.pool) {
    if (spec.pool->max == 0) {
      return std::unexpected(
          Diagnostic::Error(spec.pool->span, "pool 'max' must be at least 1"));
    }
    if (spec.pool->min > spec.pool->max) {
      return std::unexpected(Diagnostic::Error(
          spec.pool->span,
          fmt::format(
              "pool 'min' ({}) exceeds 'max' ({})", spec.pool->min,
              spec.pool->max)));
    }
  }
  if (spec.mode == ServiceMode::kNamed && !spec.service_name) {
    return std::unexpected(Diagnostic::Error(
        spec.span, "named service requires a 'service_name' option"));
  }
  if (spec.mode != ServiceMode::kNamed && spec.service_name) {
    return std::unexpected(Diagnostic::Error(
        spec.span,
        fmt::format(
            "'service_name' is only valid for named services, not {}",
            ToString(spec.mode))));
  }
  return {};
}

}  // namespace servant::frontend
