#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/common/source_manager.hpp"
#include "servant/common/value.hpp"
#include "servant/decl/declaration.hpp"
#include "servant/frontend/token.hpp"

namespace servant::frontend {

// Recursive-descent parser for declaration files:
//
//   file     := 'service' IDENT '{' option* '}' clause*
//   option   := IDENT ':' constant [',']
//   clause   := ('def' | 'defp') IDENT '(' [param {',' param}] ')'
//               ['when' expr] block
//   block    := '{' expr '}'
//   expr     := 'let' IDENT '=' expr ';' expr | or_expr
//   or_expr  := and_expr {'||' and_expr}
//   and_expr := cmp {'&&' cmp}
//   cmp      := add [('=='|'!='|'<'|'<='|'>'|'>=') add]
//   add      := mul {('+'|'-') mul}
//   mul      := unary {('*'|'/'|'%') unary}
//   unary    := ('-'|'!') unary | postfix
//   postfix  := primary {'[' expr ']'}
//   primary  := literal | map | IDENT ['(' args ')'] | '(' expr ')'
//             | 'if' expr block ['else' (block | if)]
//             | 'set_state' '(' expr ')' [block]
//
// Stops at the first error by throwing DiagnosticException.
class Parser {
 public:
  Parser(FileId file, std::vector<Token> tokens)
      : file_(file), tokens_(std::move(tokens)) {
  }

  auto ParseDeclaration() -> decl::Declaration;

  // Parses `name(arg, ...)` with constant arguments; used by the driver to
  // read calls from the command line.
  auto ParseCallLiteral() -> std::pair<std::string, std::vector<Value>>;

 private:
  void ParseServiceHeader(decl::ServiceSpec& spec);
  void ParseOption(decl::ServiceSpec& spec, std::vector<std::string>& seen);
  auto ParsePoolOption(SourceSpan span) -> decl::PoolSpec;
  auto ParseRestartOption() -> decl::RestartSpec;
  auto ParseClause(const decl::ServiceSpec& spec) -> decl::FunctionClause;
  auto ParsePattern() -> decl::Pattern;
  auto ParseBlock() -> decl::ExpressionId;

  auto ParseExpression() -> decl::ExpressionId;
  auto ParseOr() -> decl::ExpressionId;
  auto ParseAnd() -> decl::ExpressionId;
  auto ParseComparison() -> decl::ExpressionId;
  auto ParseAdditive() -> decl::ExpressionId;
  auto ParseMultiplicative() -> decl::ExpressionId;
  auto ParseUnary() -> decl::ExpressionId;
  auto ParsePostfix() -> decl::ExpressionId;
  auto ParsePrimary() -> decl::ExpressionId;
  auto ParseIf() -> decl::ExpressionId;
  auto ParseSetState() -> decl::ExpressionId;
  auto ParseMapLiteral() -> decl::ExpressionId;

  // Compile-time constant: literal, negative integer, or map of constants.
  auto ParseConstant() -> Value;
  auto ParseMapKey() -> Value;
  auto ParseDuration() -> std::chrono::milliseconds;
  auto ParseCount() -> uint32_t;

  auto MakeBinary(
      decl::BinaryOp op, decl::ExpressionId lhs, decl::ExpressionId rhs)
      -> decl::ExpressionId;
  auto Add(decl::ExpressionKind kind, SourceSpan span, decl::ExpressionData data)
      -> decl::ExpressionId;
  auto SpanOf(decl::ExpressionId id) const -> SourceSpan;
  auto Join(SourceSpan first, SourceSpan last) const -> SourceSpan;

  [[nodiscard]] auto Peek(size_t ahead = 0) const -> const Token&;
  [[nodiscard]] auto Check(TokenKind kind) const -> bool {
    return Peek().kind == kind;
  }
  auto Advance() -> const Token&;
  auto Match(TokenKind kind) -> bool;
  auto Expect(TokenKind kind, std::string_view context) -> const Token&;
  [[noreturn]] void Fail(SourceSpan span, const std::string& message) const;

  FileId file_;
  std::vector<Token> tokens_;
  size_t pos_ = 0;
  decl::Arena arena_;
};

// Lex and parse one declaration file.
auto ParseDeclaration(FileId file, std::string_view source)
    -> Result<decl::Declaration>;

// Lex and parse a call literal such as `put("a", 1)`.
auto ParseCall(FileId file, std::string_view source)
    -> Result<std::pair<std::string, std::vector<Value>>>;

// Check the ServiceSpec invariants (pool iff pooled, min <= max, name iff
// named).
auto CheckServiceSpec(const decl::ServiceSpec& spec) -> Result<void>;

}  // namespace servant::frontend
