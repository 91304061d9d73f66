#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "servant/common/source_span.hpp"

namespace servant::frontend {

enum class TokenKind : uint8_t {
  kIdentifier,
  kInteger,
  kString,

  // Keywords
  kService,
  kDef,
  kDefp,
  kWhen,
  kIf,
  kElse,
  kLet,
  kSetState,
  kNil,
  kTrue,
  kFalse,

  // Punctuation
  kLeftBrace,
  kRightBrace,
  kLeftParen,
  kRightParen,
  kLeftBracket,
  kRightBracket,
  kComma,
  kColon,
  kSemicolon,
  kAssign,
  kEqual,
  kNotEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kPercent,
  kBang,
  kAmpAmp,
  kPipePipe,

  kEndOfFile,
};

auto ToString(TokenKind kind) -> std::string_view;

struct Token {
  TokenKind kind;
  std::string text;  // Identifier name or unescaped string contents
  int64_t integer = 0;
  SourceSpan span;
};

}  // namespace servant::frontend
