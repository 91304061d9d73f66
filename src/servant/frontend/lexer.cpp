#include "servant/frontend/lexer.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "servant/common/diagnostic/diagnostic.hpp"

namespace servant::frontend {

namespace {

auto IsIdentStart(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsIdentContinue(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto KeywordKind(std::string_view text) -> TokenKind {
  if (text == "service") return TokenKind::kService;
  if (text == "def") return TokenKind::kDef;
  if (text == "defp") return TokenKind::kDefp;
  if (text == "when") return TokenKind::kWhen;
  if (text == "if") return TokenKind::kIf;
  if (text == "else") return TokenKind::kElse;
  if (text == "let") return TokenKind::kLet;
  if (text == "set_state") return TokenKind::kSetState;
  if (text == "nil") return TokenKind::kNil;
  if (text == "true") return TokenKind::kTrue;
  if (text == "false") return TokenKind::kFalse;
  return TokenKind::kIdentifier;
}

}  // namespace

auto ToString(TokenKind kind) -> std::string_view {
  switch (kind) {
    case TokenKind::kIdentifier:
      return "identifier";
    case TokenKind::kInteger:
      return "integer";
    case TokenKind::kString:
      return "string";
    case TokenKind::kService:
      return "'service'";
    case TokenKind::kDef:
      return "'def'";
    case TokenKind::kDefp:
      return "'defp'";
    case TokenKind::kWhen:
      return "'when'";
    case TokenKind::kIf:
      return "'if'";
    case TokenKind::kElse:
      return "'else'";
    case TokenKind::kLet:
      return "'let'";
    case TokenKind::kSetState:
      return "'set_state'";
    case TokenKind::kNil:
      return "'nil'";
    case TokenKind::kTrue:
      return "'true'";
    case TokenKind::kFalse:
      return "'false'";
    case TokenKind::kLeftBrace:
      return "'{'";
    case TokenKind::kRightBrace:
      return "'}'";
    case TokenKind::kLeftParen:
      return "'('";
    case TokenKind::kRightParen:
      return "')'";
    case TokenKind::kLeftBracket:
      return "'['";
    case TokenKind::kRightBracket:
      return "']'";
    case TokenKind::kComma:
      return "','";
    case TokenKind::kColon:
      return "':'";
    case TokenKind::kSemicolon:
      return "';'";
    case TokenKind::kAssign:
      return "'='";
    case TokenKind::kEqual:
      return "'=='";
    case TokenKind::kNotEqual:
      return "'!='";
    case TokenKind::kLess:
      return "'<'";
    case TokenKind::kLessEqual:
      return "'<='";
    case TokenKind::kGreater:
      return "'>'";
    case TokenKind::kGreaterEqual:
      return "'>='";
    case TokenKind::kPlus:
      return "'+'";
    case TokenKind::kMinus:
      return "'-'";
    case TokenKind::kStar:
      return "'*'";
    case TokenKind::kSlash:
      return "'/'";
    case TokenKind::kPercent:
      return "'%'";
    case TokenKind::kBang:
      return "'!'";
    case TokenKind::kAmpAmp:
      return "'&&'";
    case TokenKind::kPipePipe:
      return "'||'";
    case TokenKind::kEndOfFile:
      return "end of file";
  }
  return "token";
}

auto Lexer::Tokenize() -> std::vector<Token> {
  std::vector<Token> tokens;
  while (true) {
    SkipTrivia();
    if (AtEnd()) {
      tokens.push_back(MakeToken(TokenKind::kEndOfFile, pos_));
      return tokens;
    }
    char c = Peek();
    if (IsIdentStart(c)) {
      tokens.push_back(LexIdentifierOrKeyword());
    } else if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      tokens.push_back(LexInteger());
    } else if (c == '"') {
      tokens.push_back(LexString());
    } else {
      tokens.push_back(LexPunctuation());
    }
  }
}

void Lexer::SkipTrivia() {
  while (!AtEnd()) {
    char c = Peek();
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++pos_;
    } else if (c == '#') {
      while (!AtEnd() && Peek() != '\n') {
        ++pos_;
      }
    } else {
      return;
    }
  }
}

auto Lexer::LexIdentifierOrKeyword() -> Token {
  uint32_t begin = pos_;
  while (!AtEnd() && IsIdentContinue(Peek())) {
    ++pos_;
  }
  std::string_view text = source_.substr(begin, pos_ - begin);
  Token token = MakeToken(KeywordKind(text), begin);
  token.text = std::string(text);
  return token;
}

auto Lexer::LexInteger() -> Token {
  uint32_t begin = pos_;
  int64_t value = 0;
  while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
    int64_t digit = Peek() - '0';
    if (__builtin_mul_overflow(value, int64_t{10}, &value) ||
        __builtin_add_overflow(value, digit, &value)) {
      Fail(begin, "integer literal does not fit in 64 bits");
    }
    ++pos_;
  }
  if (IsIdentStart(Peek())) {
    Fail(begin, "identifier cannot start with a digit");
  }
  Token token = MakeToken(TokenKind::kInteger, begin);
  token.integer = value;
  return token;
}

auto Lexer::LexString() -> Token {
  uint32_t begin = pos_;
  ++pos_;  // opening quote
  std::string text;
  while (true) {
    if (AtEnd() || Peek() == '\n') {
      Fail(begin, "unterminated string literal");
    }
    char c = Peek();
    ++pos_;
    if (c == '"') {
      break;
    }
    if (c != '\\') {
      text += c;
      continue;
    }
    char escaped = Peek();
    ++pos_;
    switch (escaped) {
      case 'n':
        text += '\n';
        break;
      case 't':
        text += '\t';
        break;
      case '"':
        text += '"';
        break;
      case '\\':
        text += '\\';
        break;
      default:
        Fail(pos_ - 2, fmt::format("unknown escape sequence '\\{}'", escaped));
    }
  }
  Token token = MakeToken(TokenKind::kString, begin);
  token.text = std::move(text);
  return token;
}

auto Lexer::LexPunctuation() -> Token {
  uint32_t begin = pos_;
  char c = Peek();
  char next = Peek(1);
  auto two = [&](TokenKind kind) {
    pos_ += 2;
    return MakeToken(kind, begin);
  };
  auto one = [&](TokenKind kind) {
    pos_ += 1;
    return MakeToken(kind, begin);
  };

  switch (c) {
    case '{':
      return one(TokenKind::kLeftBrace);
    case '}':
      return one(TokenKind::kRightBrace);
    case '(':
      return one(TokenKind::kLeftParen);
    case ')':
      return one(TokenKind::kRightParen);
    case '[':
      return one(TokenKind::kLeftBracket);
    case ']':
      return one(TokenKind::kRightBracket);
    case ',':
      return one(TokenKind::kComma);
    case ':':
      return one(TokenKind::kColon);
    case ';':
      return one(TokenKind::kSemicolon);
    case '+':
      return one(TokenKind::kPlus);
    case '-':
      return one(TokenKind::kMinus);
    case '*':
      return one(TokenKind::kStar);
    case '/':
      return one(TokenKind::kSlash);
    case '%':
      return one(TokenKind::kPercent);
    case '=':
      return next == '=' ? two(TokenKind::kEqual) : one(TokenKind::kAssign);
    case '!':
      return next == '=' ? two(TokenKind::kNotEqual) : one(TokenKind::kBang);
    case '<':
      return next == '=' ? two(TokenKind::kLessEqual) : one(TokenKind::kLess);
    case '>':
      return next == '=' ? two(TokenKind::kGreaterEqual)
                         : one(TokenKind::kGreater);
    case '&':
      if (next == '&') {
        return two(TokenKind::kAmpAmp);
      }
      break;
    case '|':
      if (next == '|') {
        return two(TokenKind::kPipePipe);
      }
      break;
    default:
      break;
  }
  Fail(begin, fmt::format("unexpected character '{}'", c));
}

auto Lexer::MakeToken(TokenKind kind, uint32_t begin) const -> Token {
  return Token{
      .kind = kind,
      .text = {},
      .integer = 0,
      .span = SourceSpan{.file_id = file_, .begin = begin, .end = pos_},
  };
}

void Lexer::Fail(uint32_t begin, const std::string& message) const {
  throw DiagnosticException(
      Diagnostic::Error(
          SourceSpan{.file_id = file_, .begin = begin, .end = begin + 1},
          message));
}

}  // namespace servant::frontend
