#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "servant/common/source_manager.hpp"
#include "servant/frontend/token.hpp"

namespace servant::frontend {

// Splits declaration text into tokens. `#` starts a comment that runs to
// the end of the line. Throws DiagnosticException on malformed input.
class Lexer {
 public:
  Lexer(FileId file, std::string_view source) : file_(file), source_(source) {
  }

  auto Tokenize() -> std::vector<Token>;

 private:
  [[nodiscard]] auto AtEnd() const -> bool {
    return pos_ >= source_.size();
  }
  [[nodiscard]] auto Peek(size_t ahead = 0) const -> char {
    return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
  }

  void SkipTrivia();
  auto LexIdentifierOrKeyword() -> Token;
  auto LexInteger() -> Token;
  auto LexString() -> Token;
  auto LexPunctuation() -> Token;
  auto MakeToken(TokenKind kind, uint32_t begin) const -> Token;
  [[noreturn]] void Fail(uint32_t begin, const std::string& message) const;

  FileId file_;
  std::string_view source_;
  uint32_t pos_ = 0;
};

}  // namespace servant::frontend
