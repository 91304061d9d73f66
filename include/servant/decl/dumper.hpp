#pragma once

#include <ostream>
#include <string>

#include "servant/decl/arena.hpp"
#include "servant/decl/declaration.hpp"

namespace servant::decl {

// Prints the declaration model in a readable, source-like notation. Tail
// structure (let, if, set_state, reply) is laid out one level per line;
// other expressions are printed inline.
class Dumper {
 public:
  Dumper(const Arena* arena, std::ostream* out);

  void Dump(const Declaration& declaration);
  void Dump(const ServiceSpec& spec);
  void Dump(const FunctionClause& clause);
  void Dump(ExpressionId id);

  // Inline rendering of one expression.
  [[nodiscard]] auto Render(ExpressionId id) const -> std::string;

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] auto RenderPattern(const Pattern& pattern) const
      -> std::string;

  const Arena* arena_;
  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace servant::decl
