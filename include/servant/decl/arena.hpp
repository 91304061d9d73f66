#pragma once

#include <cstdint>
#include <vector>

#include "servant/decl/expression.hpp"
#include "servant/decl/fwd.hpp"

namespace servant::decl {

// Owns every expression node of one declaration. Nodes refer to each other
// by ExpressionId; ids stay valid for the arena's lifetime.
class Arena final {
 public:
  Arena() = default;
  ~Arena() = default;

  Arena(const Arena&) = delete;
  auto operator=(const Arena&) -> Arena& = delete;

  Arena(Arena&&) = default;
  auto operator=(Arena&&) -> Arena& = default;

  auto AddExpression(Expression expr) -> ExpressionId {
    ExpressionId id{static_cast<uint32_t>(expressions_.size())};
    expressions_.push_back(std::move(expr));
    return id;
  }

  [[nodiscard]] auto operator[](ExpressionId id) const -> const Expression& {
    return expressions_[id.value];
  }

  [[nodiscard]] auto operator[](ExpressionId id) -> Expression& {
    return expressions_[id.value];
  }

  [[nodiscard]] auto ExpressionCount() const -> size_t {
    return expressions_.size();
  }

 private:
  std::vector<Expression> expressions_;
};

}  // namespace servant::decl
