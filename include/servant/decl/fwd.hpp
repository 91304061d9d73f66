#pragma once

#include <cstdint>

namespace servant::decl {

struct ExpressionId {
  uint32_t value = 0;

  auto operator==(const ExpressionId&) const -> bool = default;
};

struct Expression;
struct FunctionClause;
struct ServiceSpec;
class Arena;
struct Declaration;

}  // namespace servant::decl
