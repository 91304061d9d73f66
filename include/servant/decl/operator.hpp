#pragma once

#include <cstdint>
#include <string_view>

namespace servant::decl {

enum class UnaryOp : uint8_t {
  kNegate,      // -x
  kLogicalNot,  // !x
};

enum class BinaryOp : uint8_t {
  kMul,
  kDiv,
  kMod,
  kAdd,
  kSub,
  kEqual,
  kNotEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
  kLogicalAnd,
  kLogicalOr,
};

inline auto ToString(UnaryOp op) -> std::string_view {
  switch (op) {
    case UnaryOp::kNegate:
      return "-";
    case UnaryOp::kLogicalNot:
      return "!";
  }
  return "?";
}

inline auto ToString(BinaryOp op) -> std::string_view {
  switch (op) {
    case BinaryOp::kMul:
      return "*";
    case BinaryOp::kDiv:
      return "/";
    case BinaryOp::kMod:
      return "%";
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSub:
      return "-";
    case BinaryOp::kEqual:
      return "==";
    case BinaryOp::kNotEqual:
      return "!=";
    case BinaryOp::kLess:
      return "<";
    case BinaryOp::kLessEqual:
      return "<=";
    case BinaryOp::kGreater:
      return ">";
    case BinaryOp::kGreaterEqual:
      return ">=";
    case BinaryOp::kLogicalAnd:
      return "&&";
    case BinaryOp::kLogicalOr:
      return "||";
  }
  return "?";
}

// Builtin functions callable from bodies.
enum class Builtin : uint8_t {
  kPut,
  kGet,
  kHas,
  kDelete,
  kSize,
  kRaise,
};

struct BuiltinInfo {
  Builtin builtin;
  std::string_view name;
  uint32_t arity;
};

inline constexpr BuiltinInfo kBuiltins[] = {
    {.builtin = Builtin::kPut, .name = "put", .arity = 3},
    {.builtin = Builtin::kGet, .name = "get", .arity = 2},
    {.builtin = Builtin::kHas, .name = "has", .arity = 2},
    {.builtin = Builtin::kDelete, .name = "delete", .arity = 2},
    {.builtin = Builtin::kSize, .name = "size", .arity = 1},
    {.builtin = Builtin::kRaise, .name = "raise", .arity = 1},
};

inline auto FindBuiltin(std::string_view name) -> const BuiltinInfo* {
  for (const auto& info : kBuiltins) {
    if (info.name == name) {
      return &info;
    }
  }
  return nullptr;
}

inline auto ToString(Builtin builtin) -> std::string_view {
  for (const auto& info : kBuiltins) {
    if (info.builtin == builtin) {
      return info.name;
    }
  }
  return "?";
}

}  // namespace servant::decl
