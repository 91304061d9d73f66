#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "servant/common/source_span.hpp"
#include "servant/common/value.hpp"
#include "servant/decl/fwd.hpp"
#include "servant/decl/operator.hpp"

namespace servant::decl {

enum class ExpressionKind {
  kLiteral,
  kMapLiteral,
  kNameRef,
  kUnaryOp,
  kBinaryOp,
  kIndex,
  kCall,
  kIf,
  kLet,
  kSetState,  // set_state(s) { r }, as written in the declaration
  kReply,     // Normalized terminal, produced by the response translator
};

struct LiteralExpressionData {
  Value value;
};

struct MapLiteralExpressionData {
  std::vector<std::pair<ExpressionId, ExpressionId>> entries;
};

struct NameRefExpressionData {
  std::string name;
};

struct UnaryExpressionData {
  UnaryOp op;
  ExpressionId operand;
};

struct BinaryExpressionData {
  BinaryOp op;
  ExpressionId lhs;
  ExpressionId rhs;
};

struct IndexExpressionData {
  ExpressionId base;
  ExpressionId key;
};

// What a call resolves to. The parser leaves calls unresolved; the
// implementation generator fills in the target.
enum class CalleeKind : uint8_t {
  kUnresolved,
  kBuiltin,
  kHelper,
};

struct CallExpressionData {
  std::string callee;
  std::vector<ExpressionId> arguments;
  CalleeKind callee_kind = CalleeKind::kUnresolved;
  Builtin builtin = Builtin::kPut;  // Valid when callee_kind == kBuiltin
};

struct IfExpressionData {
  ExpressionId condition;
  ExpressionId then_expr;
  std::optional<ExpressionId> else_expr;  // Missing else yields nil
};

struct LetExpressionData {
  std::string name;
  ExpressionId value;
  ExpressionId body;
};

struct SetStateExpressionData {
  ExpressionId new_state;
  std::optional<ExpressionId> result;  // Missing result replies new_state
};

enum class ReplyKind : uint8_t {
  kPlain,
  kWithState,
};

// kPlain: `value` is set, `new_state` is not.
// kWithState: `new_state` is set; `value` unset means reply with the new
// state itself.
struct ReplyExpressionData {
  ReplyKind kind;
  std::optional<ExpressionId> value;
  std::optional<ExpressionId> new_state;
};

using ExpressionData = std::variant<
    LiteralExpressionData, MapLiteralExpressionData, NameRefExpressionData,
    UnaryExpressionData, BinaryExpressionData, IndexExpressionData,
    CallExpressionData, IfExpressionData, LetExpressionData,
    SetStateExpressionData, ReplyExpressionData>;

struct Expression {
  ExpressionKind kind;
  SourceSpan span;
  ExpressionData data;
};

}  // namespace servant::decl
