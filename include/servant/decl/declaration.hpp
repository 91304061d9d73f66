#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "servant/common/service_mode.hpp"
#include "servant/common/source_span.hpp"
#include "servant/common/value.hpp"
#include "servant/decl/arena.hpp"
#include "servant/decl/fwd.hpp"

namespace servant::decl {

struct PoolSpec {
  uint32_t min = 0;
  uint32_t max = 0;
  std::optional<std::chrono::milliseconds> checkout_timeout;
  std::optional<std::chrono::milliseconds> idle_grace;
  SourceSpan span;
};

struct RestartSpec {
  std::optional<uint32_t> max_restarts;
  std::optional<std::chrono::milliseconds> window;
};

// Service options from the `service Name { ... }` header. Fixed once the
// declaration is parsed.
struct ServiceSpec {
  std::string module_name;
  ServiceMode mode = ServiceMode::kAnonymous;
  Value initial_state;
  std::string state_name = "state";
  std::optional<std::string> service_name;  // Present iff mode == kNamed
  std::optional<PoolSpec> pool;             // Present iff mode == kPooled
  bool diagnostics = false;
  std::optional<std::chrono::milliseconds> call_timeout;
  RestartSpec restart;
  SourceSpan span;
};

enum class Visibility : uint8_t {
  kPublic,   // def: part of the client API, receives the state first
  kPrivate,  // defp: helper, takes only the parameters it declares
};

enum class PatternKind : uint8_t {
  kBind,      // Identifier: binds the argument
  kWildcard,  // _
  kLiteral,   // Matches an equal value
};

struct Pattern {
  PatternKind kind;
  std::string name;  // kBind
  Value literal;     // kLiteral
  SourceSpan span;
};

struct FunctionClause {
  std::string name;
  Visibility visibility;
  // For public clauses params[0] is the state parameter, named after
  // ServiceSpec::state_name.
  std::vector<Pattern> params;
  std::optional<ExpressionId> guard;
  ExpressionId body;
  SourceSpan span;

  // Number of parameters a caller supplies.
  [[nodiscard]] auto CallerArity() const -> uint32_t {
    auto count = static_cast<uint32_t>(params.size());
    return visibility == Visibility::kPublic ? count - 1 : count;
  }
};

struct Declaration {
  ServiceSpec spec;
  std::vector<FunctionClause> clauses;
  Arena arena;
  FileId file;
};

}  // namespace servant::decl
