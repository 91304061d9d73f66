#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "servant/common/source_manager.hpp"
#include "servant/decl/arena.hpp"
#include "servant/decl/declaration.hpp"

namespace servant::impl {

// All clauses sharing one name and arity. Public functions carry the state
// as parameter 0; `arity` counts it.
struct Function {
  std::string name;
  decl::Visibility visibility;
  uint32_t arity = 0;
  std::vector<decl::FunctionClause> clauses;  // Declaration order

  [[nodiscard]] auto IsPublic() const -> bool {
    return visibility == decl::Visibility::kPublic;
  }

  // Number of arguments a client supplies (state elided).
  [[nodiscard]] auto CallerArity() const -> uint32_t {
    return IsPublic() ? arity - 1 : arity;
  }
};

// The pure core of a service: every public body has been rewritten so that
// each terminal position is a reply node, and every call is resolved.
struct Module {
  decl::ServiceSpec spec;
  std::vector<Function> functions;  // Order of first appearance
  decl::Arena arena;
  FileId file;

  // Lookup by name and full arity (state included for public functions).
  [[nodiscard]] auto FindFunction(std::string_view name, uint32_t arity) const
      -> const Function*;

  // Lookup of a public function by the number of client arguments.
  [[nodiscard]] auto FindPublic(std::string_view name, uint32_t caller_arity)
      const -> const Function*;
};

// Print the lowered functions in the same notation as decl::Dumper.
void Dump(const Module& module, std::ostream& out);

}  // namespace servant::impl
