#include "servant/impl/module.hpp"

#include <algorithm>
#include <ostream>
#include <string_view>

#include <fmt/core.h>

#include "servant/decl/dumper.hpp"

namespace servant::impl {

auto Module::FindFunction(std::string_view name, uint32_t arity) const
    -> const Function* {
  auto it = std::ranges::find_if(functions, [&](const Function& f) {
    return f.name == name && f.arity == arity;
  });
  return it == functions.end() ? nullptr : &*it;
}

auto Module::FindPublic(std::string_view name, uint32_t caller_arity) const
    -> const Function* {
  auto it = std::ranges::find_if(functions, [&](const Function& f) {
    return f.IsPublic() && f.name == name && f.CallerArity() == caller_arity;
  });
  return it == functions.end() ? nullptr : &*it;
}

void Dump(const Module& module, std::ostream& out) {
  decl::Dumper dumper(&module.arena, &out);
  dumper.Dump(module.spec);
  for (const auto& function : module.functions) {
    out << fmt::format(
        "function {}/{} ({})\n", function.name, function.CallerArity(),
        function.IsPublic() ? "public" : "private");
    for (const auto& clause : function.clauses) {
      dumper.Dump(clause);
    }
  }
}

}  // namespace servant::impl
