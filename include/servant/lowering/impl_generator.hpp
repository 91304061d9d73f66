#pragma once

#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/common/diagnostic/diagnostic_sink.hpp"
#include "servant/decl/declaration.hpp"
#include "servant/impl/module.hpp"

namespace servant::lowering {

// Turns a parsed declaration into the pure implementation module:
//  - groups clauses into functions by name and arity,
//  - translates public bodies into reply form (see TranslateResponse),
//  - resolves every name and call target.
//
// Rejected (reported to `sink`): unknown names, calls with the wrong number
// of arguments, calls to public functions from a body, parameters that
// shadow the state name, duplicate parameter names, helpers named like a
// builtin, and a name declared both def and defp.
//
// The returned module is meaningful only if `sink` has no errors.
auto GenerateImplementation(decl::Declaration declaration, DiagnosticSink& sink)
    -> impl::Module;

// GenerateImplementation, stopping at the first error.
auto LowerDeclaration(decl::Declaration declaration) -> Result<impl::Module>;

}  // namespace servant::lowering
