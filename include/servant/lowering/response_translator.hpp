#pragma once

#include "servant/common/diagnostic/diagnostic_sink.hpp"
#include "servant/decl/arena.hpp"
#include "servant/decl/declaration.hpp"

namespace servant::lowering {

// Rewrites the body of a public clause so that every terminal position is a
// kReply node: an ordinary expression becomes a plain reply, and
// `set_state(s) { r }` becomes a reply of r with new state s. Terminal
// positions are the body itself, both branches of a tail `if`, and the body
// of a tail `let`. A tail `if` without `else` gets an explicit nil reply.
//
// set_state anywhere else (in a condition, a let value, an operand, a guard,
// or any part of a private clause) is reported to `sink`.
//
// Private clauses are only checked; their bodies stay as written.
void TranslateResponse(
    decl::Arena& arena, decl::FunctionClause& clause, DiagnosticSink& sink);

}  // namespace servant::lowering
