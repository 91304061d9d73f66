#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "servant/decl/fwd.hpp"
#include "servant/impl/module.hpp"

namespace servant::codegen {

// Renders a lowered module as a self-contained C++ header:
//  - namespace `impl` with one pure function per declared function,
//  - a client class named after the service whose static members hide the
//    state (or, for inline services, thread it through a reference),
//  - Run() wiring to runtime::MakeRuntime with the declared options.
//
// Generated functions compute with servant::ops, the same operations the
// interpreter uses.
class Codegen {
 public:
  auto Generate(const impl::Module& module, std::string_view source_name)
      -> std::string;

 private:
  void EmitPrologue(std::string_view source_name);
  void EmitImplementation();
  void EmitFunctionDeclaration(const impl::Function& function);
  void EmitFunction(const impl::Function& function);
  void EmitClause(const impl::Function& function, const decl::FunctionClause& clause);
  void EmitClient();
  void EmitOptions();
  void EmitClientMethod(const impl::Function& function);
  void EmitEpilogue();

  // Statement-level rendering of a tail position.
  void EmitReplyTail(decl::ExpressionId id);
  void EmitValueTail(decl::ExpressionId id);

  // Expression-level rendering.
  auto Expr(decl::ExpressionId id) -> std::string;
  // `callee(operands...)`, with the operands evaluated left to right.
  auto Apply(
      std::string_view callee, const std::vector<decl::ExpressionId>& operands)
      -> std::string;

  auto Bind(const std::string& name) -> std::string;
  auto Resolve(const std::string& name) const -> const std::string&;
  auto ClientParams(const impl::Function& function) const
      -> std::vector<std::string>;

  void Line(const std::string& text);
  void Blank();

  const impl::Module* module_ = nullptr;
  std::ostringstream out_;
  int indent_ = 0;
  int next_binding_ = 0;
  std::vector<std::pair<std::string, std::string>> scope_;
};

// C++ spelling of a value literal.
auto RenderValue(const Value& value) -> std::string;

// C++ string literal with the contents of `text`.
auto QuoteString(std::string_view text) -> std::string;

// `name`, changed if needed so that it is a usable C++ identifier.
auto CppIdentifier(std::string_view name) -> std::string;

// NamedKVStore -> named_kv_store
auto SnakeCase(std::string_view name) -> std::string;

}  // namespace servant::codegen
