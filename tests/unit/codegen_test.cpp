#include "servant/codegen/codegen.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "servant/common/source_manager.hpp"
#include "servant/frontend/parser.hpp"
#include "servant/lowering/impl_generator.hpp"

namespace servant::codegen {
namespace {

auto Contains(const std::string& haystack, const std::string& needle)
    -> ::testing::AssertionResult {
  if (haystack.find(needle) != std::string::npos) {
    return ::testing::AssertionSuccess();
  }
  return ::testing::AssertionFailure()
         << "'" << needle << "' not found in:\n"
         << haystack;
}

auto GenerateFrom(const std::string& text) -> std::string {
  SourceManager sources;
  FileId file = sources.AddFile("test.svc", text);
  auto parsed =
      frontend::ParseDeclaration(file, sources.GetFile(file)->content);
  if (!parsed) {
    ADD_FAILURE() << parsed.error().primary.message;
    return "";
  }
  auto module = lowering::LowerDeclaration(std::move(*parsed));
  if (!module) {
    ADD_FAILURE() << module.error().primary.message;
    return "";
  }
  Codegen codegen;
  return codegen.Generate(*module, "test.svc");
}

TEST(CodegenNamingTest, SnakeCase) {
  EXPECT_EQ(SnakeCase("FibCache"), "fib_cache");
  EXPECT_EQ(SnakeCase("NamedKVStore"), "named_kv_store");
  EXPECT_EQ(SnakeCase("HTTPServer2"), "http_server2");
  EXPECT_EQ(SnakeCase("tally"), "tally");
  EXPECT_EQ(SnakeCase("Delete"), "delete_");
}

TEST(CodegenNamingTest, CppIdentifierAvoidsKeywordsAndMembers) {
  EXPECT_EQ(CppIdentifier("count"), "count");
  EXPECT_EQ(CppIdentifier("class"), "class_");
  EXPECT_EQ(CppIdentifier("new"), "new_");
  EXPECT_EQ(CppIdentifier("Run"), "Run_");
  EXPECT_EQ(CppIdentifier("Service"), "Service_");
}

TEST(CodegenValueTest, RenderValue) {
  EXPECT_EQ(RenderValue(Value::Nil()), "Value::Nil()");
  EXPECT_EQ(RenderValue(Value::Bool(true)), "Value::Bool(true)");
  EXPECT_EQ(RenderValue(Value::Int(-4)), "Value::Int(-4)");
  EXPECT_EQ(
      RenderValue(Value::Int(std::numeric_limits<int64_t>::min())),
      "Value::Int(-9223372036854775807LL - 1)");
  EXPECT_EQ(RenderValue(Value::String("hi")), "Value::String(\"hi\")");
  EXPECT_EQ(
      RenderValue(Value::Map({{Value::String("a"), Value::Int(1)}})),
      "Value::Map(servant::ValueMap{{Value::String(\"a\"), Value::Int(1)}})");
}

TEST(CodegenValueTest, QuoteStringEscapes) {
  EXPECT_EQ(QuoteString("a\"b"), "\"a\\\"b\"");
  EXPECT_EQ(QuoteString("line\n"), "\"line\\n\"");
  EXPECT_EQ(QuoteString("back\\slash"), "\"back\\\\slash\"");
  EXPECT_EQ(QuoteString(std::string(1, '\x01')), "\"\\001\"");
}

TEST(CodegenTest, PrologueAndNamespace) {
  auto code = GenerateFrom("service FibCache {}\ndef f() { 1 }\n");
  EXPECT_TRUE(Contains(code, "// Generated by servantc from test.svc. Do not edit."));
  EXPECT_TRUE(Contains(code, "#pragma once"));
  EXPECT_TRUE(Contains(code, "namespace servant::generated::fib_cache {"));
  EXPECT_TRUE(Contains(code, "}  // namespace servant::generated::fib_cache"));
  EXPECT_TRUE(Contains(code, "class FibCache {"));
}

TEST(CodegenTest, PublicFunctionsReturnReplies) {
  auto code = GenerateFrom(
      "service S { state: 0 }\n"
      "def bump(n) { set_state(state + n) { state } }\n"
      "def peek() { state }\n");
  EXPECT_TRUE(Contains(code, "inline auto bump(const Value& a0, const Value& a1) -> Reply {"));
  EXPECT_TRUE(Contains(code, "return servant::runtime::WithState<Value, Value>{"));
  EXPECT_TRUE(Contains(code, "return servant::runtime::Plain<Value>{"));
  EXPECT_TRUE(Contains(code, "servant::ops::Add("));
}

TEST(CodegenTest, HelpersAreForwardDeclared) {
  auto code = GenerateFrom(
      "service S {}\n"
      "def f(x) { even(x) }\n"
      "defp even(0) { true }\n"
      "defp even(n) { odd(n - 1) }\n"
      "defp odd(0) { false }\n"
      "defp odd(n) { even(n - 1) }\n");
  EXPECT_TRUE(Contains(code, "inline auto even(const Value& a0) -> Value;"));
  EXPECT_TRUE(Contains(code, "inline auto odd(const Value& a0) -> Value;"));
  EXPECT_TRUE(Contains(code, "if (a0 == Value::Int(0)) {"));
}

TEST(CodegenTest, HelpersCountCallDepth) {
  auto code = GenerateFrom(
      "service S {}\n"
      "def f(x) { down(x) }\n"
      "defp down(0) { 0 }\n"
      "defp down(n) { down(n - 1) }\n");
  EXPECT_TRUE(
      Contains(code, "servant::ops::CallDepthGuard depth_guard(\"down\", 1);"));
}

TEST(CodegenTest, FallibleOperandsAreEvaluatedLeftToRight) {
  auto code = GenerateFrom(
      "service S {}\n"
      "def f() { raise(\"a\") + raise(\"b\") }\n");
  EXPECT_TRUE(Contains(code, "[&]() -> Value { const Value t_"));
  auto first = code.find("Value::String(\"a\")");
  auto second = code.find("Value::String(\"b\")");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_TRUE(Contains(code, "return servant::ops::Add(t_"));
}

TEST(CodegenTest, SimpleOperandsStayInline) {
  auto code = GenerateFrom("service S {}\ndef f(x) { x + 1 }\n");
  EXPECT_TRUE(Contains(code, "servant::ops::Add("));
  EXPECT_EQ(code.find("const Value t_"), std::string::npos);
}

TEST(CodegenTest, UnmatchedArgumentsRaise) {
  auto code = GenerateFrom("service S {}\ndef only(1) { true }\n");
  EXPECT_TRUE(Contains(code, "servant::ops::NoMatchingClause(\"only/1\", {a1});"));
}

TEST(CodegenTest, GuardsBecomeTruthinessChecks) {
  auto code = GenerateFrom(
      "service S {}\n"
      "def f(n) when n > 2 { 1 }\n"
      "def f(n) { 0 }\n");
  EXPECT_TRUE(Contains(code, "if (servant::ops::Truthy(servant::ops::Gt("));
}

TEST(CodegenTest, InlineClientThreadsState) {
  auto code = GenerateFrom(
      "service Tally { mode: inline state: 0 state_name: total }\n"
      "def add(n) { set_state(total + n) }\n");
  EXPECT_TRUE(Contains(code, "static auto add(Value& total, const Value& n) -> Value {"));
  EXPECT_TRUE(Contains(code, "servant::runtime::Commit<Value, Value>(impl::add(total, n), total);"));
  EXPECT_EQ(code.find("static auto Run("), std::string::npos);
}

TEST(CodegenTest, AnonymousClientTakesRuntime) {
  auto code = GenerateFrom(
      "service Cache { state: {} }\n"
      "def get(key) { state[key] }\n");
  EXPECT_TRUE(Contains(code, "static auto get(Runtime& service, const Value& key) -> Value {"));
  EXPECT_TRUE(Contains(code, "return service.Call<Value>("));
  EXPECT_TRUE(Contains(code, "static auto Run(servant::runtime::RuntimeOptions options = DefaultOptions())"));
  EXPECT_TRUE(Contains(code, "servant::ServiceMode::kAnonymous"));
}

TEST(CodegenTest, NamedClientLooksUpRegistry) {
  auto code = GenerateFrom(
      "service Store { mode: named service_name: alfred }\n"
      "def get(key) { state[key] }\n");
  EXPECT_TRUE(Contains(code, "Registry::Instance().Lookup<Value>(\"alfred\")"));
  EXPECT_TRUE(Contains(code, "static auto get(const Value& key) -> Value {"));
  EXPECT_TRUE(Contains(code, "options.service_name = std::string(\"alfred\");"));
  EXPECT_TRUE(Contains(code, "static auto GetState() -> Value {"));
}

TEST(CodegenTest, PooledOptionsAreEmitted) {
  auto code = GenerateFrom(
      "service Workers {\n"
      "  mode: pooled\n"
      "  pool: {min: 1, max: 4, checkout_timeout: 250}\n"
      "  restart: {max_restarts: 2, window: 500}\n"
      "}\n"
      "def ping() { \"pong\" }\n");
  EXPECT_TRUE(Contains(code, "options.pool = {.min = 1, .max = 4};"));
  EXPECT_TRUE(Contains(code, "options.checkout_timeout = std::chrono::milliseconds(250);"));
  EXPECT_TRUE(Contains(code, "options.restart.max_restarts = 2;"));
  EXPECT_TRUE(Contains(code, "options.restart.window = std::chrono::milliseconds(500);"));
}

TEST(CodegenTest, ParameterNamedLikeStateIsRenamed) {
  auto code = GenerateFrom(
      "service S { state_name: db }\n"
      "def f(state) { state }\n");
  EXPECT_TRUE(Contains(code, "const Value& state_"));
}

}  // namespace
}  // namespace servant::codegen
