#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace servant::test {
namespace {

class DumpTest : public CliTestFixture {};

TEST_F(DumpTest, DeclarationStage) {
  WriteCounter("counter.svc");

  auto result = Run({"dump", "--stage", "decl", "counter.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("service Counter {")) << result.output;
  EXPECT_TRUE(result.Contains("mode: anonymous")) << result.output;
  EXPECT_TRUE(result.Contains("state_name: count")) << result.output;
  EXPECT_TRUE(result.Contains("def add(n)")) << result.output;
  EXPECT_FALSE(result.Contains("function add/1")) << result.output;
}

TEST_F(DumpTest, ImplementationStage) {
  WriteCounter("counter.svc");

  auto result = Run({"dump", "--stage", "impl", "counter.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("function inc/0 (public)")) << result.output;
  EXPECT_TRUE(result.Contains("function add/1 (public)")) << result.output;
  EXPECT_TRUE(result.Contains("with_state")) << result.output;
}

TEST_F(DumpTest, PrivateFunctionsKeepTheirForm) {
  WriteFile(
      "sum.svc",
      "service Sum { state: nil }\n"
      "def sum_to(n) { go(n, 0) }\n"
      "defp go(0, acc) { acc }\n"
      "defp go(n, acc) { go(n - 1, acc + n) }\n");

  auto result = Run({"dump", "--stage", "impl", "sum.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("function go/2 (private)")) << result.output;
  EXPECT_TRUE(result.Contains("defp go(0, acc)")) << result.output;
}

TEST_F(DumpTest, AllStagesByDefault) {
  WriteCounter("counter.svc");

  auto result = Run({"dump", "counter.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("def inc()")) << result.output;
  EXPECT_TRUE(result.Contains("function inc/0 (public)")) << result.output;
}

TEST_F(DumpTest, UnknownStage) {
  WriteCounter("counter.svc");

  auto result = Run({"dump", "--stage", "llvm", "counter.svc"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("unknown stage 'llvm'")) << result.output;
}

TEST_F(DumpTest, LoweringErrorStopsImplementationStage) {
  WriteFile(
      "bad.svc",
      "service Bad { state: 0 }\n"
      "def f() { 1 + set_state(2) }\n");

  auto result = Run({"dump", "--stage", "impl", "bad.svc"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("set_state is not allowed in an operand"))
      << result.output;
}

}  // namespace
}  // namespace servant::test
