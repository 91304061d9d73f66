#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace servant::test {
namespace {

class EmitTest : public CliTestFixture {};

TEST_F(EmitTest, WritesHeaderToStdout) {
  WriteCounter("counter.svc");

  auto result = Run({"emit", "counter.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("// Generated by servantc from counter.svc."))
      << result.output;
  EXPECT_TRUE(result.Contains("#pragma once")) << result.output;
  EXPECT_TRUE(result.Contains("namespace servant::generated::counter {"))
      << result.output;
  EXPECT_TRUE(result.Contains("class Counter {")) << result.output;
  EXPECT_TRUE(result.Contains("static auto inc(")) << result.output;
  EXPECT_TRUE(result.Contains("static auto add(")) << result.output;
}

TEST_F(EmitTest, WritesHeaderToFile) {
  WriteCounter("counter.svc");

  auto result = Run({"emit", "-o", "counter.hpp", "counter.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  ASSERT_TRUE(FileExists("counter.hpp"));
  auto header = ReadFile("counter.hpp");
  EXPECT_NE(header.find("class Counter {"), std::string::npos);
  EXPECT_EQ(result.output.find("class Counter {"), std::string::npos);
}

TEST_F(EmitTest, EscapesKeywordNames) {
  WriteFile(
      "store.svc",
      "service Store { state: {} }\n"
      "def delete(key) { set_state(delete(state, key)) { key } }\n");

  auto result = Run({"emit", "store.svc"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("static auto delete_(")) << result.output;
}

TEST_F(EmitTest, RefusesInvalidDeclaration) {
  WriteFile(
      "bad.svc",
      "service Bad { state: 0 }\n"
      "def f() { nowhere() }\n");

  auto result = Run({"emit", "-o", "bad.hpp", "bad.svc"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("unknown function 'nowhere'")) << result.output;
  EXPECT_FALSE(FileExists("bad.hpp"));
}

TEST_F(EmitTest, UnwritableOutput) {
  WriteCounter("counter.svc");

  auto result = Run({"emit", "-o", "no_such_dir/counter.hpp", "counter.svc"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("cannot write 'no_such_dir/counter.hpp'"))
      << result.output;
}

}  // namespace
}  // namespace servant::test
