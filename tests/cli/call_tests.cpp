#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace servant::test {
namespace {

class CallTest : public CliTestFixture {};

TEST_F(CallTest, PrintsOneReplyPerCall) {
  WriteCounter("counter.svc");

  auto result =
      Run({"call", "counter.svc", "inc()", "add(5)", "inc()", "get()"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "1\n5\n7\n7\n");
}

TEST_F(CallTest, InlineService) {
  WriteFile(
      "tally.svc",
      "service Tally {\n"
      "  mode: inline\n"
      "  state: {total: 0}\n"
      "}\n"
      "def add(n) { set_state({total: state[\"total\"] + n}) { n } }\n"
      "def total() { state[\"total\"] }\n");

  auto result = Run({"call", "tally.svc", "add(2)", "add(3)", "total()"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "2\n3\n5\n");
}

TEST_F(CallTest, NamedServiceThroughRegistry) {
  WriteFile(
      "kv.svc",
      "service Store {\n"
      "  mode: named\n"
      "  state: {}\n"
      "  service_name: store\n"
      "}\n"
      "def put(key, value) { set_state(put(state, key, value)) { value } }\n"
      "def get(key) { state[key] }\n");

  auto result = Run({"call", "kv.svc", "put(\"a\", 1)", "get(\"a\")"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "1\n1\n");
}

TEST_F(CallTest, PooledService) {
  WriteFile(
      "pool.svc",
      "service Pool {\n"
      "  mode: pooled\n"
      "  state: 0\n"
      "  pool: {min: 1, max: 2}\n"
      "}\n"
      "def label(0) { \"cold\" }\n"
      "def label(_) { \"hot\" }\n");

  auto result = Run({"call", "pool.svc", "label(0)", "label(4)"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "\"cold\"\n\"hot\"\n");
}

TEST_F(CallTest, RaiseStopsTheRun) {
  WriteFile(
      "fragile.svc",
      "service Fragile { state: 0 }\n"
      "def boom() { raise(\"boom\") }\n"
      "def ok() { 1 }\n");

  auto result = Run({"call", "fragile.svc", "ok()", "boom()", "ok()"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("1\n")) << result.output;
  EXPECT_TRUE(result.Contains("boom(): ")) << result.output;
  EXPECT_TRUE(result.Contains("boom")) << result.output;
}

TEST_F(CallTest, UnknownFunctionSuggestsArity) {
  WriteCounter("counter.svc");

  auto result = Run({"call", "counter.svc", "add()"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("service 'Counter' has no function add/0"))
      << result.output;
  EXPECT_TRUE(result.Contains("add/1 is defined")) << result.output;
}

TEST_F(CallTest, MalformedCall) {
  WriteCounter("counter.svc");

  auto result = Run({"call", "counter.svc", "inc("});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("<call>:1:")) << result.output;
}

TEST_F(CallTest, RequiresCalls) {
  WriteCounter("counter.svc");

  auto result = Run({"call", "counter.svc"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("no calls given")) << result.output;
}

TEST_F(CallTest, VerboseLogsAtDebugLevel) {
  WriteCounter("counter.svc");

  auto result = Run({"-v", "call", "counter.svc", "inc()"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("[debug]")) << result.output;
}

}  // namespace
}  // namespace servant::test
