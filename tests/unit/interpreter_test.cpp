#include "servant/impl/interpreter.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "servant/common/source_manager.hpp"
#include "servant/common/value.hpp"
#include "servant/common/value_ops.hpp"
#include "servant/frontend/parser.hpp"
#include "servant/lowering/impl_generator.hpp"

namespace servant::impl {
namespace {

auto ReadSample(const std::string& name) -> std::string {
  std::ifstream file(std::string(SERVANT_SAMPLES_DIR) + "/" + name);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

class InterpreterTest : public ::testing::Test {
 protected:
  auto Load(const std::string& text) -> Interpreter {
    FileId file = sources_.AddFile("test.svc", text);
    auto parsed =
        frontend::ParseDeclaration(file, sources_.GetFile(file)->content);
    if (!parsed) {
      ADD_FAILURE() << parsed.error().primary.message;
      return Interpreter(std::make_shared<const Module>());
    }
    auto module = lowering::LowerDeclaration(std::move(*parsed));
    if (!module) {
      ADD_FAILURE() << module.error().primary.message;
      return Interpreter(std::make_shared<const Module>());
    }
    return Interpreter(std::make_shared<const Module>(std::move(*module)));
  }

 private:
  SourceManager sources_;
};

TEST_F(InterpreterTest, PlainReplyKeepsState) {
  auto interp = Load("service S {}\ndef f(x) { x + 1 }\n");
  auto reply = interp.Invoke("f", Value::Int(7), {Value::Int(2)});
  ASSERT_TRUE(std::holds_alternative<runtime::Plain<Value>>(reply));
  EXPECT_EQ(runtime::ReplyValue(reply), Value::Int(3));
}

TEST_F(InterpreterTest, SetStateReply) {
  auto interp = Load(
      "service S { state: 0 }\n"
      "def add(n) { set_state(state + n) { state } }\n");
  Value state = Value::Int(5);
  Value result = runtime::Commit(interp.Invoke("add", state, {Value::Int(3)}), state);
  EXPECT_EQ(result, Value::Int(5));
  EXPECT_EQ(state, Value::Int(8));
}

TEST_F(InterpreterTest, SetStateWithoutResultRepliesNewState) {
  auto interp = Load("service S {}\ndef reset() { set_state(0) }\n");
  Value state = Value::Int(9);
  EXPECT_EQ(runtime::Commit(interp.Invoke("reset", state, {}), state), Value::Int(0));
  EXPECT_EQ(state, Value::Int(0));
}

TEST_F(InterpreterTest, ClausesAreTriedInOrder) {
  auto interp = Load(
      "service S {}\n"
      "def label(0) { \"zero\" }\n"
      "def label(n) when n < 10 { \"small\" }\n"
      "def label(_) { \"large\" }\n");
  auto label = [&](int64_t n) {
    return runtime::ReplyValue(interp.Invoke("label", Value::Nil(), {Value::Int(n)}));
  };
  EXPECT_EQ(label(0), Value::String("zero"));
  EXPECT_EQ(label(4), Value::String("small"));
  EXPECT_EQ(label(40), Value::String("large"));
}

TEST_F(InterpreterTest, NoMatchingClauseIsAnEvalError) {
  auto interp = Load("service S {}\ndef only(1) { true }\n");
  try {
    (void)interp.Invoke("only", Value::Nil(), {Value::Int(2)});
    FAIL() << "expected EvalError";
  } catch (const EvalError& e) {
    EXPECT_EQ(std::string(e.what()), "no clause of only/1 matches (2)");
  }
}

TEST_F(InterpreterTest, DeepHelperRecursionIsAnEvalError) {
  auto interp = Load(
      "service S {}\n"
      "defp down(n) { if n == 0 { 0 } else { down(n - 1) } }\n"
      "def go(n) { down(n) }\n");
  EXPECT_EQ(
      runtime::ReplyValue(interp.Invoke("go", Value::Nil(), {Value::Int(10)})),
      Value::Int(0));
  try {
    (void)interp.Invoke("go", Value::Nil(), {Value::Int(50000)});
    FAIL() << "expected EvalError";
  } catch (const EvalError& e) {
    EXPECT_NE(
        std::string(e.what()).find("recursion too deep in down/1"),
        std::string::npos);
  }
  EXPECT_EQ(ops::CallDepthGuard::Depth(), 0U);
  EXPECT_EQ(
      runtime::ReplyValue(interp.Invoke("go", Value::Nil(), {Value::Int(500)})),
      Value::Int(0));
}

TEST_F(InterpreterTest, TailIfWithoutElseRepliesNil) {
  auto interp = Load("service S {}\ndef f(x) { if x { 1 } }\n");
  auto reply = interp.Invoke("f", Value::Nil(), {Value::Bool(false)});
  EXPECT_TRUE(runtime::ReplyValue(reply).IsNil());
}

TEST_F(InterpreterTest, LogicalOperatorsShortCircuit) {
  auto interp = Load(
      "service S {}\n"
      "def f(x) { x != 0 && 10 / x > 1 }\n");
  EXPECT_EQ(
      runtime::ReplyValue(interp.Invoke("f", Value::Nil(), {Value::Int(0)})),
      Value::Bool(false));
  EXPECT_EQ(
      runtime::ReplyValue(interp.Invoke("f", Value::Nil(), {Value::Int(2)})),
      Value::Bool(true));
}

TEST_F(InterpreterTest, RaiseAbortsTheCall) {
  auto interp = Load("service S {}\ndef f() { raise(\"boom\") }\n");
  EXPECT_THROW((void)interp.Invoke("f", Value::Nil(), {}), EvalError);
}

TEST_F(InterpreterTest, UnknownPublicFunction) {
  auto interp = Load("service S {}\ndef f() { 1 }\n");
  EXPECT_THROW((void)interp.Invoke("f", Value::Nil(), {Value::Int(1)}), EvalError);
  EXPECT_THROW((void)interp.Invoke("g", Value::Nil(), {}), EvalError);
}

TEST_F(InterpreterTest, CallHelperDirectly) {
  auto interp = Load(
      "service S {}\n"
      "def f(x) { twice(x) }\n"
      "defp twice(x) { x * 2 }\n");
  EXPECT_EQ(interp.CallHelper("twice", {Value::Int(21)}), Value::Int(42));
  EXPECT_THROW((void)interp.CallHelper("f", {Value::Int(1)}), EvalError);
}

TEST_F(InterpreterTest, MemoizedFibonacci) {
  auto interp = Load(ReadSample("fib_cache.svc"));
  Value cache = Value::Map({});

  Value fib20 = runtime::Commit(interp.Invoke("fib", cache, {Value::Int(20)}), cache);
  EXPECT_EQ(fib20, Value::Int(6765));
  EXPECT_EQ(runtime::ReplyValue(interp.Invoke("cached", cache, {})), Value::Int(19));

  Value fib10 = runtime::Commit(interp.Invoke("fib", cache, {Value::Int(10)}), cache);
  EXPECT_EQ(fib10, Value::Int(55));
  EXPECT_EQ(ops::Get(cache, Value::Int(10)), Value::Int(55));
}

TEST_F(InterpreterTest, NegativeFibonacciRaises) {
  auto interp = Load(ReadSample("fib_cache.svc"));
  try {
    (void)interp.Invoke("fib", Value::Map({}), {Value::Int(-1)});
    FAIL() << "expected EvalError";
  } catch (const EvalError& e) {
    EXPECT_EQ(std::string(e.what()), "fib of a negative number");
  }
}

TEST_F(InterpreterTest, EvaluationIsPure) {
  auto interp = Load(ReadSample("kv_store.svc"));
  Value state = Value::Map({{Value::String("a"), Value::Int(1)}});
  Value before = state;

  auto first = interp.Invoke("put", state, {Value::String("b"), Value::Int(2)});
  auto second = interp.Invoke("put", state, {Value::String("b"), Value::Int(2)});
  EXPECT_EQ(state, before);
  EXPECT_EQ(runtime::ReplyValue(first), runtime::ReplyValue(second));

  const auto& with_state = std::get<runtime::WithState<Value, Value>>(first);
  EXPECT_EQ(with_state.value, Value::Int(2));
  EXPECT_EQ(
      with_state.new_state,
      Value::Map(
          {{Value::String("a"), Value::Int(1)},
           {Value::String("b"), Value::Int(2)}}));
}

}  // namespace
}  // namespace servant::impl
