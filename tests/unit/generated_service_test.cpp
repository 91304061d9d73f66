// Drives the headers that servantc emits for the files in samples/.

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <vector>

#include "samples/counter_pool.hpp"
#include "samples/fib_cache.hpp"
#include "samples/kv_store.hpp"
#include "samples/tally.hpp"
#include "servant/common/value_ops.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/runtime/registry.hpp"

namespace servant {
namespace {

using generated::counter_pool::CounterPool;
using generated::fib_cache::FibCache;
using generated::named_kv_store::NamedKVStore;
using generated::tally::Tally;

TEST(GeneratedServiceTest, FibCacheRemembersResults) {
  EXPECT_EQ(FibCache::kMode, ServiceMode::kAnonymous);
  auto service = FibCache::Run();
  EXPECT_EQ(FibCache::fib(*service, Value::Int(20)), Value::Int(6765));
  EXPECT_EQ(FibCache::cached(*service), Value::Int(19));
  EXPECT_EQ(FibCache::fib(*service, Value::Int(10)), Value::Int(55));
  EXPECT_EQ(FibCache::cached(*service), Value::Int(19));
}

TEST(GeneratedServiceTest, FibCacheRaiseRestartsTheWorker) {
  auto service = FibCache::Run();
  FibCache::fib(*service, Value::Int(6));
  EXPECT_THROW(
      FibCache::fib(*service, Value::Int(-3)), runtime::ServiceUnavailable);
  EXPECT_EQ(FibCache::cached(*service), Value::Int(0));
}

TEST(GeneratedServiceTest, ImplementationIsCallableDirectly) {
  Value cache = FibCache::InitialState();
  auto reply = generated::fib_cache::impl::fib(cache, Value::Int(7));
  EXPECT_EQ(runtime::ReplyValue(reply), Value::Int(13));
  EXPECT_EQ(cache, Value::Map({}));
}

TEST(GeneratedServiceTest, NamedStoreThroughRegistry) {
  EXPECT_EQ(NamedKVStore::DefaultOptions().service_name, "alfred");
  auto service = NamedKVStore::Run();
  EXPECT_EQ(NamedKVStore::Service(), service);

  EXPECT_TRUE(NamedKVStore::get(Value::String("x")).IsNil());
  NamedKVStore::put(Value::String("x"), Value::Int(3));
  NamedKVStore::put(Value::String("y"), Value::Int(4));
  EXPECT_EQ(NamedKVStore::get(Value::String("x")), Value::Int(3));
  EXPECT_EQ(NamedKVStore::count(), Value::Int(2));
  EXPECT_EQ(NamedKVStore::remove(Value::String("x")), Value::Bool(true));
  EXPECT_EQ(
      NamedKVStore::GetState(),
      Value::Map({{Value::String("y"), Value::Int(4)}}));

  service->Stop();
  EXPECT_THROW(NamedKVStore::count(), runtime::ServiceUnavailable);
  runtime::Registry::Instance().Clear();
}

TEST(GeneratedServiceTest, CounterPoolStaysWithinBounds) {
  auto options = CounterPool::DefaultOptions();
  EXPECT_EQ(options.pool.min, 1U);
  EXPECT_EQ(options.pool.max, 2U);
  EXPECT_EQ(options.checkout_timeout, std::chrono::milliseconds(1000));

  auto service = CounterPool::Run();
  std::vector<std::future<Value>> hits;
  for (int i = 0; i < 4; ++i) {
    hits.push_back(std::async(std::launch::async, [&] {
      return CounterPool::hit(*service);
    }));
  }
  int64_t total = 0;
  for (auto& hit : hits) {
    total += hit.get().AsInt();
  }
  // Each worker counts its own hits; at most two workers exist.
  EXPECT_GE(total, 4);
  EXPECT_LE(total, 10);

  EXPECT_EQ(CounterPool::label(*service, Value::Int(0)), Value::String("cold"));
  EXPECT_EQ(CounterPool::label(*service, Value::Int(9)), Value::String("warm"));
  EXPECT_EQ(CounterPool::label(*service, Value::Int(10)), Value::String("hot"));
}

TEST(GeneratedServiceTest, TallyKeepsStateWithCaller) {
  EXPECT_EQ(Tally::kMode, ServiceMode::kInline);
  Value tally = Tally::InitialState();
  EXPECT_TRUE(Tally::mean(tally).IsNil());
  EXPECT_EQ(Tally::add(tally, Value::Int(10)), Value::Int(10));
  EXPECT_EQ(Tally::add(tally, Value::Int(20)), Value::Int(30));
  EXPECT_EQ(Tally::mean(tally), Value::Int(15));
  EXPECT_EQ(ops::Get(tally, Value::String("count")), Value::Int(2));
}

TEST(GeneratedServiceTest, BadOperandsLeaveStateUnchanged) {
  Value tally = Tally::InitialState();
  EXPECT_THROW(Tally::add(tally, Value::String("x")), EvalError);
  EXPECT_EQ(tally, Tally::InitialState());
}

}  // namespace
}  // namespace servant
