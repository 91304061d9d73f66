#include "servant/runtime/pool.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <optional>
#include <stdexcept>
#include <thread>

#include "servant/runtime/errors.hpp"
#include "tests/unit/request_helpers.hpp"

namespace servant::runtime {
namespace {

using test::MakeCrash;
using test::MakeRequest;

class PoolTest : public ::testing::Test {
 protected:
  Supervisor<int> supervisor_{"pool", 0, RestartIntensity{}, {}};
};

TEST_F(PoolTest, StartsWithMinWorkers) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 2, .max = 4}, PoolTiming{}, supervisor_);
  EXPECT_EQ(pool.Size(), 2U);
  EXPECT_EQ(pool.IdleCount(), 2U);
}

TEST_F(PoolTest, GrowsUpToMaxThenExhausts) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 2}, PoolTiming{}, supervisor_);
  auto a = pool.CheckoutFor(std::chrono::milliseconds(50));
  auto b = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_NE(a.worker, b.worker);
  EXPECT_EQ(pool.Size(), 2U);
  EXPECT_EQ(pool.IdleCount(), 0U);

  EXPECT_THROW(
      (void)pool.CheckoutFor(std::chrono::milliseconds(50)), PoolExhausted);
  EXPECT_EQ(pool.Size(), 2U);

  a.lease.Release();
  EXPECT_EQ(pool.IdleCount(), 1U);
  auto c = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_EQ(c.worker, a.worker);
}

TEST_F(PoolTest, CheckoutWaitsForCheckin) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 1}, PoolTiming{}, supervisor_);
  auto held = pool.CheckoutFor(std::chrono::milliseconds(50));
  auto* worker = held.worker;

  auto waiter = std::async(std::launch::async, [&] {
    return pool.CheckoutFor(std::chrono::seconds(5)).worker;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  held.lease.Release();
  EXPECT_EQ(waiter.get(), worker);
}

TEST_F(PoolTest, MostRecentlyReturnedWorkerIsReusedFirst) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 2, .max = 2}, PoolTiming{}, supervisor_);
  auto a = pool.CheckoutFor(std::chrono::milliseconds(50));
  auto b = pool.CheckoutFor(std::chrono::milliseconds(50));
  auto* first_back = a.worker;
  auto* last_back = b.worker;
  a.lease.Release();
  b.lease.Release();

  auto next = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_EQ(next.worker, last_back);
  auto after = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_EQ(after.worker, first_back);
}

TEST_F(PoolTest, IdleWorkersAboveMinAreRetired) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 3},
      PoolTiming{
          .checkout_timeout = std::chrono::milliseconds(50),
          .idle_grace = std::chrono::milliseconds(0)},
      supervisor_);
  auto a = pool.Checkout();
  auto b = pool.Checkout();
  auto c = pool.Checkout();
  EXPECT_EQ(pool.Size(), 3U);

  a.lease.Release();
  b.lease.Release();
  c.lease.Release();
  EXPECT_EQ(pool.Size(), 1U);
  EXPECT_EQ(pool.IdleCount(), 1U);
}

TEST_F(PoolTest, DeadWorkerIsReplacedOnCheckin) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 1}, PoolTiming{}, supervisor_);
  auto borrowed = pool.CheckoutFor(std::chrono::milliseconds(50));
  auto* dead = borrowed.worker;

  auto [crash, crashed] = MakeCrash<int>();
  borrowed.worker->Post(std::move(crash));
  EXPECT_THROW(crashed.get(), ServiceUnavailable);
  borrowed.lease.Release();

  EXPECT_EQ(pool.Size(), 1U);
  EXPECT_EQ(supervisor_.RestartCount(), 1U);

  auto fresh = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_NE(fresh.worker, dead);
  auto [read, value] = MakeRequest<int, int>([](int& s) { return s; });
  fresh.worker->Post(std::move(read));
  EXPECT_EQ(value.get(), 0);
}

// Polls until `done` holds or the test wait elapses.
template <typename Predicate>
auto Eventually(Predicate done) -> bool {
  auto deadline = std::chrono::steady_clock::now() + test::kWait;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

TEST_F(PoolTest, AbandonedRequestKeepsItsWorkerCheckedOut) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 2},
      PoolTiming{.checkout_timeout = std::chrono::milliseconds(50)},
      supervisor_);
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto [slow, slow_value] =
      MakeRequest<int, int>([opened](int& state) {
        opened.wait();
        return state;
      });

  auto lease = pool.Dispatch(std::move(slow));
  lease.Release();
  EXPECT_EQ(pool.IdleCount(), 0U);

  // The next caller gets a new worker rather than the busy one.
  auto other = pool.CheckoutFor(std::chrono::milliseconds(50));
  EXPECT_EQ(pool.Size(), 2U);
  other.lease.Release();
  EXPECT_EQ(pool.IdleCount(), 1U);

  gate.set_value();
  EXPECT_EQ(slow_value.get(), 0);
  EXPECT_TRUE(Eventually([&] { return pool.IdleCount() == 2U; }));
}

TEST_F(PoolTest, DispatchedWorkerReturnsAfterNormalReply) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 1}, PoolTiming{}, supervisor_);
  auto [read, value] = MakeRequest<int, int>([](int& state) { return state; });
  auto lease = pool.Dispatch(std::move(read));
  EXPECT_EQ(value.get(), 0);
  lease.Release();
  EXPECT_TRUE(Eventually([&] { return pool.IdleCount() == 1U; }));
  EXPECT_EQ(pool.Size(), 1U);
}

TEST_F(PoolTest, WorkerDyingAfterItsCallerLeftIsReplaced) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 1}, PoolTiming{}, supervisor_);
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto [doomed, failed] = MakeRequest<int, int>([opened](int&) -> int {
    opened.wait();
    throw std::runtime_error("late crash");
  });

  auto lease = pool.Dispatch(std::move(doomed));
  lease.Release();
  gate.set_value();
  EXPECT_THROW(failed.get(), ServiceUnavailable);

  auto fresh = pool.CheckoutFor(std::chrono::seconds(1));
  EXPECT_EQ(supervisor_.RestartCount(), 1U);
  EXPECT_EQ(pool.Size(), 1U);
  auto [read, value] = MakeRequest<int, int>([](int& s) { return s; });
  fresh.worker->Post(std::move(read));
  EXPECT_EQ(value.get(), 0);
}

TEST_F(PoolTest, ShutdownRejectsCheckouts) {
  Pool<int> pool(
      "pool", PoolBounds{.min = 1, .max = 2}, PoolTiming{}, supervisor_);
  auto held = pool.CheckoutFor(std::chrono::milliseconds(50));
  pool.Shutdown();
  EXPECT_TRUE(pool.Closed());
  EXPECT_EQ(pool.Size(), 0U);
  EXPECT_THROW(
      (void)pool.CheckoutFor(std::chrono::milliseconds(50)),
      ServiceUnavailable);
  // Checkin after shutdown is ignored.
  held.lease.Release();
  EXPECT_EQ(pool.Size(), 0U);
}

}  // namespace
}  // namespace servant::runtime
