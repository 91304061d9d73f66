#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/runtime/errors.hpp"
#include "servant/runtime/lease.hpp"
#include "servant/runtime/options.hpp"
#include "servant/runtime/supervisor.hpp"
#include "servant/runtime/worker.hpp"

namespace servant::runtime {

struct PoolTiming {
  std::chrono::milliseconds checkout_timeout{5000};
  std::chrono::milliseconds idle_grace{30000};
};

// Bounded set of interchangeable workers.
//
// Starts with `min` workers and never holds more than `max`. Checkout hands
// out the most recently returned idle worker, grows the pool while below
// `max`, and otherwise waits up to the checkout timeout. Checkin returns the
// worker; a worker that died during the call is replaced through the
// supervisor, and workers idle longer than the grace period are retired
// while the pool is above `min`. A worker whose caller timed out stays
// checked out until its request finishes.
template <typename S>
class Pool {
 public:
  struct Borrowed {
    Worker<S>* worker;
    Lease lease;  // Checks the worker back in
  };

  Pool(
      std::string label, PoolBounds bounds, PoolTiming timing,
      Supervisor<S>& supervisor)
      : label_(std::move(label)),
        bounds_(bounds),
        timing_(timing),
        supervisor_(supervisor) {
    std::lock_guard lock(mutex_);
    for (uint32_t i = 0; i < bounds_.min; ++i) {
      idle_.push_back(
          IdleEntry{.worker = Grow(), .since = Clock::now()});
    }
  }

  ~Pool() {
    Shutdown();
  }

  Pool(const Pool&) = delete;
  auto operator=(const Pool&) -> Pool& = delete;
  Pool(Pool&&) = delete;
  auto operator=(Pool&&) -> Pool& = delete;

  // Blocks for at most `timeout`; throws PoolExhausted when it elapses and
  // ServiceUnavailable once the pool is shut down or failed.
  auto CheckoutFor(std::chrono::milliseconds timeout) -> Borrowed {
    Worker<S>* worker = Take(timeout);
    return Borrowed{
        .worker = worker,
        .lease = Lease([this, worker] { Checkin(worker); }),
    };
  }

  // Checks a worker out and posts `request` to it. The worker goes back to
  // the pool once the request has finished and the lease is released,
  // whichever comes last, so a caller that gave up waiting never returns a
  // busy worker.
  auto Dispatch(Request<S> request) -> Lease {
    Worker<S>* worker = Take(timing_.checkout_timeout);
    auto ticket = std::make_shared<Ticket>(Ticket{.worker = worker});
    worker->Post(
        Request<S>{
            .run =
                [this, ticket, run = std::move(request.run)](S& state) {
                  run(state);
                  Finished(*ticket);
                },
            .fail =
                [this, ticket, fail = std::move(request.fail)](
                    std::exception_ptr error) {
                  fail(std::move(error));
                  Finished(*ticket);
                },
        });
    return Lease([this, ticket] { Release(*ticket); });
  }

  auto Checkout() -> Borrowed {
    return CheckoutFor(timing_.checkout_timeout);
  }

  void Checkin(Worker<S>* worker) {
    Reap();
    std::unique_ptr<Worker<S>> dead;
    std::vector<std::unique_ptr<Worker<S>>> retired;
    {
      std::lock_guard lock(mutex_);
      if (!Owns(worker)) {
        // Already dropped by Shutdown.
        return;
      }
      auto now = Clock::now();
      if (worker->Status() == WorkerStatus::kTerminated) {
        dead = Remove(worker);
      } else {
        idle_.push_back(IdleEntry{.worker = worker, .since = now});
        retired = RetireIdle(now);
      }
    }
    if (dead) {
      ReplaceDead(*dead);
    }
    cv_.notify_all();
    // Joined outside the lock.
    dead.reset();
    retired.clear();
  }

  // Stop every worker. A worker that is checked out finishes its current
  // request first; its later checkin is ignored.
  void Shutdown() {
    std::vector<std::unique_ptr<Worker<S>>> workers;
    {
      std::lock_guard lock(mutex_);
      if (closed_ && workers_.empty()) {
        return;
      }
      closed_ = true;
      idle_.clear();
      workers = std::move(workers_);
      workers_.clear();
      for (auto& dead : dead_) {
        workers.push_back(std::move(dead));
      }
      dead_.clear();
    }
    cv_.notify_all();
    workers.clear();
  }

  [[nodiscard]] auto Size() const -> size_t {
    std::lock_guard lock(mutex_);
    return workers_.size();
  }

  [[nodiscard]] auto IdleCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return idle_.size();
  }

  [[nodiscard]] auto Closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct IdleEntry {
    Worker<S>* worker;
    Clock::time_point since;
  };

  // One dispatched request. Guarded by mutex_.
  struct Ticket {
    Worker<S>* worker;
    bool finished = false;
    bool abandoned = false;
  };

  auto Take(std::chrono::milliseconds timeout) -> Worker<S>* {
    auto deadline = Clock::now() + timeout;
    while (true) {
      Reap();
      std::unique_lock lock(mutex_);
      bool ready = cv_.wait_until(lock, deadline, [&] {
        return closed_ || !dead_.empty() || !idle_.empty() ||
               workers_.size() < bounds_.max;
      });
      if (closed_) {
        throw ServiceUnavailable(
            fmt::format("pool '{}' is not running", label_));
      }
      if (!dead_.empty()) {
        // Replacements are charged against the restart budget first.
        continue;
      }
      if (!ready) {
        spdlog::warn(
            "{}: pool exhausted ({} worker(s) busy) after {}ms", label_,
            workers_.size(), timeout.count());
        throw PoolExhausted(
            fmt::format(
                "pool '{}' exhausted: all {} worker(s) busy for {}ms", label_,
                bounds_.max, timeout.count()));
      }

      if (!idle_.empty()) {
        Worker<S>* worker = idle_.back().worker;
        idle_.pop_back();
        return worker;
      }
      return Grow();
    }
  }

  // Caller side of a dispatched request.
  void Release(Ticket& ticket) {
    {
      std::lock_guard lock(mutex_);
      if (!Owns(ticket.worker)) {
        return;
      }
      if (!ticket.finished) {
        ticket.abandoned = true;
        spdlog::debug(
            "{}: worker {} still busy, checkin deferred", label_,
            ticket.worker->Id());
        return;
      }
    }
    Checkin(ticket.worker);
  }

  // Worker side of a dispatched request. Runs on the worker's own thread,
  // so it never joins or replaces workers; a dead worker is parked in dead_
  // for the next caller to reap.
  void Finished(Ticket& ticket) {
    {
      std::lock_guard lock(mutex_);
      ticket.finished = true;
      if (!ticket.abandoned || closed_ || !Owns(ticket.worker)) {
        return;
      }
      if (ticket.worker->Status() == WorkerStatus::kTerminated) {
        dead_.push_back(Remove(ticket.worker));
      } else {
        idle_.push_back(
            IdleEntry{.worker = ticket.worker, .since = Clock::now()});
      }
    }
    cv_.notify_all();
  }

  // Replaces and joins workers that died after their caller left.
  void Reap() {
    std::vector<std::unique_ptr<Worker<S>>> dead;
    {
      std::lock_guard lock(mutex_);
      dead = std::move(dead_);
      dead_.clear();
    }
    for (const auto& worker : dead) {
      ReplaceDead(*worker);
    }
    if (!dead.empty()) {
      cv_.notify_all();
    }
  }

  // Requires mutex_.
  auto Grow() -> Worker<S>* {
    auto worker = supervisor_.Spawn();
    worker->Start();
    Worker<S>* raw = worker.get();
    workers_.push_back(std::move(worker));
    spdlog::debug(
        "{}: pool grew to {} worker(s)", label_, workers_.size());
    return raw;
  }

  // The supervisor may run the fatal handler, so this runs unlocked.
  void ReplaceDead(const Worker<S>& dead) {
    auto replacement =
        supervisor_.Replace(fmt::format("pool worker {} died", dead.Id()));
    std::lock_guard lock(mutex_);
    if (!replacement) {
      if (supervisor_.Failed()) {
        closed_ = true;
      }
      return;
    }
    if (closed_ || workers_.size() >= bounds_.max) {
      return;
    }
    replacement->Start();
    idle_.push_back(
        IdleEntry{.worker = replacement.get(), .since = Clock::now()});
    workers_.push_back(std::move(replacement));
  }

  // Requires mutex_.
  [[nodiscard]] auto Owns(const Worker<S>* worker) const -> bool {
    return std::ranges::any_of(
        workers_, [&](const auto& owned) { return owned.get() == worker; });
  }

  // Requires mutex_.
  auto Remove(Worker<S>* worker) -> std::unique_ptr<Worker<S>> {
    auto it = std::ranges::find_if(
        workers_, [&](const auto& owned) { return owned.get() == worker; });
    if (it == workers_.end()) {
      return nullptr;
    }
    auto owned = std::move(*it);
    workers_.erase(it);
    std::erase_if(idle_, [&](const IdleEntry& e) { return e.worker == worker; });
    return owned;
  }

  // Requires mutex_.
  auto RetireIdle(Clock::time_point now)
      -> std::vector<std::unique_ptr<Worker<S>>> {
    std::vector<std::unique_ptr<Worker<S>>> retired;
    // Oldest idle workers sit at the front.
    while (workers_.size() > bounds_.min && !idle_.empty() &&
           now - idle_.front().since >= timing_.idle_grace) {
      Worker<S>* worker = idle_.front().worker;
      retired.push_back(Remove(worker));
      spdlog::debug(
          "{}: retired idle worker {}, pool at {} worker(s)", label_,
          worker->Id(), workers_.size());
    }
    return retired;
  }

  std::string label_;
  PoolBounds bounds_;
  PoolTiming timing_;
  Supervisor<S>& supervisor_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<Worker<S>>> workers_;
  std::vector<IdleEntry> idle_;  // LIFO: most recent at the back
  std::vector<std::unique_ptr<Worker<S>>> dead_;
  bool closed_ = false;
};

}  // namespace servant::runtime
