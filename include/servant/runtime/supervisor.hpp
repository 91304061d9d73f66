#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/runtime/mailbox.hpp"
#include "servant/runtime/options.hpp"
#include "servant/runtime/worker.hpp"

namespace servant::runtime {

// Sliding-window restart accounting.
class RestartBudget {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RestartBudget(RestartIntensity intensity) : intensity_(intensity) {
  }

  // Charges one restart at `now`. Returns false when that restart would
  // exceed the budget.
  auto Charge(Clock::time_point now) -> bool;

  // Restarts charged within the window ending at `now`.
  [[nodiscard]] auto InWindow(Clock::time_point now) const -> size_t;

  [[nodiscard]] auto Intensity() const -> const RestartIntensity& {
    return intensity_;
  }

 private:
  RestartIntensity intensity_;
  std::deque<Clock::time_point> restarts_;
};

// Keeps workers of one service alive.
//
// Single-worker services hand the supervisor a slot (StartSlot): the
// supervisor owns that worker, watches its exit events on a monitor thread,
// and replaces it after a crash with a fresh worker on the same mailbox,
// starting again from the initial state. Pools own their workers and ask for
// a replacement synchronously (Replace).
//
// Exceeding the restart budget is fatal: the slot mailbox is closed, every
// pending and later call fails with ServiceUnavailable, and the fatal
// handler runs once.
template <typename S>
class Supervisor {
 public:
  using FatalHandler = std::function<void(const std::string& reason)>;

  Supervisor(
      std::string label, S initial_state, RestartIntensity intensity,
      FatalHandler on_fatal)
      : label_(std::move(label)),
        initial_state_(std::move(initial_state)),
        budget_(intensity),
        on_fatal_(std::move(on_fatal)) {
  }

  ~Supervisor() {
    Shutdown();
  }

  Supervisor(const Supervisor&) = delete;
  auto operator=(const Supervisor&) -> Supervisor& = delete;
  Supervisor(Supervisor&&) = delete;
  auto operator=(Supervisor&&) -> Supervisor& = delete;

  // Start the supervised single worker from the initial state. Call once.
  void StartSlot() {
    std::lock_guard lock(mutex_);
    slot_mailbox_ = std::make_shared<RequestMailbox<S>>();
    slot_worker_ = MakeSlotWorker(initial_state_);
    slot_worker_->Start();
    monitor_ = std::jthread([this](std::stop_token stop) { Monitor(stop); });
  }

  // Queue a request for the slot worker. Fails it with ServiceUnavailable
  // once the service is stopped or failed.
  void Post(Request<S> request) {
    std::shared_ptr<RequestMailbox<S>> mailbox;
    {
      std::lock_guard lock(mutex_);
      mailbox = slot_mailbox_;
    }
    if (!mailbox || !mailbox->Push(request)) {
      request.fail(
          std::make_exception_ptr(ServiceUnavailable(
              fmt::format("service '{}' is not running", label_))));
    }
  }

  // A new pool worker with its own mailbox, not yet started.
  auto Spawn() -> std::unique_ptr<Worker<S>> {
    return std::make_unique<Worker<S>>(
        initial_state_, std::make_shared<RequestMailbox<S>>(), true);
  }

  // Replacement for a dead pool worker, charged against the restart budget.
  // Returns nullptr and turns fatal when the budget is exhausted.
  auto Replace(const std::string& reason) -> std::unique_ptr<Worker<S>> {
    {
      std::lock_guard lock(mutex_);
      if (failed_ || stopping_) {
        return nullptr;
      }
      if (budget_.Charge(RestartBudget::Clock::now())) {
        ++restarts_;
        spdlog::info(
            "{}: replacing pool worker ({} restart(s))", label_, restarts_);
        return Spawn();
      }
      failed_ = true;
    }
    Fatal(reason);
    return nullptr;
  }

  // Stop the slot worker and fail whatever is still queued. Idempotent.
  void Shutdown() {
    std::unique_ptr<Worker<S>> worker;
    std::shared_ptr<RequestMailbox<S>> mailbox;
    {
      std::lock_guard lock(mutex_);
      if (stopping_) {
        return;
      }
      stopping_ = true;
      worker = std::move(slot_worker_);
      mailbox = slot_mailbox_;
    }
    if (monitor_.joinable()) {
      monitor_.request_stop();
      monitor_.join();
    }
    if (mailbox) {
      FailPending<S>(
          mailbox->Close(), fmt::format("service '{}' stopped", label_));
    }
    worker.reset();
  }

  [[nodiscard]] auto Failed() const -> bool {
    std::lock_guard lock(mutex_);
    return failed_;
  }

  [[nodiscard]] auto Stopped() const -> bool {
    std::lock_guard lock(mutex_);
    return stopping_;
  }

  [[nodiscard]] auto RestartCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return restarts_;
  }

  // Id of the current slot worker; nullopt when there is none.
  [[nodiscard]] auto SlotWorkerId() const -> std::optional<WorkerId> {
    std::lock_guard lock(mutex_);
    if (!slot_worker_) {
      return std::nullopt;
    }
    return slot_worker_->Id();
  }

  [[nodiscard]] auto InitialState() const -> const S& {
    return initial_state_;
  }

 private:
  auto MakeSlotWorker(S state) -> std::unique_ptr<Worker<S>> {
    return std::make_unique<Worker<S>>(
        std::move(state), slot_mailbox_, false,
        [this](const ExitEvent& event) {
          ExitEvent copy = event;
          events_.Push(copy);
        });
  }

  void Monitor(std::stop_token stop) {
    while (auto event = events_.Pop(stop)) {
      HandleExit(*event);
    }
  }

  void HandleExit(const ExitEvent& event) {
    std::unique_ptr<Worker<S>> dead;
    {
      std::lock_guard lock(mutex_);
      if (stopping_ || failed_) {
        return;
      }
      dead = std::move(slot_worker_);
    }
    // The crashed thread has already left its loop; joining is immediate.
    dead.reset();

    std::unique_lock lock(mutex_);
    if (stopping_) {
      return;
    }
    if (budget_.Charge(RestartBudget::Clock::now())) {
      ++restarts_;
      spdlog::info(
          "{}: restarting worker {} after crash ({} restart(s))", label_,
          event.worker, restarts_);
      slot_worker_ = MakeSlotWorker(initial_state_);
      slot_worker_->Start();
      return;
    }
    failed_ = true;
    auto mailbox = slot_mailbox_;
    lock.unlock();

    FailPending<S>(
        mailbox->Close(),
        fmt::format("service '{}' failed: {}", label_, event.reason));
    Fatal(event.reason);
  }

  void Fatal(const std::string& reason) {
    const auto& intensity = budget_.Intensity();
    spdlog::error(
        "{}: restart budget of {} in {}ms exceeded; giving up: {}", label_,
        intensity.max_restarts, intensity.window.count(), reason);
    if (on_fatal_) {
      on_fatal_(reason);
    }
  }

  std::string label_;
  S initial_state_;
  RestartBudget budget_;
  FatalHandler on_fatal_;

  mutable std::mutex mutex_;
  std::shared_ptr<RequestMailbox<S>> slot_mailbox_;
  std::unique_ptr<Worker<S>> slot_worker_;
  size_t restarts_ = 0;
  bool failed_ = false;
  bool stopping_ = false;

  Mailbox<ExitEvent> events_;
  std::jthread monitor_;
};

}  // namespace servant::runtime
