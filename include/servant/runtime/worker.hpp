#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/runtime/errors.hpp"
#include "servant/runtime/mailbox.hpp"

namespace servant::runtime {

using WorkerId = uint64_t;

// Process-wide unique worker ids, starting at 1.
auto NextWorkerId() -> WorkerId;

// Message text of an in-flight exception, for logs and exit events.
auto DescribeException(const std::exception_ptr& error) -> std::string;

enum class WorkerStatus : uint8_t {
  kCreated,
  kRunning,
  kTerminated,
};

auto ToString(WorkerStatus status) -> const char*;

// One unit of work for a worker. `run` computes the reply from the state,
// commits any state change and answers the caller; if it throws, nothing
// was committed and the worker terminates. `fail` answers the caller with an
// error instead.
template <typename S>
struct Request {
  std::function<void(S&)> run;
  std::function<void(std::exception_ptr)> fail;
};

template <typename S>
using RequestMailbox = Mailbox<Request<S>>;

// Reports that a worker terminated abnormally.
struct ExitEvent {
  WorkerId worker;
  std::string reason;
};

// Fails every request in `pending` with ServiceUnavailable.
template <typename S>
void FailPending(std::vector<Request<S>> pending, const std::string& reason) {
  for (auto& request : pending) {
    request.fail(std::make_exception_ptr(ServiceUnavailable(reason)));
  }
}

// A thread that owns one state value and serves requests from a mailbox
// strictly one at a time.
//
// Created -> Running on Start(). Running -> Terminated when a request throws
// (a crash; `on_exit` is told) or on Stop(). The state lives only on the
// worker's thread; the only way to read it is a request.
//
// The mailbox may be shared with a replacement worker. With
// `close_mailbox_on_exit` the worker closes it on termination and fails what
// is still queued; otherwise queued requests wait for the next worker.
template <typename S>
class Worker {
 public:
  using ExitHandler = std::function<void(const ExitEvent&)>;

  Worker(
      S state, std::shared_ptr<RequestMailbox<S>> mailbox,
      bool close_mailbox_on_exit, ExitHandler on_exit = {})
      : id_(NextWorkerId()),
        state_(std::move(state)),
        mailbox_(std::move(mailbox)),
        close_mailbox_on_exit_(close_mailbox_on_exit),
        on_exit_(std::move(on_exit)) {
  }

  ~Worker() {
    Stop();
  }

  Worker(const Worker&) = delete;
  auto operator=(const Worker&) -> Worker& = delete;
  Worker(Worker&&) = delete;
  auto operator=(Worker&&) -> Worker& = delete;

  void Start() {
    status_ = WorkerStatus::kRunning;
    thread_ = std::jthread([this](std::stop_token stop) { Loop(stop); });
  }

  // Finishes the request in progress, then terminates. Must not be called
  // from the worker's own thread.
  void Stop() {
    if (thread_.joinable()) {
      thread_.request_stop();
      thread_.join();
    }
    status_ = WorkerStatus::kTerminated;
  }

  // Queue a request. On a closed mailbox the request is failed right away.
  void Post(Request<S> request) {
    if (!mailbox_->Push(request)) {
      request.fail(
          std::make_exception_ptr(
              ServiceUnavailable(fmt::format("worker {} is closed", id_))));
    }
  }

  [[nodiscard]] auto Id() const -> WorkerId {
    return id_;
  }
  [[nodiscard]] auto Status() const -> WorkerStatus {
    return status_;
  }
  [[nodiscard]] auto Busy() const -> bool {
    return busy_;
  }
  [[nodiscard]] auto GetMailbox() const
      -> const std::shared_ptr<RequestMailbox<S>>& {
    return mailbox_;
  }

 private:
  void Loop(std::stop_token stop) {
    spdlog::debug("worker {} started", id_);
    while (auto request = mailbox_->Pop(stop)) {
      busy_ = true;
      try {
        request->run(state_);
      } catch (...) {
        Crash(*request, std::current_exception());
        return;
      }
      busy_ = false;
    }
    status_ = WorkerStatus::kTerminated;
    if (close_mailbox_on_exit_) {
      FailPending<S>(
          mailbox_->Close(), fmt::format("worker {} stopped", id_));
    }
    spdlog::debug("worker {} stopped", id_);
  }

  void Crash(Request<S>& request, const std::exception_ptr& error) {
    std::string reason = DescribeException(error);
    // Terminated is visible before the caller hears about the failure.
    status_ = WorkerStatus::kTerminated;
    busy_ = false;
    spdlog::warn("worker {} crashed: {}", id_, reason);
    request.fail(
        std::make_exception_ptr(ServiceUnavailable(
            fmt::format("worker {} terminated: {}", id_, reason))));
    if (close_mailbox_on_exit_) {
      FailPending<S>(
          mailbox_->Close(),
          fmt::format("worker {} terminated: {}", id_, reason));
    }
    if (on_exit_) {
      on_exit_(ExitEvent{.worker = id_, .reason = std::move(reason)});
    }
  }

  WorkerId id_;
  S state_;
  std::shared_ptr<RequestMailbox<S>> mailbox_;
  bool close_mailbox_on_exit_;
  ExitHandler on_exit_;
  std::atomic<WorkerStatus> status_{WorkerStatus::kCreated};
  std::atomic<bool> busy_{false};
  std::jthread thread_;
};

}  // namespace servant::runtime
