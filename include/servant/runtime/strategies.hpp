#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/common/internal_error.hpp"
#include "servant/common/service_mode.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/runtime/lease.hpp"
#include "servant/runtime/options.hpp"
#include "servant/runtime/pool.hpp"
#include "servant/runtime/registry.hpp"
#include "servant/runtime/service_runtime.hpp"
#include "servant/runtime/supervisor.hpp"
#include "servant/runtime/worker.hpp"

namespace servant::runtime {

// No worker: calls run on the caller's thread against a state held here.
// Concurrent callers are serialized. Implementation failures reach the
// caller unchanged.
template <typename S>
class InlineRuntime final : public ServiceRuntime<S> {
 public:
  InlineRuntime(S initial_state, RuntimeOptions options)
      : ServiceRuntime<S>(std::move(options)),
        state_(std::move(initial_state)) {
  }

  [[nodiscard]] auto Mode() const -> ServiceMode override {
    return ServiceMode::kInline;
  }
  [[nodiscard]] auto Alive() const -> bool override {
    return !stopped_;
  }
  void Stop() override {
    stopped_ = true;
  }

 protected:
  auto Submit(Request<S> request) -> Lease override {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      throw ServiceUnavailable(
          fmt::format("{}: service stopped", this->Options().label));
    }
    request.run(state_);
    return {};
  }

 private:
  std::mutex mutex_;
  S state_;
  std::atomic<bool> stopped_{false};
};

// One supervised worker reached through the handle.
template <typename S>
class AnonymousRuntime : public ServiceRuntime<S> {
 public:
  AnonymousRuntime(S initial_state, RuntimeOptions options)
      : ServiceRuntime<S>(std::move(options)),
        supervisor_(
            this->Options().label, std::move(initial_state),
            this->Options().restart, this->Options().on_fatal) {
    supervisor_.StartSlot();
    spdlog::debug("{}: started", this->Options().label);
  }

  ~AnonymousRuntime() override {
    supervisor_.Shutdown();
  }

  AnonymousRuntime(const AnonymousRuntime&) = delete;
  auto operator=(const AnonymousRuntime&) -> AnonymousRuntime& = delete;
  AnonymousRuntime(AnonymousRuntime&&) = delete;
  auto operator=(AnonymousRuntime&&) -> AnonymousRuntime& = delete;

  [[nodiscard]] auto Mode() const -> ServiceMode override {
    return ServiceMode::kAnonymous;
  }
  [[nodiscard]] auto Alive() const -> bool override {
    return !supervisor_.Stopped() && !supervisor_.Failed();
  }
  void Stop() override {
    supervisor_.Shutdown();
  }

  [[nodiscard]] auto GetSupervisor() const -> const Supervisor<S>& {
    return supervisor_;
  }

 protected:
  auto Submit(Request<S> request) -> Lease override {
    supervisor_.Post(std::move(request));
    return {};
  }

 private:
  Supervisor<S> supervisor_;
};

// A single worker registered under a process-wide name. Create through
// MakeRuntime so that registration and creation happen together.
template <typename S>
class NamedRuntime final : public AnonymousRuntime<S> {
 public:
  NamedRuntime(S initial_state, RuntimeOptions options)
      : AnonymousRuntime<S>(std::move(initial_state), std::move(options)) {
  }

  ~NamedRuntime() override {
    Stop();
  }

  NamedRuntime(const NamedRuntime&) = delete;
  auto operator=(const NamedRuntime&) -> NamedRuntime& = delete;
  NamedRuntime(NamedRuntime&&) = delete;
  auto operator=(NamedRuntime&&) -> NamedRuntime& = delete;

  [[nodiscard]] auto Mode() const -> ServiceMode override {
    return ServiceMode::kNamed;
  }
  void Stop() override {
    AnonymousRuntime<S>::Stop();
    if (const auto& name = this->Options().service_name) {
      Registry::Instance().Unregister(*name, this);
    }
  }
};

// Supervised pool; every call checks a worker out for its duration.
template <typename S>
class PooledRuntime final : public ServiceRuntime<S> {
 public:
  PooledRuntime(S initial_state, RuntimeOptions options)
      : ServiceRuntime<S>(std::move(options)),
        supervisor_(
            this->Options().label, std::move(initial_state),
            this->Options().restart, this->Options().on_fatal),
        pool_(
            this->Options().label, this->Options().pool,
            PoolTiming{
                .checkout_timeout = this->Options().checkout_timeout,
                .idle_grace = this->Options().idle_grace,
            },
            supervisor_) {
    spdlog::debug(
        "{}: started pool of {}..{} worker(s)", this->Options().label,
        this->Options().pool.min, this->Options().pool.max);
  }

  ~PooledRuntime() override {
    Stop();
  }

  PooledRuntime(const PooledRuntime&) = delete;
  auto operator=(const PooledRuntime&) -> PooledRuntime& = delete;
  PooledRuntime(PooledRuntime&&) = delete;
  auto operator=(PooledRuntime&&) -> PooledRuntime& = delete;

  [[nodiscard]] auto Mode() const -> ServiceMode override {
    return ServiceMode::kPooled;
  }
  [[nodiscard]] auto Alive() const -> bool override {
    return !pool_.Closed();
  }
  void Stop() override {
    pool_.Shutdown();
    supervisor_.Shutdown();
  }

  [[nodiscard]] auto GetPool() -> Pool<S>& {
    return pool_;
  }

 protected:
  auto Submit(Request<S> request) -> Lease override {
    return pool_.Dispatch(std::move(request));
  }

 private:
  Supervisor<S> supervisor_;
  Pool<S> pool_;
};

// Picks the strategy for `mode`. Named services are looked up in the
// registry first and created only when no live one exists under the name.
template <typename S>
auto MakeRuntime(ServiceMode mode, S initial_state, RuntimeOptions options)
    -> std::shared_ptr<ServiceRuntime<S>> {
  switch (mode) {
    case ServiceMode::kInline:
      return std::make_shared<InlineRuntime<S>>(
          std::move(initial_state), std::move(options));
    case ServiceMode::kAnonymous:
      return std::make_shared<AnonymousRuntime<S>>(
          std::move(initial_state), std::move(options));
    case ServiceMode::kNamed: {
      if (!options.service_name) {
        common::ThrowInternalError(
            "MakeRuntime", "named service started without a service name");
      }
      std::string name = *options.service_name;
      return Registry::Instance().GetOrCreate<S>(
          name, [&]() -> std::shared_ptr<ServiceRuntime<S>> {
            return std::make_shared<NamedRuntime<S>>(
                std::move(initial_state), std::move(options));
          });
    }
    case ServiceMode::kPooled:
      if (options.pool.max == 0 || options.pool.min > options.pool.max) {
        common::ThrowInternalError(
            "MakeRuntime",
            fmt::format(
                "bad pool bounds {}..{}", options.pool.min,
                options.pool.max));
      }
      return std::make_shared<PooledRuntime<S>>(
          std::move(initial_state), std::move(options));
  }
  common::ThrowInternalError("MakeRuntime", "unknown service mode");
}

}  // namespace servant::runtime
