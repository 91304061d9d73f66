#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <utility>

#include <fmt/core.h>

#include "servant/common/service_mode.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/runtime/lease.hpp"
#include "servant/runtime/options.hpp"
#include "servant/runtime/reply.hpp"
#include "servant/runtime/worker.hpp"

namespace servant::runtime {

// State-type independent view of a running service, as kept by the
// registry.
class RuntimeBase {
 public:
  RuntimeBase() = default;
  virtual ~RuntimeBase() = default;

  RuntimeBase(const RuntimeBase&) = delete;
  auto operator=(const RuntimeBase&) -> RuntimeBase& = delete;
  RuntimeBase(RuntimeBase&&) = delete;
  auto operator=(RuntimeBase&&) -> RuntimeBase& = delete;

  [[nodiscard]] virtual auto Mode() const -> ServiceMode = 0;
  [[nodiscard]] virtual auto Alive() const -> bool = 0;
  virtual void Stop() = 0;
};

// A running service holding state of type S. The deployment strategy
// (inline, one worker, named worker, pool) is fixed at construction; see
// MakeRuntime.
template <typename S>
class ServiceRuntime : public RuntimeBase {
 public:
  // An implementation function with its arguments already bound.
  template <typename R>
  using Impl = std::function<NormalizedReply<R, S>(const S&)>;

  explicit ServiceRuntime(RuntimeOptions options)
      : options_(std::move(options)) {
  }

  // Run `impl` against the service state and wait for the reply. Throws
  // CallTimeout, PoolExhausted or ServiceUnavailable.
  template <typename R>
  auto Call(Impl<R> impl) -> R {
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();
    Request<S> request{
        .run =
            [impl = std::move(impl), promise](S& state) {
              R result = Commit<R, S>(impl(state), state);
              promise->set_value(std::move(result));
            },
        .fail =
            [promise](std::exception_ptr error) {
              promise->set_exception(std::move(error));
            },
    };

    Lease lease = Submit(std::move(request));
    if (future.wait_for(options_.call_timeout) == std::future_status::timeout) {
      throw CallTimeout(
          fmt::format(
              "{}: no reply within {}ms", options_.label,
              options_.call_timeout.count()));
    }
    return future.get();
  }

  // Snapshot of the current state, read through the same queue as calls.
  auto GetState() -> S {
    return Call<S>([](const S& state) -> NormalizedReply<S, S> {
      return Plain<S>{.value = state};
    });
  }

  [[nodiscard]] auto Options() const -> const RuntimeOptions& {
    return options_;
  }

 protected:
  // Hand the request to whatever serves it. The returned lease is held until
  // the caller has its reply.
  virtual auto Submit(Request<S> request) -> Lease = 0;

 private:
  RuntimeOptions options_;
};

}  // namespace servant::runtime
