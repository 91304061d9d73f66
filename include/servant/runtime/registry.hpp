#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/runtime/errors.hpp"
#include "servant/runtime/service_runtime.hpp"

namespace servant::runtime {

// Process-wide map from service name to running named service.
//
// An entry whose service has stopped or failed counts as absent and is
// dropped the next time it is looked at. Services displaced from the map are
// destroyed after the registry lock is released.
class Registry {
 public:
  static auto Instance() -> Registry&;

  Registry();
  ~Registry();

  Registry(const Registry&) = delete;
  auto operator=(const Registry&) -> Registry& = delete;
  Registry(Registry&&) = delete;
  auto operator=(Registry&&) -> Registry& = delete;

  // The live service registered as `name`, or the result of `create`,
  // registered in the same critical section.
  template <typename S>
  auto GetOrCreate(
      const std::string& name,
      const std::function<std::shared_ptr<ServiceRuntime<S>>()>& create)
      -> std::shared_ptr<ServiceRuntime<S>> {
    std::shared_ptr<RuntimeBase> stale;
    std::lock_guard lock(mutex_);
    auto it = entries_.find(name);
    if (it != entries_.end()) {
      if (it->second->Alive()) {
        return Typed<S>(name, it->second);
      }
      stale = std::move(it->second);
      entries_.erase(it);
    }
    auto created = create();
    entries_.emplace(name, created);
    spdlog::debug("registered service '{}'", name);
    return created;
  }

  // Throws ServiceUnavailable when nothing live is registered as `name` or
  // it holds a different state type.
  template <typename S>
  auto Lookup(const std::string& name) -> std::shared_ptr<ServiceRuntime<S>> {
    std::shared_ptr<RuntimeBase> stale;
    std::lock_guard lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      throw ServiceUnavailable(fmt::format("no service named '{}'", name));
    }
    if (!it->second->Alive()) {
      stale = std::move(it->second);
      entries_.erase(it);
      throw ServiceUnavailable(
          fmt::format("service '{}' is no longer running", name));
    }
    return Typed<S>(name, it->second);
  }

  // True when a live service is registered as `name`.
  auto Contains(const std::string& name) -> bool;

  // Remove `name` if it still maps to `runtime`.
  void Unregister(const std::string& name, const RuntimeBase* runtime);

  // Names of live services, sorted.
  auto Names() -> std::vector<std::string>;

  // Drop every entry. Services still referenced elsewhere keep running.
  void Clear();

 private:
  template <typename S>
  static auto Typed(
      const std::string& name, const std::shared_ptr<RuntimeBase>& entry)
      -> std::shared_ptr<ServiceRuntime<S>> {
    auto typed = std::dynamic_pointer_cast<ServiceRuntime<S>>(entry);
    if (!typed) {
      throw ServiceUnavailable(
          fmt::format(
              "service '{}' is registered with a different state type", name));
    }
    return typed;
  }

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<RuntimeBase>> entries_;
};

}  // namespace servant::runtime
