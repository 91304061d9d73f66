#include "servant/runtime/registry.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace servant::runtime {

auto Registry::Instance() -> Registry& {
  static Registry registry;
  return registry;
}

Registry::Registry() {
  // Touch the logger first so it outlives the registry at exit.
  spdlog::debug("service registry created");
}

Registry::~Registry() {
  std::map<std::string, std::shared_ptr<RuntimeBase>> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }
  entries.clear();
}

auto Registry::Contains(const std::string& name) -> bool {
  std::shared_ptr<RuntimeBase> stale;
  std::lock_guard lock(mutex_);
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    return false;
  }
  if (!it->second->Alive()) {
    stale = std::move(it->second);
    entries_.erase(it);
    return false;
  }
  return true;
}

void Registry::Unregister(const std::string& name, const RuntimeBase* runtime) {
  std::shared_ptr<RuntimeBase> removed;
  std::lock_guard lock(mutex_);
  auto it = entries_.find(name);
  if (it == entries_.end() || it->second.get() != runtime) {
    return;
  }
  removed = std::move(it->second);
  entries_.erase(it);
  spdlog::debug("unregistered service '{}'", name);
}

auto Registry::Names() -> std::vector<std::string> {
  std::vector<std::string> names;
  std::lock_guard lock(mutex_);
  for (const auto& [name, runtime] : entries_) {
    if (runtime->Alive()) {
      names.push_back(name);
    }
  }
  return names;
}

void Registry::Clear() {
  std::map<std::string, std::shared_ptr<RuntimeBase>> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }
  entries.clear();
}

}  // namespace servant::runtime
