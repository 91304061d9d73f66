#include "servant/runtime/supervisor.hpp"

#include <cstddef>

namespace servant::runtime {

auto RestartBudget::Charge(Clock::time_point now) -> bool {
  while (!restarts_.empty() && now - restarts_.front() > intensity_.window) {
    restarts_.pop_front();
  }
  if (restarts_.size() >= intensity_.max_restarts) {
    return false;
  }
  restarts_.push_back(now);
  return true;
}

auto RestartBudget::InWindow(Clock::time_point now) const -> size_t {
  size_t count = 0;
  for (auto at : restarts_) {
    if (now - at <= intensity_.window) {
      ++count;
    }
  }
  return count;
}

}  // namespace servant::runtime
