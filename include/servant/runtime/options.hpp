#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace servant::runtime {

// Restart budget: at most `max_restarts` restarts within any `window`.
struct RestartIntensity {
  uint32_t max_restarts = 3;
  std::chrono::milliseconds window{5000};
};

struct PoolBounds {
  uint32_t min = 1;
  uint32_t max = 1;
};

struct RuntimeOptions {
  // Used in log messages.
  std::string label = "service";

  // Registry key; required for named services.
  std::optional<std::string> service_name;

  PoolBounds pool;

  std::chrono::milliseconds call_timeout{5000};
  std::chrono::milliseconds checkout_timeout{5000};
  std::chrono::milliseconds idle_grace{30000};
  RestartIntensity restart;

  // Invoked once when the restart budget is exceeded, with the failure that
  // exhausted it. Runs on a runtime thread.
  std::function<void(const std::string& reason)> on_fatal;
};

}  // namespace servant::runtime
