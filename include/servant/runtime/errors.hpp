#pragma once

#include <stdexcept>
#include <string>

namespace servant::runtime {

// Base of every error that crosses the boundary of a running service.
class ServiceError : public std::runtime_error {
 public:
  explicit ServiceError(const std::string& message)
      : std::runtime_error(message) {
  }
};

// No pool worker became free before the checkout timeout. Retrying later may
// succeed.
class PoolExhausted : public ServiceError {
 public:
  explicit PoolExhausted(const std::string& message) : ServiceError(message) {
  }
};

// The caller stopped waiting. The call itself is not cancelled; the worker
// still completes it and commits its state change.
class CallTimeout : public ServiceError {
 public:
  explicit CallTimeout(const std::string& message) : ServiceError(message) {
  }
};

// The service cannot answer: it was never started, it was stopped, it
// failed past its restart budget, or the worker died serving this request.
class ServiceUnavailable : public ServiceError {
 public:
  explicit ServiceUnavailable(const std::string& message)
      : ServiceError(message) {
  }
};

}  // namespace servant::runtime
