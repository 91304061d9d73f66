#include "servant/runtime/worker.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace servant::runtime {

auto NextWorkerId() -> WorkerId {
  static std::atomic<WorkerId> next{1};
  return next.fetch_add(1);
}

auto DescribeException(const std::exception_ptr& error) -> std::string {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

auto ToString(WorkerStatus status) -> const char* {
  switch (status) {
    case WorkerStatus::kCreated:
      return "created";
    case WorkerStatus::kRunning:
      return "running";
    case WorkerStatus::kTerminated:
      return "terminated";
  }
  return "unknown";
}

}  // namespace servant::runtime
