#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace servant::common {

// Exception type for internal servant errors (generator or runtime bugs, not
// user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in servant.",
                context, detail)) {
  }
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace servant::common
