#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace servant {

// Deployment shape of a service.
enum class ServiceMode : uint8_t {
  kInline,     // No worker; the caller threads state explicitly
  kAnonymous,  // One worker reached through the handle returned by Run()
  kNamed,      // One worker registered under a global name
  kPooled,     // Bounded pool of workers, checked out per call
};

inline auto ToString(ServiceMode mode) -> std::string_view {
  switch (mode) {
    case ServiceMode::kInline:
      return "inline";
    case ServiceMode::kAnonymous:
      return "anonymous";
    case ServiceMode::kNamed:
      return "named";
    case ServiceMode::kPooled:
      return "pooled";
  }
  return "unknown";
}

inline auto ParseServiceMode(std::string_view text)
    -> std::optional<ServiceMode> {
  if (text == "inline" || text == "none") {
    return ServiceMode::kInline;
  }
  if (text == "anonymous") {
    return ServiceMode::kAnonymous;
  }
  if (text == "named") {
    return ServiceMode::kNamed;
  }
  if (text == "pooled") {
    return ServiceMode::kPooled;
  }
  return std::nullopt;
}

}  // namespace servant
