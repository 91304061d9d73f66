#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "servant/runtime/options.hpp"

namespace servant::config {

inline constexpr std::string_view kConfigFileName = "servant.toml";

// Defaults for every service started by this process. Options written in a
// declaration take precedence.
struct RuntimeConfig {
  std::chrono::milliseconds call_timeout{5000};
  std::chrono::milliseconds checkout_timeout{5000};
  std::chrono::milliseconds idle_grace{30000};
  uint32_t max_restarts = 3;
  std::chrono::milliseconds restart_window{5000};
  spdlog::level::level_enum log_level = spdlog::level::info;

  // Directory where servant.toml was found; empty for built-in defaults
  std::filesystem::path root_dir;
};

// Search for servant.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse servant.toml
// Throws DiagnosticException (host error) on parse errors and bad values
auto LoadConfig(const std::filesystem::path& config_path) -> RuntimeConfig;

// Same as LoadConfig, from text. `source_name` is used in messages.
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> RuntimeConfig;

// FindConfig + LoadConfig, falling back to the defaults.
auto LoadNearestConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> RuntimeConfig;

auto ParseLogLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum>;

auto ToRuntimeOptions(const RuntimeConfig& config) -> runtime::RuntimeOptions;

}  // namespace servant::config
