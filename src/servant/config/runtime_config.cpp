#include "servant/config/runtime_config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/common/diagnostic/diagnostic.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace servant::config {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ThrowConfigError(
    std::string_view source_name, const std::string& message) {
  throw DiagnosticException(
      Diagnostic::HostError(fmt::format("{}: {}", source_name, message)));
}

// Non-negative integer at `section.key`, if present.
auto ReadCount(
    const toml::table& tbl, std::string_view section, std::string_view key,
    std::string_view source_name) -> std::optional<int64_t> {
  auto node = tbl[section][key];
  if (!node) {
    return std::nullopt;
  }
  auto value = node.value<int64_t>();
  if (!value || !node.is_integer()) {
    ThrowConfigError(
        source_name, fmt::format("'{}.{}' must be an integer", section, key));
  }
  if (*value < 0) {
    ThrowConfigError(
        source_name,
        fmt::format("'{}.{}' must not be negative", section, key));
  }
  return value;
}

void WarnUnknownKeys(
    const toml::table& tbl, std::string_view section,
    std::initializer_list<std::string_view> known,
    std::string_view source_name) {
  const auto* table = tbl[section].as_table();
  if (table == nullptr) {
    return;
  }
  for (const auto& [key, node] : *table) {
    bool found = false;
    for (auto name : known) {
      found = found || key.str() == name;
    }
    if (!found) {
      spdlog::warn(
          "{}: unknown key '{}.{}' ignored", source_name, section, key.str());
    }
  }
}

auto FromTable(const toml::table& tbl, std::string_view source_name)
    -> RuntimeConfig {
  RuntimeConfig config;

  for (auto section : {"runtime", "log"}) {
    if (tbl.contains(section) && !tbl[section].is_table()) {
      ThrowConfigError(
          source_name, fmt::format("'{}' must be a table", section));
    }
  }

  WarnUnknownKeys(
      tbl, "runtime",
      {"call_timeout_ms", "checkout_timeout_ms", "idle_grace_ms",
       "max_restarts", "restart_window_ms"},
      source_name);
  WarnUnknownKeys(tbl, "log", {"level"}, source_name);

  if (auto v = ReadCount(tbl, "runtime", "call_timeout_ms", source_name)) {
    config.call_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = ReadCount(tbl, "runtime", "checkout_timeout_ms", source_name)) {
    config.checkout_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = ReadCount(tbl, "runtime", "idle_grace_ms", source_name)) {
    config.idle_grace = std::chrono::milliseconds(*v);
  }
  if (auto v = ReadCount(tbl, "runtime", "max_restarts", source_name)) {
    if (*v > UINT32_MAX) {
      ThrowConfigError(source_name, "'runtime.max_restarts' is too large");
    }
    config.max_restarts = static_cast<uint32_t>(*v);
  }
  if (auto v = ReadCount(tbl, "runtime", "restart_window_ms", source_name)) {
    config.restart_window = std::chrono::milliseconds(*v);
  }

  if (auto node = tbl["log"]["level"]) {
    auto text = node.value<std::string>();
    if (!text) {
      ThrowConfigError(source_name, "'log.level' must be a string");
    }
    auto level = ParseLogLevel(*text);
    if (!level) {
      ThrowConfigError(
          source_name,
          fmt::format(
              "unknown log level '{}' (expected trace, debug, info, warn, "
              "error, critical or off)",
              *text));
    }
    config.log_level = *level;
  }

  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> RuntimeConfig {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        config_path.string(),
        fmt::format("failed to parse: {}", e.description()));
  }
  RuntimeConfig config = FromTable(tbl, config_path.string());
  config.root_dir = config_path.parent_path();
  spdlog::debug("loaded runtime configuration from {}", config_path.string());
  return config;
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> RuntimeConfig {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    ThrowConfigError(
        source_name, fmt::format("failed to parse: {}", e.description()));
  }
  return FromTable(tbl, source_name);
}

auto LoadNearestConfig(const fs::path& start_dir) -> RuntimeConfig {
  if (auto path = FindConfig(start_dir)) {
    return LoadConfig(*path);
  }
  return RuntimeConfig{};
}

auto ParseLogLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum> {
  if (text == "trace") {
    return spdlog::level::trace;
  }
  if (text == "debug") {
    return spdlog::level::debug;
  }
  if (text == "info") {
    return spdlog::level::info;
  }
  if (text == "warn" || text == "warning") {
    return spdlog::level::warn;
  }
  if (text == "error") {
    return spdlog::level::err;
  }
  if (text == "critical") {
    return spdlog::level::critical;
  }
  if (text == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

auto ToRuntimeOptions(const RuntimeConfig& config) -> runtime::RuntimeOptions {
  runtime::RuntimeOptions options;
  options.call_timeout = config.call_timeout;
  options.checkout_timeout = config.checkout_timeout;
  options.idle_grace = config.idle_grace;
  options.restart = runtime::RestartIntensity{
      .max_restarts = config.max_restarts,
      .window = config.restart_window,
  };
  return options;
}

}  // namespace servant::config
