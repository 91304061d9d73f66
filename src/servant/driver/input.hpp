#pragma once

#include <memory>
#include <optional>
#include <string>

#include "servant/common/source_manager.hpp"
#include "servant/config/runtime_config.hpp"
#include "servant/decl/declaration.hpp"

namespace servant::driver {

// A declaration file read and parsed. The source manager outlives the
// declaration so later diagnostics can still quote it.
struct LoadedDeclaration {
  std::unique_ptr<SourceManager> sources;
  decl::Declaration declaration;
};

// Reads and parses `path`. Prints diagnostics and returns nullopt on
// failure.
auto LoadDeclaration(const std::string& path)
    -> std::optional<LoadedDeclaration>;

// servant.toml nearest to the working directory, or the defaults. Prints a
// diagnostic and returns nullopt when the file is malformed.
auto LoadRuntimeConfig() -> std::optional<config::RuntimeConfig>;

}  // namespace servant::driver
