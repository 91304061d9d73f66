#include "input.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "print.hpp"
#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/frontend/parser.hpp"

namespace servant::driver {

auto LoadDeclaration(const std::string& path)
    -> std::optional<LoadedDeclaration> {
  std::ifstream in(path);
  if (!in) {
    PrintError(fmt::format("cannot open file '{}'", path));
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto sources = std::make_unique<SourceManager>();
  FileId file = sources->AddFile(path, buffer.str());
  spdlog::debug("parsing {}", path);

  auto declaration =
      frontend::ParseDeclaration(file, sources->GetFile(file)->content);
  if (!declaration) {
    PrintDiagnostic(declaration.error(), sources.get());
    return std::nullopt;
  }
  return LoadedDeclaration{
      .sources = std::move(sources),
      .declaration = std::move(*declaration),
  };
}

auto LoadRuntimeConfig() -> std::optional<config::RuntimeConfig> {
  try {
    return config::LoadNearestConfig();
  } catch (const DiagnosticException& e) {
    PrintDiagnostic(e.GetDiagnostic());
    return std::nullopt;
  }
}

}  // namespace servant::driver
