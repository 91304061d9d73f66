#pragma once

#include <string>

#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/common/diagnostic/diagnostic_sink.hpp"
#include "servant/common/source_manager.hpp"

namespace servant::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(
    const Diagnostic& diag, const SourceManager* source_manager = nullptr);
void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* source_manager = nullptr);

}  // namespace servant::driver
