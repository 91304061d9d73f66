#pragma once

#include <algorithm>
#include <vector>

#include "servant/common/diagnostic/diagnostic.hpp"

namespace servant {

// Lowering diagnostics for one declaration file, in reporting order.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    diagnostics_.push_back(std::move(diag));
  }

  void Error(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Error(loc, std::move(msg)));
  }

  void Warning(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Warning(loc, std::move(msg)));
  }

  // First error-level diagnostic, or nullptr when only warnings were seen.
  [[nodiscard]] auto FirstError() const -> const Diagnostic* {
    auto it = std::ranges::find_if(diagnostics_, [](const Diagnostic& diag) {
      return diag.primary.kind == DiagKind::kError ||
             diag.primary.kind == DiagKind::kHostError;
    });
    return it == diagnostics_.end() ? nullptr : &*it;
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return FirstError() != nullptr;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace servant
