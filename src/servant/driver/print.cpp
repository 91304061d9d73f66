#include "print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "servant/common/overloaded.hpp"
#include "servant/common/source_span.hpp"

namespace servant::driver {

namespace {

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;
constexpr auto kErrorStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return kErrorStyle;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return kErrorStyle;
}

// Source line of `span` with a caret marker underneath.
void PrintSourceExcerpt(const SourceSpan& span, const FileInfo& file) {
  const std::string& content = file.content;
  auto begin = std::min<size_t>(span.begin, content.size());

  size_t line_start = 0;
  for (size_t i = 0; i < begin; ++i) {
    if (content[i] == '\n') {
      line_start = i + 1;
    }
  }
  size_t line_end = content.find('\n', begin);
  if (line_end == std::string::npos) {
    line_end = content.size();
  }

  std::string line_num = std::to_string(
      ComputeLineColumn(content, static_cast<uint32_t>(begin)).line);
  size_t width = std::max(line_num.size(), size_t{4});
  std::string num_field(width - line_num.size(), ' ');
  num_field += line_num;

  constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);
  fmt::print(
      stderr, " {} {}\n", fmt::styled(num_field + " |", kGutterStyle),
      content.substr(line_start, line_end - line_start));

  size_t end = std::min<size_t>(std::max(span.end, span.begin + 1), line_end);
  size_t marker_width = end > begin ? end - begin : 1;
  fmt::print(
      stderr, " {} {}{}\n",
      fmt::styled(std::string(width, ' ') + " |", kGutterStyle),
      std::string(begin - line_start, ' '),
      fmt::styled(
          "^" + std::string(marker_width - 1, '~'),
          fmt::fg(fmt::terminal_color::green)));
}

void PrintDiagItem(
    const DiagItem& item, const SourceManager* source_manager,
    bool is_primary) {
  std::optional<SourceSpan> span;
  std::visit(
      Overloaded{
          [&](const SourceSpan& s) { span = s; },
          [](UnknownSpan) {},
      },
      item.span);

  const FileInfo* file = nullptr;
  if (span && source_manager != nullptr) {
    file = source_manager->GetFile(span->file_id);
  }

  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  if (file != nullptr) {
    fmt::print(
        stderr, "{}: {} {}\n",
        fmt::styled(
            FormatSourceLocation(*span, *source_manager), fmt::emphasis::bold),
        fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
        fmt::styled(item.message, message_style));
    if (is_primary) {
      PrintSourceExcerpt(*span, *file);
    }
    return;
  }
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("servantc", kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(item.message, message_style));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("servantc", kToolStyle),
      fmt::styled("error:", kErrorStyle),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("servantc", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(
    const Diagnostic& diag, const SourceManager* source_manager) {
  PrintDiagItem(diag.primary, source_manager, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, source_manager, false);
  }
}

void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* source_manager) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : sink.GetDiagnostics()) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }
    PrintDiagnostic(diag, source_manager);
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace servant::driver
