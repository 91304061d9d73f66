#pragma once

#include <cstdint>
#include <string>

#include "servant/common/source_manager.hpp"

namespace servant {

struct SourceSpan {
  FileId file_id;
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const SourceSpan&) const -> bool = default;
};

// Line and column (both 1-based) of a byte offset within a file.
struct LineColumn {
  uint32_t line = 1;
  uint32_t column = 1;
};

auto ComputeLineColumn(const std::string& content, uint32_t offset)
    -> LineColumn;

// Format a SourceSpan as "file:line:col" using the SourceManager.
// Returns empty string if the span or file is invalid.
auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string;

}  // namespace servant
