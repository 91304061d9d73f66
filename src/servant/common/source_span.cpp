#include "servant/common/source_span.hpp"

#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace servant {

auto ComputeLineColumn(const std::string& content, uint32_t offset)
    -> LineColumn {
  LineColumn pos;
  for (uint32_t i = 0; i < offset && i < content.size(); ++i) {
    if (content[i] == '\n') {
      ++pos.line;
      pos.column = 1;
    } else {
      ++pos.column;
    }
  }
  return pos;
}

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string {
  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return "";
  }

  auto pos = ComputeLineColumn(file->content, span.begin);
  return fmt::format("{}:{}:{}", file->path, pos.line, pos.column);
}

}  // namespace servant
