#pragma once

#include <cstdint>
#include <deque>
#include <string>

namespace servant {

// Index into a SourceManager, starting at 1. Zero marks a span with no file,
// such as one built by the host rather than parsed.
struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
};

struct FileInfo {
  std::string path;
  std::string content;
};

// Keeps the declaration and call text alive for the spans that point into it.
// Host-side call strings are registered as "<call>".
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId {
    auto value = static_cast<uint32_t>(files_.size() + 1);
    files_.push_back(
        FileInfo{.path = std::move(path), .content = std::move(content)});
    return FileId{.value = value};
  }

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo* {
    if (!id || id.value > files_.size()) {
      return nullptr;
    }
    return &files_[id.value - 1];
  }

 private:
  std::deque<FileInfo> files_;  // Entries never move
};

}  // namespace servant
