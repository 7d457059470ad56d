#pragma once

#include "../aggregate/distribution.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace ingest {

// ============================================================================
// 文件级失败 (整个文件不可用)
// ============================================================================
enum class FileErrorKind : uint8_t {
  READ = 0,  // 打开 / 读取失败
  PARSE = 1, // 内容不是合法 JSON
  FAULT = 2, // 任务内部的意外异常
};

inline const char *kind_name(FileErrorKind k) {
  switch (k) {
  case FileErrorKind::READ:  return "read";
  case FileErrorKind::PARSE: return "parse";
  case FileErrorKind::FAULT: return "fault";
  }
  return "unknown";
}

struct FileError {
  std::string path;
  FileErrorKind kind = FileErrorKind::FAULT;
  std::string message;
};

using FileResult = std::variant<aggregate::DistributionSet, FileError>;

inline bool is_error(const FileResult &r) { return std::holds_alternative<FileError>(r); }

} // namespace ingest
