// Copyright 2026 The ocrgrab Authors

#include "core/output_writer.h"

#include <utility>

#include "core/file_util.h"
#include "core/logger.h"
#include "core/output_paths.h"

namespace ocrgrab {
namespace internal {

OutputWriter::OutputWriter(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

bool OutputWriter::Write(const std::string& image_path, const std::string& text,
                         std::string* out_path, std::string* error) {
  std::string text_path = TextPathForImage(image_path);

  std::string dir = ParentDirectory(text_path);
  if (!dir.empty() && !MakeDirectories(dir, error)) {
    SPDLOG_LOGGER_ERROR(logger_, "Cannot create output directory {}", dir);
    return false;
  }

  if (!WriteFileBytes(text_path, text, error)) {
    // Do not leave a truncated file behind.
    RemoveFile(text_path);
    return false;
  }

  SPDLOG_LOGGER_DEBUG(logger_, "Wrote {} bytes to {}", text.size(), text_path);
  if (out_path) *out_path = text_path;
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
