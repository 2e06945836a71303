// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_OUTPUT_WRITER_H_
#define OCRGRAB_CORE_OUTPUT_WRITER_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

namespace ocrgrab {
namespace internal {

/// Writes recognized text next to the captured image.
class OutputWriter {
 public:
  explicit OutputWriter(std::shared_ptr<spdlog::logger> logger);

  /// Write `text` to TextPathForImage(image_path), creating the directory if
  /// needed. On success stores the written path in `out_path`.
  bool Write(const std::string& image_path, const std::string& text,
             std::string* out_path, std::string* error);

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_OUTPUT_WRITER_H_
