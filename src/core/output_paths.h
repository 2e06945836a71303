// Copyright 2026 The ocrgrab Authors
//
// Naming of per-run output files under the output directory.

#ifndef OCRGRAB_CORE_OUTPUT_PATHS_H_
#define OCRGRAB_CORE_OUTPUT_PATHS_H_

#include <chrono>
#include <string>

namespace ocrgrab {
namespace internal {

/// "<image path without extension>.txt".
std::string TextPathForImage(const std::string& image_path);

/// "<image path without extension>.temp.jpg" (sanitized copy).
std::string SanitizedPathForImage(const std::string& image_path);

/// "Screenshot_YYYYMMDD_HHMMSS_mmm.png" for a local timestamp.
std::string ImageFileName(std::chrono::system_clock::time_point when);

/// Pick an unused image path in `output_dir` for `when`. If the timestamped
/// name (or its .txt sibling) already exists, "_2", "_3", ... is appended
/// to the stem until both are free.
std::string NextImagePath(const std::string& output_dir,
                          std::chrono::system_clock::time_point when);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_OUTPUT_PATHS_H_
