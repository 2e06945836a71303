// Copyright 2026 The ocrgrab Authors

#include "core/output_paths.h"

#include <cstdio>
#include <ctime>

#include "core/file_util.h"

namespace ocrgrab {
namespace internal {

namespace {

constexpr int kMaxCollisionSuffix = 1000;

std::tm LocalTime(std::time_t t) {
  std::tm tm_value = {};
#ifdef _WIN32
  localtime_s(&tm_value, &t);
#else
  localtime_r(&t, &tm_value);
#endif
  return tm_value;
}

}  // namespace

std::string TextPathForImage(const std::string& image_path) {
  return ReplaceExtension(image_path, ".txt");
}

std::string SanitizedPathForImage(const std::string& image_path) {
  return ReplaceExtension(image_path, ".temp.jpg");
}

std::string ImageFileName(std::chrono::system_clock::time_point when) {
  auto since_epoch = when.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs)
          .count();
  if (millis < 0) millis += 1000;

  std::tm tm_value = LocalTime(std::chrono::system_clock::to_time_t(when));
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_value);

  char name[64];
  std::snprintf(name, sizeof(name), "Screenshot_%s_%03d.png", stamp,
                static_cast<int>(millis));
  return name;
}

std::string NextImagePath(const std::string& output_dir,
                          std::chrono::system_clock::time_point when) {
  std::string base = JoinPath(output_dir, ImageFileName(when));
  std::string candidate = base;
  for (int n = 2; n <= kMaxCollisionSuffix; ++n) {
    if (!PathExists(candidate) && !PathExists(TextPathForImage(candidate)))
      return candidate;
    candidate = ReplaceExtension(base, "_" + std::to_string(n) + ".png");
  }
  return candidate;
}

}  // namespace internal
}  // namespace ocrgrab
