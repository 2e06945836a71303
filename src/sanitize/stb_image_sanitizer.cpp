// Copyright 2026 The ocrgrab Authors
//
// Sanitizer built on stb_image: decode, flatten to RGB, downscale, align to
// the patch grid and re-encode as JPEG.

#include <memory>
#include <string>
#include <utility>

#include "core/file_util.h"
#include "core/image.h"
#include "core/image_io.h"
#include "core/logger.h"
#include "core/output_paths.h"
#include "sanitize/image_sanitizer.h"

namespace ocrgrab {
namespace internal {

class StbImageSanitizer : public ImageSanitizer {
 public:
  StbImageSanitizer(int max_dimension, std::shared_ptr<spdlog::logger> logger)
      : max_dimension_(max_dimension), logger_(std::move(logger)) {}

  bool IsAvailable() const override { return true; }

  SanitizeOutcome Sanitize(const std::string& image_path) override {
    SanitizeOutcome outcome;
    outcome.path = image_path;

    std::string error;
    std::unique_ptr<Image> decoded = LoadImageFile(image_path, &error);
    if (!decoded) return Degrade(std::move(outcome), error);

    std::unique_ptr<Image> rgb = decoded->ToRgb();
    if (!rgb) return Degrade(std::move(outcome), "RGB conversion failed");

    int w = 0;
    int h = 0;
    ComputeSanitizedSize(rgb->width(), rgb->height(), max_dimension_, &w, &h);
    if (w != rgb->width() || h != rgb->height()) {
      rgb = ResizeImage(*rgb, w, h);
      if (!rgb) return Degrade(std::move(outcome), "resize failed");
    }

    std::string temp_path = SanitizedPathForImage(image_path);
    if (!WriteJpeg(*rgb, temp_path, kSanitizedJpegQuality, &error)) {
      RemoveFile(temp_path);
      return Degrade(std::move(outcome), error);
    }

    SPDLOG_LOGGER_DEBUG(logger_, "Sanitized {}x{} -> {}x{} ({})",
                        decoded->width(), decoded->height(), w, h, temp_path);
    outcome.path = temp_path;
    outcome.temporary = true;
    return outcome;
  }

 private:
  SanitizeOutcome Degrade(SanitizeOutcome outcome, const std::string& why) {
    outcome.degraded = true;
    outcome.message = why;
    return outcome;
  }

  int max_dimension_;
  std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<ImageSanitizer> CreateImageSanitizer(
    int max_dimension, std::shared_ptr<spdlog::logger> logger) {
  return std::make_unique<StbImageSanitizer>(max_dimension, std::move(logger));
}

}  // namespace internal
}  // namespace ocrgrab
