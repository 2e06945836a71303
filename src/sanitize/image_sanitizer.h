// Copyright 2026 The ocrgrab Authors
//
// Abstract image sanitizer: normalizes a captured image into the shape the
// recognition model accepts.

#ifndef OCRGRAB_SANITIZE_IMAGE_SANITIZER_H_
#define OCRGRAB_SANITIZE_IMAGE_SANITIZER_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

namespace ocrgrab {
namespace internal {

/// Vision patch size of the model; both output sides are multiples of it.
constexpr int kPatchAlignment = 28;

/// JPEG quality of the sanitized copy.
constexpr int kSanitizedJpegQuality = 100;

struct SanitizeOutcome {
  std::string path;        ///< Image to send (sanitized copy or original)
  bool degraded = false;   ///< True if the original is sent unchanged
  bool temporary = false;  ///< True if `path` is a temp file to remove
  std::string message;     ///< Reason when degraded
};

/// Output size for a `width` x `height` image: scaled down (aspect kept) so
/// neither side exceeds `max_dimension`, then each side floored to a multiple
/// of kPatchAlignment, minimum kPatchAlignment.
void ComputeSanitizedSize(int width, int height, int max_dimension,
                          int* out_width, int* out_height);

class ImageSanitizer {
 public:
  virtual ~ImageSanitizer() = default;

  /// False for the passthrough stand-in.
  virtual bool IsAvailable() const = 0;

  /// Never fails: on any problem the original path comes back with
  /// `degraded` set.
  virtual SanitizeOutcome Sanitize(const std::string& image_path) = 0;

 protected:
  ImageSanitizer() = default;

 private:
  ImageSanitizer(const ImageSanitizer&) = delete;
  ImageSanitizer& operator=(const ImageSanitizer&) = delete;
};

/// Returns the input path unchanged.
class PassthroughSanitizer : public ImageSanitizer {
 public:
  /// `degraded` marks every outcome as degraded with `reason` as message
  /// (capability missing). A deliberately disabled sanitizer passes false.
  PassthroughSanitizer(std::string reason, bool degraded);

  bool IsAvailable() const override { return false; }
  SanitizeOutcome Sanitize(const std::string& image_path) override;

 private:
  std::string reason_;
  bool degraded_;
};

/// Create the built-in sanitizer: the stb implementation when compiled in
/// (OCRGRAB_ENABLE_SANITIZER), a degraded passthrough otherwise.
/// Defined in stb_image_sanitizer.cpp or sanitize_stub.cpp.
std::unique_ptr<ImageSanitizer> CreateImageSanitizer(
    int max_dimension, std::shared_ptr<spdlog::logger> logger);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_SANITIZE_IMAGE_SANITIZER_H_
