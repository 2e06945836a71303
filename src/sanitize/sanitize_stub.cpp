// Copyright 2026 The ocrgrab Authors
//
// Stub sanitizer, used when OCRGRAB_ENABLE_SANITIZER is OFF.

#include "sanitize/image_sanitizer.h"

namespace ocrgrab {
namespace internal {

std::unique_ptr<ImageSanitizer> CreateImageSanitizer(
    int, std::shared_ptr<spdlog::logger>) {
  return std::make_unique<PassthroughSanitizer>(
      "image sanitizer not built in (stb_image unavailable)", true);
}

}  // namespace internal
}  // namespace ocrgrab
