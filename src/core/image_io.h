// Copyright 2026 The ocrgrab Authors
//
// Image file decode/encode using stb_image / stb_image_write, and
// resampling with stb_image_resize2.

#ifndef OCRGRAB_CORE_IMAGE_IO_H_
#define OCRGRAB_CORE_IMAGE_IO_H_

#include <memory>
#include <string>

#include "core/image.h"

namespace ocrgrab {
namespace internal {

/// Decode a PNG/JPEG/BMP file into an RGBA8 image.
std::unique_ptr<Image> LoadImageFile(const std::string& path,
                                     std::string* error);

/// Encode as PNG. BGRA input is swizzled to RGBA.
bool WritePng(const Image& image, const std::string& path, std::string* error);

/// Encode as JPEG. Alpha, if any, is dropped.
bool WriteJpeg(const Image& image, const std::string& path, int quality,
               std::string* error);

/// Resample to the given size, keeping the pixel format. Returns nullptr for
/// invalid target dimensions.
std::unique_ptr<Image> ResizeImage(const Image& image, int new_width,
                                   int new_height);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_IMAGE_IO_H_
