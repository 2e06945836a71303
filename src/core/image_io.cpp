// Copyright 2026 The ocrgrab Authors
//
// Image file I/O using stb_image (decode) and stb_image_write (PNG, JPEG),
// plus stb_image_resize2 for resampling.

#include "core/image_io.h"

#include <cstdio>
#include <cstring>
#include <vector>

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)  // sprintf deprecation in stb
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-function"
#endif

#define STB_IMAGE_IMPLEMENTATION
#ifdef _WIN32
#define STBI_WINDOWS_UTF8
#endif
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#ifdef _WIN32
#define STBIW_WINDOWS_UTF8
#endif
#include "stb_image_write.h"

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image_resize2.h"

#ifdef _MSC_VER
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

namespace ocrgrab {
namespace internal {

namespace {

// Tightly packed pixels in stb channel order (RGB or RGBA).
std::vector<uint8_t> PackForStb(const Image& image, int* out_channels) {
  const int w = image.width();
  const int h = image.height();
  const int bpp = image.channels();
  std::vector<uint8_t> packed(static_cast<size_t>(w) * h * bpp);
  for (int y = 0; y < h; ++y) {
    const uint8_t* row = image.data() + static_cast<size_t>(y) * image.stride();
    uint8_t* dst = packed.data() + static_cast<size_t>(y) * w * bpp;
    if (image.format() == PixelFormat::kBgra8) {
      for (int x = 0; x < w; ++x) {
        dst[x * 4 + 0] = row[x * 4 + 2];  // R <- B
        dst[x * 4 + 1] = row[x * 4 + 1];  // G
        dst[x * 4 + 2] = row[x * 4 + 0];  // B <- R
        dst[x * 4 + 3] = row[x * 4 + 3];  // A
      }
    } else {
      std::memcpy(dst, row, static_cast<size_t>(w) * bpp);
    }
  }
  *out_channels = bpp;
  return packed;
}

stbir_pixel_layout StbLayout(PixelFormat format) {
  switch (format) {
    case PixelFormat::kRgb8:
      return STBIR_RGB;
    case PixelFormat::kRgba8:
      return STBIR_RGBA;
    case PixelFormat::kBgra8:
      return STBIR_BGRA;
  }
  return STBIR_RGBA;
}

}  // namespace

std::unique_ptr<Image> LoadImageFile(const std::string& path,
                                     std::string* error) {
  int w = 0;
  int h = 0;
  int file_channels = 0;
  unsigned char* pixels = stbi_load(path.c_str(), &w, &h, &file_channels, 4);
  if (!pixels) {
    if (error) {
      *error = std::string("cannot decode ") + path + ": " +
               stbi_failure_reason();
    }
    return nullptr;
  }
  std::vector<uint8_t> data(pixels,
                            pixels + static_cast<size_t>(w) * h * 4);
  stbi_image_free(pixels);

  auto image =
      Image::CreateFromData(w, h, w * 4, PixelFormat::kRgba8, std::move(data));
  if (!image && error) *error = "decoded image has invalid dimensions";
  return image;
}

bool WritePng(const Image& image, const std::string& path,
              std::string* error) {
  int channels = 0;
  std::vector<uint8_t> packed = PackForStb(image, &channels);
  int ok = stbi_write_png(path.c_str(), image.width(), image.height(),
                          channels, packed.data(), image.width() * channels);
  if (!ok && error) *error = "PNG encode failed for " + path;
  return ok != 0;
}

bool WriteJpeg(const Image& image, const std::string& path, int quality,
               std::string* error) {
  if (quality <= 0 || quality > 100) quality = 90;
  int channels = 0;
  std::vector<uint8_t> packed = PackForStb(image, &channels);
  // stb drops the alpha channel for JPEG output.
  int ok = stbi_write_jpg(path.c_str(), image.width(), image.height(),
                          channels, packed.data(), quality);
  if (!ok && error) *error = "JPEG encode failed for " + path;
  return ok != 0;
}

std::unique_ptr<Image> ResizeImage(const Image& image, int new_width,
                                   int new_height) {
  auto out = Image::Create(new_width, new_height, image.format());
  if (!out) return nullptr;
  unsigned char* result = stbir_resize_uint8_linear(
      image.data(), image.width(), image.height(), image.stride(),
      out->mutable_data(), out->width(), out->height(), out->stride(),
      StbLayout(image.format()));
  if (!result) return nullptr;
  return out;
}

}  // namespace internal
}  // namespace ocrgrab
