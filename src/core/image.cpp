// Copyright 2026 The ocrgrab Authors

#include "core/image.h"

#include <utility>

namespace ocrgrab {
namespace internal {

namespace {

static constexpr size_t kMaxImageBytes = 256ULL * 1024 * 1024;  // 256 MB

}  // namespace

int BytesPerPixel(PixelFormat format) {
  switch (format) {
    case PixelFormat::kRgb8:
      return 3;
    case PixelFormat::kRgba8:
    case PixelFormat::kBgra8:
      return 4;
  }
  return 4;
}

Image::Image(int width, int height, int stride, PixelFormat format,
             std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      stride_(stride),
      format_(format),
      data_(std::move(data)) {}

// static
std::unique_ptr<Image> Image::Create(int width, int height,
                                     PixelFormat format) {
  if (width <= 0 || height <= 0) return nullptr;
  int bpp = BytesPerPixel(format);
  size_t stride = static_cast<size_t>(width) * bpp;
  size_t total = stride * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, static_cast<int>(stride),
                                 format, std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromData(int width, int height, int stride,
                                             PixelFormat format,
                                             std::vector<uint8_t> data) {
  if (width <= 0 || height <= 0 || stride < width * BytesPerPixel(format))
    return nullptr;
  size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (data.size() < required) return nullptr;
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

std::unique_ptr<Image> Image::ToRgb() const {
  auto out = Create(width_, height_, PixelFormat::kRgb8);
  if (!out) return nullptr;

  int src_bpp = channels();
  for (int y = 0; y < height_; ++y) {
    const uint8_t* src = data_.data() + static_cast<size_t>(y) * stride_;
    uint8_t* dst = out->mutable_data() + static_cast<size_t>(y) * out->stride();
    for (int x = 0; x < width_; ++x) {
      const uint8_t* px = src + x * src_bpp;
      if (format_ == PixelFormat::kBgra8) {
        dst[x * 3 + 0] = px[2];
        dst[x * 3 + 1] = px[1];
        dst[x * 3 + 2] = px[0];
      } else {
        dst[x * 3 + 0] = px[0];
        dst[x * 3 + 1] = px[1];
        dst[x * 3 + 2] = px[2];
      }
    }
  }
  return out;
}

}  // namespace internal
}  // namespace ocrgrab
