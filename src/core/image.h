// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_IMAGE_H_
#define OCRGRAB_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace ocrgrab {
namespace internal {

enum class PixelFormat {
  kRgb8,   ///< R8G8B8, what the daemon receives
  kRgba8,  ///< R8G8B8A8, decoder output
  kBgra8,  ///< B8G8R8A8, GDI screen grabs
};

int BytesPerPixel(PixelFormat format);

/// Owned pixel buffer (captured or decoded image).
class Image {
 public:
  Image(int width, int height, int stride, PixelFormat format,
        std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  PixelFormat format() const { return format_; }
  int channels() const { return BytesPerPixel(format_); }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Get a mutable pointer to pixel data (for backends to fill).
  uint8_t* mutable_data() { return data_.data(); }

  /// Create a zero-filled image. Returns nullptr for invalid or oversized
  /// dimensions.
  static std::unique_ptr<Image> Create(int width, int height,
                                       PixelFormat format);

  /// Create an image from existing data (takes ownership via move).
  static std::unique_ptr<Image> CreateFromData(int width, int height,
                                               int stride, PixelFormat format,
                                               std::vector<uint8_t> data);

  /// Opaque RGB copy; alpha is dropped without blending.
  std::unique_ptr<Image> ToRgb() const;

 private:
  int width_;
  int height_;
  int stride_;
  PixelFormat format_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_IMAGE_H_
