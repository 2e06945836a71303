// Copyright 2026 The ocrgrab Authors

#include "sanitize/image_sanitizer.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ocrgrab {
namespace internal {

namespace {

int AlignDown(int value) {
  int aligned = (value / kPatchAlignment) * kPatchAlignment;
  return std::max(aligned, kPatchAlignment);
}

}  // namespace

void ComputeSanitizedSize(int width, int height, int max_dimension,
                          int* out_width, int* out_height) {
  if (max_dimension < kPatchAlignment) max_dimension = kPatchAlignment;
  double w = width > 0 ? width : 1;
  double h = height > 0 ? height : 1;
  double longest = std::max(w, h);
  if (longest > max_dimension) {
    double scale = max_dimension / longest;
    w = std::floor(w * scale);
    h = std::floor(h * scale);
  }
  *out_width = AlignDown(static_cast<int>(w));
  *out_height = AlignDown(static_cast<int>(h));
}

PassthroughSanitizer::PassthroughSanitizer(std::string reason, bool degraded)
    : reason_(std::move(reason)), degraded_(degraded) {}

SanitizeOutcome PassthroughSanitizer::Sanitize(const std::string& image_path) {
  SanitizeOutcome outcome;
  outcome.path = image_path;
  outcome.degraded = degraded_;
  outcome.message = reason_;
  return outcome;
}

}  // namespace internal
}  // namespace ocrgrab
