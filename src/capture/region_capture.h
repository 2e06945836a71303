// Copyright 2026 The ocrgrab Authors
//
// Abstract interactive region capture.

#ifndef OCRGRAB_CAPTURE_REGION_CAPTURE_H_
#define OCRGRAB_CAPTURE_REGION_CAPTURE_H_

#include <string>

namespace ocrgrab {
namespace internal {

enum class CaptureStatus {
  kCaptured,     ///< Image written to the requested path
  kCancelled,    ///< User dismissed the selection; nothing written
  kUnavailable,  ///< Capture mechanism missing or failed
};

struct CaptureOutcome {
  CaptureStatus status = CaptureStatus::kUnavailable;
  std::string message;  ///< Detail for kUnavailable (and optional otherwise)
};

/// Lets the user pick a screen rectangle and saves it as an image.
///
/// Each platform provides one implementation, chosen at startup by
/// CreatePlatformCapabilities().
class RegionCapture {
 public:
  virtual ~RegionCapture() = default;

  /// Short name for logs ("spectacle", "win32-overlay", ...).
  virtual std::string Name() const = 0;

  /// Block until the user confirms or cancels a selection. On kCaptured the
  /// image exists at `output_path`. The parent directory already exists.
  virtual CaptureOutcome Capture(const std::string& output_path) = 0;

 protected:
  RegionCapture() = default;

 private:
  RegionCapture(const RegionCapture&) = delete;
  RegionCapture& operator=(const RegionCapture&) = delete;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CAPTURE_REGION_CAPTURE_H_
