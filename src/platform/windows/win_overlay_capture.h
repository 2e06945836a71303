// Copyright 2026 The ocrgrab Authors
//
// In-process region selection: a translucent full-screen overlay window on
// which the user drags a rectangle, followed by a GDI grab of that area.

#ifndef OCRGRAB_PLATFORM_WINDOWS_WIN_OVERLAY_CAPTURE_H_
#define OCRGRAB_PLATFORM_WINDOWS_WIN_OVERLAY_CAPTURE_H_

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "capture/region_capture.h"
#include "core/image.h"

namespace ocrgrab {
namespace internal {

class WinOverlayCapture : public RegionCapture {
 public:
  explicit WinOverlayCapture(std::shared_ptr<spdlog::logger> logger);
  ~WinOverlayCapture() override;

  std::string Name() const override { return "win32-overlay"; }
  CaptureOutcome Capture(const std::string& output_path) override;

 private:
  bool RegisterWindowClass();
  void EnableDpiAwareness();

  /// Run the overlay message loop. Returns true with `selection` in screen
  /// coordinates if the user confirmed a rectangle.
  bool SelectRegion(RECT* selection, std::string* error);

  static LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wparam,
                                  LPARAM lparam);
  void OnPaint(HWND hwnd);
  RECT CurrentRect() const;

  static std::unique_ptr<Image> GrabScreenRect(const RECT& rect);

  std::shared_ptr<spdlog::logger> logger_;
  bool class_registered_ = false;
  bool dpi_aware_ = false;

  // Selection state, valid while the overlay is shown.
  HWND hwnd_ = nullptr;
  POINT origin_ = {};       ///< Virtual-screen origin of the overlay
  POINT drag_start_ = {};   ///< Client coordinates
  POINT drag_current_ = {};
  bool dragging_ = false;
  bool confirmed_ = false;
  bool finished_ = false;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32

#endif  // OCRGRAB_PLATFORM_WINDOWS_WIN_OVERLAY_CAPTURE_H_
