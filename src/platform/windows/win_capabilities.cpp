// Copyright 2026 The ocrgrab Authors
//
// Windows capabilities: overlay capture, Win32 clipboard and a detached
// editor. capture_command and clipboard_command do not apply here.

#ifdef _WIN32

#include "core/platform_capabilities.h"

#include <utility>

#include "core/logger.h"
#include "platform/windows/win_clipboard_writer.h"
#include "platform/windows/win_editor_launcher.h"
#include "platform/windows/win_overlay_capture.h"

namespace ocrgrab {
namespace internal {

PlatformCapabilities CreatePlatformCapabilities(
    const Config& config, std::shared_ptr<spdlog::logger> logger) {
  if (!config.capture_command.empty() || !config.clipboard_command.empty()) {
    SPDLOG_LOGGER_DEBUG(logger,
                        "capture_command/clipboard_command ignored on Windows");
  }
  PlatformCapabilities caps;
  caps.capture = std::make_unique<WinOverlayCapture>(logger);
  caps.clipboard = std::make_unique<WinClipboardWriter>(logger);
  caps.editor = std::make_unique<WinEditorLauncher>(
      config.editor.empty() ? std::string(kDefaultWindowsEditor)
                            : config.editor,
      std::move(logger));
  return caps;
}

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32
