// Copyright 2026 The ocrgrab Authors
//
// Linux capabilities: external screenshot tool, wl-copy/xclip clipboard and
// a detached editor.

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include "core/platform_capabilities.h"

#include <utility>

#include "platform/linux/detached_editor_launcher.h"
#include "platform/linux/tool_clipboard_writer.h"
#include "platform/linux/tool_region_capture.h"

namespace ocrgrab {
namespace internal {

PlatformCapabilities CreatePlatformCapabilities(
    const Config& config, std::shared_ptr<spdlog::logger> logger) {
  PlatformCapabilities caps;
  caps.capture = std::make_unique<ToolRegionCapture>(
      config.capture_command.empty() ? std::string(kDefaultCaptureCommand)
                                     : config.capture_command,
      logger);
  caps.clipboard = std::make_unique<ToolClipboardWriter>(
      DetectClipboardCommand(config.clipboard_command), logger);
  caps.editor = std::make_unique<DetachedEditorLauncher>(
      config.editor.empty() ? std::string(kDefaultLinuxEditor) : config.editor,
      std::move(logger));
  return caps;
}

}  // namespace internal
}  // namespace ocrgrab

#endif  // __linux__
