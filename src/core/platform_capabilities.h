// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_PLATFORM_CAPABILITIES_H_
#define OCRGRAB_CORE_PLATFORM_CAPABILITIES_H_

#include <memory>

#include "spdlog/logger.h"

#include "capture/region_capture.h"
#include "clipboard/clipboard_writer.h"
#include "core/config.h"
#include "editor/editor_launcher.h"

namespace ocrgrab {
namespace internal {

/// The three OS-specific pieces of the pipeline.
struct PlatformCapabilities {
  std::unique_ptr<RegionCapture> capture;
  std::unique_ptr<ClipboardWriter> clipboard;
  std::unique_ptr<EditorLauncher> editor;
};

/// Factory implemented per platform (one per build target).
/// Defined in platform/<os>/<os>_capabilities.cpp.
PlatformCapabilities CreatePlatformCapabilities(
    const Config& config, std::shared_ptr<spdlog::logger> logger);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_PLATFORM_CAPABILITIES_H_
