// Copyright 2026 The ocrgrab Authors
//
// Region capture by delegating to an external screenshot tool.

#ifndef OCRGRAB_PLATFORM_LINUX_TOOL_REGION_CAPTURE_H_
#define OCRGRAB_PLATFORM_LINUX_TOOL_REGION_CAPTURE_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "capture/region_capture.h"

namespace ocrgrab {
namespace internal {

/// KDE Spectacle: rectangular region, background, no notification.
constexpr char kDefaultCaptureCommand[] = "spectacle -r -b -n -o {output}";

class ToolRegionCapture : public RegionCapture {
 public:
  /// `command` is a template; every "{output}" is replaced by the output
  /// path. Without a placeholder the path is appended as the last argument.
  ToolRegionCapture(std::string command,
                    std::shared_ptr<spdlog::logger> logger);

  std::string Name() const override;
  CaptureOutcome Capture(const std::string& output_path) override;

 private:
  std::string command_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_PLATFORM_LINUX_TOOL_REGION_CAPTURE_H_
