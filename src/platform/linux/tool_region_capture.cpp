// Copyright 2026 The ocrgrab Authors

#include "platform/linux/tool_region_capture.h"

#include <utility>
#include <vector>

#include "core/file_util.h"
#include "core/logger.h"
#include "platform/linux/posix_process.h"

namespace ocrgrab {
namespace internal {

namespace {

constexpr char kOutputPlaceholder[] = "{output}";

std::vector<std::string> ExpandTemplate(const std::string& command,
                                        const std::string& output_path) {
  std::vector<std::string> argv = SplitCommandLine(command);
  bool substituted = false;
  const std::string placeholder = kOutputPlaceholder;
  for (auto& arg : argv) {
    size_t pos;
    while ((pos = arg.find(placeholder)) != std::string::npos) {
      arg.replace(pos, placeholder.size(), output_path);
      substituted = true;
    }
  }
  if (!substituted) argv.push_back(output_path);
  return argv;
}

}  // namespace

ToolRegionCapture::ToolRegionCapture(std::string command,
                                     std::shared_ptr<spdlog::logger> logger)
    : command_(std::move(command)), logger_(std::move(logger)) {}

std::string ToolRegionCapture::Name() const {
  std::vector<std::string> argv = SplitCommandLine(command_);
  return argv.empty() ? std::string("(none)") : argv[0];
}

CaptureOutcome ToolRegionCapture::Capture(const std::string& output_path) {
  CaptureOutcome outcome;
  std::vector<std::string> argv = ExpandTemplate(command_, output_path);
  if (argv.empty() || FindExecutable(argv[0]).empty()) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message = "Missing dependency: " + Name();
    return outcome;
  }

  SPDLOG_LOGGER_DEBUG(logger_, "Running capture tool: {}", command_);
  ProcessResult run = RunProcess(argv, nullptr, /*capture_stderr=*/true);
  if (!run.started) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message = run.error;
    return outcome;
  }
  if (!run.stderr_output.empty()) {
    SPDLOG_LOGGER_DEBUG(logger_, "{} stderr: {}", argv[0], run.stderr_output);
  }
  if (!run.exited) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message =
        argv[0] + " terminated by signal " + std::to_string(run.term_signal);
    return outcome;
  }
  if (run.exit_code != 0) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message =
        argv[0] + " failed with exit code " + std::to_string(run.exit_code);
    return outcome;
  }

  if (FileSize(output_path) <= 0) {
    // Zero-byte leftovers count as a dismissed selection.
    RemoveFile(output_path);
    outcome.status = CaptureStatus::kCancelled;
    return outcome;
  }
  outcome.status = CaptureStatus::kCaptured;
  return outcome;
}

}  // namespace internal
}  // namespace ocrgrab
