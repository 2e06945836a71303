// Copyright 2026 The ocrgrab Authors
//
// One capture -> recognize -> deliver run as a sequential state machine.

#ifndef OCRGRAB_CORE_PIPELINE_H_
#define OCRGRAB_CORE_PIPELINE_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/logger.h"

#include "ocrgrab/ocrgrab.h"
#include "core/config.h"
#include "core/output_writer.h"
#include "core/platform_capabilities.h"
#include "recognize/recognition_client.h"
#include "sanitize/image_sanitizer.h"

namespace ocrgrab {
namespace internal {

struct RunOutcome {
  OcrGrabError error = kOcrGrabErrorUnknown;
  OcrGrabRunState state = kOcrGrabStateIdle;      ///< Terminal state
  OcrGrabRunState failed_in = kOcrGrabStateIdle;  ///< Failing state, if any
  uint32_t warnings = kOcrGrabWarnNone;
  std::string image_path;
  std::string text_path;
  std::string text;
  std::string message;
  std::vector<OcrGrabRunState> visited;  ///< Every state entered, in order
};

/// Runs the stages in fixed order:
/// Capturing -> Sanitizing -> Recognizing -> Writing -> Publishing ->
/// Opening -> Done. Only Capturing (cancel/unavailable), Recognizing and
/// Writing can end a run early; the other stages degrade to a warning.
class Pipeline {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  Pipeline(Config config, PlatformCapabilities capabilities,
           std::unique_ptr<ImageSanitizer> sanitizer,
           std::unique_ptr<RecognitionClient> client,
           std::shared_ptr<spdlog::logger> logger);

  /// Replace the clock used for output file names (tests).
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  const Config& config() const { return config_; }
  const ImageSanitizer& sanitizer() const { return *sanitizer_; }

  /// Execute one run. Blocks until a terminal state.
  RunOutcome Run(OcrGrabMode mode);

 private:
  void Enter(RunOutcome* run, OcrGrabRunState state);
  void Fail(RunOutcome* run, OcrGrabError error, std::string message);

  Config config_;
  PlatformCapabilities caps_;
  std::unique_ptr<ImageSanitizer> sanitizer_;
  std::unique_ptr<RecognitionClient> client_;
  OutputWriter writer_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_PIPELINE_H_
