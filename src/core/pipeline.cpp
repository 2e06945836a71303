// Copyright 2026 The ocrgrab Authors

#include "core/pipeline.h"

#include <utility>

#include "core/error_text.h"
#include "core/file_util.h"
#include "core/logger.h"
#include "core/output_paths.h"
#include "core/recognition_mode.h"
#include "recognize/output_format.h"

namespace ocrgrab {
namespace internal {

namespace {

// Removes the sanitized copy on every exit path out of Recognizing.
class TempFileGuard {
 public:
  TempFileGuard(std::string path, std::shared_ptr<spdlog::logger> logger)
      : path_(std::move(path)), logger_(std::move(logger)) {}
  ~TempFileGuard() { Release(); }

  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void Release() {
    if (path_.empty()) return;
    if (!RemoveFile(path_)) {
      SPDLOG_LOGGER_DEBUG(logger_, "Could not remove temporary file {}", path_);
    }
    path_.clear();
  }

 private:
  std::string path_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

Pipeline::Pipeline(Config config, PlatformCapabilities capabilities,
                   std::unique_ptr<ImageSanitizer> sanitizer,
                   std::unique_ptr<RecognitionClient> client,
                   std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      caps_(std::move(capabilities)),
      sanitizer_(std::move(sanitizer)),
      client_(std::move(client)),
      writer_(logger),
      logger_(std::move(logger)),
      clock_([] { return std::chrono::system_clock::now(); }) {}

void Pipeline::Enter(RunOutcome* run, OcrGrabRunState state) {
  run->state = state;
  run->visited.push_back(state);
  SPDLOG_LOGGER_TRACE(logger_, "-> {}", StateName(state));
}

void Pipeline::Fail(RunOutcome* run, OcrGrabError error,
                    std::string message) {
  run->failed_in = run->state;
  run->error = error;
  run->message = std::move(message);
  SPDLOG_LOGGER_ERROR(logger_, "{}", run->message);
  std::string hint = ErrorRemediation(error, config_.model);
  if (!hint.empty()) SPDLOG_LOGGER_ERROR(logger_, "{}", hint);
  SPDLOG_LOGGER_DEBUG(logger_, "Run failed in {}: {}",
                      StateName(run->failed_in), ErrorString(error));
  Enter(run, kOcrGrabStateFailed);
}

RunOutcome Pipeline::Run(OcrGrabMode mode) {
  RunOutcome run;
  run.visited.push_back(kOcrGrabStateIdle);
  SPDLOG_LOGGER_INFO(logger_, "Mode: {}", ModeDisplayName(mode));

  // --- Capturing -----------------------------------------------------------
  Enter(&run, kOcrGrabStateCapturing);
  std::string error;
  if (!MakeDirectories(config_.output_dir, &error)) {
    Fail(&run, kOcrGrabErrorWriteError,
         "Cannot create output directory " + config_.output_dir + ": " +
             error);
    return run;
  }
  std::string image_path = NextImagePath(config_.output_dir, clock_());
  SPDLOG_LOGGER_DEBUG(logger_, "Capturing with {} to {}",
                      caps_.capture->Name(), image_path);

  CaptureOutcome capture = caps_.capture->Capture(image_path);
  if (capture.status == CaptureStatus::kCancelled) {
    RemoveFile(image_path);
    run.error = kOcrGrabCancelled;
    run.message = "Screenshot canceled.";
    SPDLOG_LOGGER_WARN(logger_, "No screenshot captured. OCR aborted.");
    Enter(&run, kOcrGrabStateCancelled);
    return run;
  }
  if (capture.status == CaptureStatus::kUnavailable) {
    Fail(&run, kOcrGrabErrorCaptureUnavailable,
         "Screen capture failed: " + capture.message);
    return run;
  }
  run.image_path = image_path;
  SPDLOG_LOGGER_INFO(logger_, "Screenshot saved: {}", image_path);

  // --- Sanitizing ----------------------------------------------------------
  Enter(&run, kOcrGrabStateSanitizing);
  SanitizeOutcome sanitized = sanitizer_->Sanitize(image_path);
  TempFileGuard temp_file(sanitized.temporary ? sanitized.path : std::string(),
                          logger_);
  if (sanitized.degraded) {
    run.warnings |= kOcrGrabWarnDegradedSanitize;
    SPDLOG_LOGGER_WARN(logger_,
                       "Image sanitization skipped ({}). Using original "
                       "screenshot.",
                       sanitized.message);
  }

  // --- Recognizing ---------------------------------------------------------
  Enter(&run, kOcrGrabStateRecognizing);
  const RecognitionOptions& options = client_->options();
  SPDLOG_LOGGER_INFO(logger_, "Running {}...", options.model);
  SPDLOG_LOGGER_DEBUG(logger_, "Model input image: {}", sanitized.path);

  RecognitionOutcome check = client_->CheckModel();
  if (check.error != kOcrGrabOk) {
    Fail(&run, check.error, check.message);
    return run;
  }

  SPDLOG_LOGGER_INFO(logger_, "Waiting for OCR result (timeout: {}s)...",
                     options.timeout_seconds);
  RecognitionOutcome recognized = client_->Recognize(sanitized.path, mode);
  if (config_.processor_diagnostics &&
      recognized.error != kOcrGrabErrorDaemonUnreachable) {
    client_->DetectProcessor();
  }
  temp_file.Release();

  if (recognized.error != kOcrGrabOk) {
    Fail(&run, recognized.error, recognized.message);
    return run;
  }

  run.text = FormatRecognizedText(mode, recognized.text);
  if (run.text.empty()) {
    Fail(&run, kOcrGrabErrorEmptyResult, "Model returned no text.");
    return run;
  }

  // --- Writing -------------------------------------------------------------
  Enter(&run, kOcrGrabStateWriting);
  std::string write_error;
  bool written = writer_.Write(image_path, run.text, &run.text_path,
                               &write_error);
  if (written) {
    SPDLOG_LOGGER_INFO(logger_, "Saved output file: {}", run.text_path);
  }

  // --- Publishing ----------------------------------------------------------
  // Attempted even after a failed write so the text is not lost.
  Enter(&run, kOcrGrabStatePublishing);
  std::string clipboard_error;
  if (!caps_.clipboard->WriteText(run.text, &clipboard_error)) {
    run.warnings |= kOcrGrabWarnDegradedClipboard;
    SPDLOG_LOGGER_WARN(logger_, "Clipboard step skipped: {}", clipboard_error);
  } else {
    SPDLOG_LOGGER_DEBUG(logger_, "Text copied to clipboard via {}",
                        caps_.clipboard->Name());
  }

  if (!written) {
    run.state = kOcrGrabStateWriting;
    Fail(&run, kOcrGrabErrorWriteError,
         "Cannot write output file: " + write_error);
    return run;
  }

  // --- Opening -------------------------------------------------------------
  Enter(&run, kOcrGrabStateOpening);
  if (config_.open_editor) {
    std::string editor_error;
    if (!caps_.editor->Open(run.text_path, &editor_error)) {
      run.warnings |= kOcrGrabWarnDegradedEditor;
      SPDLOG_LOGGER_WARN(logger_, "Could not open {}: {}. File saved but not "
                         "opened.", caps_.editor->Name(), editor_error);
    }
  } else {
    SPDLOG_LOGGER_DEBUG(logger_, "Editor disabled");
  }

  run.error = kOcrGrabOk;
  run.message = std::string(ModeDisplayName(mode)) + " finished successfully.";
  Enter(&run, kOcrGrabStateDone);
  return run;
}

}  // namespace internal
}  // namespace ocrgrab
