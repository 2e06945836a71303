// Copyright 2026 The ocrgrab Authors

#include "core/error_text.h"

namespace ocrgrab {
namespace internal {

const char* ErrorString(OcrGrabError error) {
  switch (error) {
    case kOcrGrabOk:                       return "Success";
    case kOcrGrabCancelled:                return "Cancelled by user";
    case kOcrGrabErrorNotInitialized:      return "Not initialized";
    case kOcrGrabErrorInvalidParam:        return "Invalid parameter";
    case kOcrGrabErrorCaptureUnavailable:  return "Screen capture unavailable";
    case kOcrGrabErrorDaemonUnreachable:   return "Recognition daemon unreachable";
    case kOcrGrabErrorModelMissing:        return "Recognition model missing";
    case kOcrGrabErrorWriteError:          return "Cannot write output file";
    case kOcrGrabErrorRecognitionFailed:   return "Recognition failed";
    case kOcrGrabErrorEmptyResult:         return "Model returned no text";
    case kOcrGrabErrorUnknown:             return "Unknown error";
  }
  return "Unknown error";
}

std::string ErrorRemediation(OcrGrabError error, const std::string& model) {
  switch (error) {
    case kOcrGrabErrorCaptureUnavailable:
#ifdef _WIN32
      return "Check that the desktop session allows screen capture.";
#else
      return "Install spectacle or set capture_command in settings.ini.";
#endif
    case kOcrGrabErrorDaemonUnreachable:
      return "Start the daemon: ollama serve";
    case kOcrGrabErrorModelMissing:
      return "Pull the model: ollama pull " + (model.empty() ? "glm-ocr" : model);
    case kOcrGrabErrorWriteError:
      return "Check permissions and free space of the output directory.";
    case kOcrGrabErrorRecognitionFailed:
      return "Model failed. Check the debug log for details.";
    case kOcrGrabErrorEmptyResult:
      return "Select a region that contains text and try again.";
    default:
      return {};
  }
}

int ExitCodeFor(OcrGrabError error) {
  switch (error) {
    case kOcrGrabOk:
    case kOcrGrabCancelled:
      return 0;
    case kOcrGrabErrorCaptureUnavailable:
      return 1;
    case kOcrGrabErrorDaemonUnreachable:
      return 2;
    case kOcrGrabErrorEmptyResult:
      return 3;
    case kOcrGrabErrorModelMissing:
      return 4;
    case kOcrGrabErrorWriteError:
      return 5;
    case kOcrGrabErrorRecognitionFailed:
      return 6;
    case kOcrGrabErrorInvalidParam:
      return kExitUsage;
    default:
      return 99;
  }
}

const char* StateName(OcrGrabRunState state) {
  switch (state) {
    case kOcrGrabStateIdle:         return "Idle";
    case kOcrGrabStateCapturing:    return "Capturing";
    case kOcrGrabStateSanitizing:   return "Sanitizing";
    case kOcrGrabStateRecognizing:  return "Recognizing";
    case kOcrGrabStateWriting:      return "Writing";
    case kOcrGrabStatePublishing:   return "Publishing";
    case kOcrGrabStateOpening:      return "Opening";
    case kOcrGrabStateDone:         return "Done";
    case kOcrGrabStateCancelled:    return "Cancelled";
    case kOcrGrabStateFailed:       return "Failed";
  }
  return "Unknown";
}

}  // namespace internal
}  // namespace ocrgrab
