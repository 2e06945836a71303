// Copyright 2026 The ocrgrab Authors
//
// Client for the local recognition daemon (Ollama HTTP API) with shared
// request/response logic (template method pattern). The transport subclass
// implements HttpPost() and HttpGet().

#ifndef OCRGRAB_RECOGNIZE_RECOGNITION_CLIENT_H_
#define OCRGRAB_RECOGNIZE_RECOGNITION_CLIENT_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

/// Connect timeout for every daemon request.
constexpr int kConnectTimeoutSeconds = 5;
/// Timeout for the model preflight.
constexpr int kModelCheckTimeoutSeconds = 20;
/// Timeout for the processor diagnostics query.
constexpr int kDiagnosticsTimeoutSeconds = 8;

struct RecognitionOptions {
  std::string daemon_url = "http://localhost:11434";
  std::string model = "glm-ocr";
  int timeout_seconds = 180;
};

struct HttpResponse {
  enum class Transport {
    kOk,           ///< A response was received (any status)
    kConnectFailed,
    kTimedOut,
    kOtherError,
  };

  Transport transport = Transport::kOtherError;
  long status = 0;
  std::string body;
  std::string detail;  ///< Transport error text
};

struct RecognitionOutcome {
  OcrGrabError error = kOcrGrabErrorUnknown;
  std::string text;     ///< Raw model output on success
  std::string message;  ///< Failure detail
};

/// Where the daemon has the model loaded, from /api/ps.
enum class ProcessorPlacement {
  kUnknown,
  kGpu,
  kCpu,
  kSplit,  ///< Partially offloaded
};

class RecognitionClient {
 public:
  RecognitionClient(RecognitionOptions options,
                    std::shared_ptr<spdlog::logger> logger);
  virtual ~RecognitionClient() = default;

  const RecognitionOptions& options() const { return options_; }

  /// Ask the daemon whether the model exists (POST /api/show).
  /// Returns kOcrGrabOk, kOcrGrabErrorDaemonUnreachable,
  /// kOcrGrabErrorModelMissing or kOcrGrabErrorRecognitionFailed.
  RecognitionOutcome CheckModel();

  /// Send one image for recognition (POST /api/generate). Exactly one
  /// attempt. On success `text` holds the model's response verbatim.
  RecognitionOutcome Recognize(const std::string& image_path,
                               OcrGrabMode mode);

  /// Best-effort query of where the model runs (GET /api/ps). Logs a
  /// summary; failures are reported at debug level only.
  ProcessorPlacement DetectProcessor();

  /// Request body for /api/generate.
  std::string BuildGenerateBody(const std::string& image_base64,
                                OcrGrabMode mode) const;

 protected:
  /// POST a JSON body. `timeout_seconds` bounds the whole request.
  virtual HttpResponse HttpPost(const std::string& url,
                                const std::string& body,
                                int timeout_seconds) = 0;

  virtual HttpResponse HttpGet(const std::string& url,
                               int timeout_seconds) = 0;

  std::shared_ptr<spdlog::logger> logger_;

 private:
  /// Map a failed response to an outcome. Only called for non-2xx or
  /// transport failures.
  RecognitionOutcome ClassifyFailure(const HttpResponse& response,
                                     const char* what) const;

  RecognitionOptions options_;
};

/// Create the libcurl-backed client.
std::unique_ptr<RecognitionClient> CreateRecognitionClient(
    RecognitionOptions options, std::shared_ptr<spdlog::logger> logger);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_RECOGNIZE_RECOGNITION_CLIENT_H_
