// Copyright 2026 The ocrgrab Authors
//
// Shared daemon logic: request bodies, response parsing, error mapping.

#include "recognize/recognition_client.h"

#include <cctype>
#include <utility>
#include <vector>

#include "core/base64.h"
#include "core/file_util.h"
#include "core/json_util.h"
#include "core/logger.h"
#include "core/recognition_mode.h"

namespace ocrgrab {
namespace internal {

namespace {

std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool IsSuccessStatus(long status) { return status >= 200 && status < 300; }

// The daemon reports failures as {"error": "..."}.
std::string ErrorField(const std::string& body) {
  std::string error;
  JsonGetString(body, "error", &error);
  return error;
}

}  // namespace

RecognitionClient::RecognitionClient(RecognitionOptions options,
                                     std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)), options_(std::move(options)) {}

RecognitionOutcome RecognitionClient::ClassifyFailure(
    const HttpResponse& response, const char* what) const {
  RecognitionOutcome outcome;
  switch (response.transport) {
    case HttpResponse::Transport::kConnectFailed:
      outcome.error = kOcrGrabErrorDaemonUnreachable;
      outcome.message = "Cannot reach the recognition daemon at " +
                        options_.daemon_url;
      if (!response.detail.empty()) outcome.message += ": " + response.detail;
      return outcome;
    case HttpResponse::Transport::kTimedOut:
      outcome.error = kOcrGrabErrorRecognitionFailed;
      outcome.message = std::string(what) + " timed out";
      if (!response.detail.empty()) outcome.message += ": " + response.detail;
      return outcome;
    case HttpResponse::Transport::kOtherError:
      outcome.error = kOcrGrabErrorRecognitionFailed;
      outcome.message = std::string(what) + " failed: " + response.detail;
      return outcome;
    case HttpResponse::Transport::kOk:
      break;
  }

  std::string error = ErrorField(response.body);
  if (response.status == 404 ||
      ToLower(error).find("not found") != std::string::npos) {
    outcome.error = kOcrGrabErrorModelMissing;
    outcome.message = "Model '" + options_.model + "' is not available";
    if (!error.empty()) outcome.message += ": " + error;
    return outcome;
  }

  outcome.error = kOcrGrabErrorRecognitionFailed;
  outcome.message = std::string(what) + " failed with HTTP " +
                    std::to_string(response.status);
  if (!error.empty()) outcome.message += ": " + error;
  return outcome;
}

RecognitionOutcome RecognitionClient::CheckModel() {
  std::string url = options_.daemon_url + "/api/show";
  std::string body = "{\"model\":" + JsonQuote(options_.model) + "}";

  SPDLOG_LOGGER_DEBUG(logger_, "Checking model '{}' at {}", options_.model,
                      url);
  HttpResponse response = HttpPost(url, body, kModelCheckTimeoutSeconds);
  if (response.transport != HttpResponse::Transport::kOk ||
      !IsSuccessStatus(response.status)) {
    return ClassifyFailure(response, "Model check");
  }

  RecognitionOutcome outcome;
  outcome.error = kOcrGrabOk;
  return outcome;
}

std::string RecognitionClient::BuildGenerateBody(
    const std::string& image_base64, OcrGrabMode mode) const {
  std::string body;
  body.reserve(image_base64.size() + 128);
  body += "{\"model\":";
  body += JsonQuote(options_.model);
  body += ",\"prompt\":";
  body += JsonQuote(ModeInstruction(mode));
  body += ",\"images\":[\"";
  body += image_base64;  // base64 alphabet needs no escaping
  body += "\"],\"stream\":false}";
  return body;
}

RecognitionOutcome RecognitionClient::Recognize(const std::string& image_path,
                                                OcrGrabMode mode) {
  RecognitionOutcome outcome;

  std::vector<uint8_t> bytes;
  std::string error;
  if (!ReadFileBytes(image_path, &bytes, &error)) {
    outcome.error = kOcrGrabErrorRecognitionFailed;
    outcome.message = "Cannot read image: " + error;
    return outcome;
  }

  std::string body =
      BuildGenerateBody(Base64Encode(bytes.data(), bytes.size()), mode);
  std::string url = options_.daemon_url + "/api/generate";

  SPDLOG_LOGGER_DEBUG(logger_, "POST {} ({} image bytes, prompt \"{}\")", url,
                      bytes.size(), ModeInstruction(mode));
  HttpResponse response = HttpPost(url, body, options_.timeout_seconds);
  if (response.transport != HttpResponse::Transport::kOk ||
      !IsSuccessStatus(response.status)) {
    return ClassifyFailure(response, "Recognition request");
  }

  if (!ErrorField(response.body).empty()) {
    // Some daemon versions report errors with status 200.
    response.status = 500;
    return ClassifyFailure(response, "Recognition request");
  }

  if (!JsonGetString(response.body, "response", &outcome.text)) {
    outcome.error = kOcrGrabErrorRecognitionFailed;
    outcome.message = "Malformed daemon response (no \"response\" field)";
    SPDLOG_LOGGER_DEBUG(logger_, "Response body: {}", response.body);
    return outcome;
  }

  outcome.error = kOcrGrabOk;
  return outcome;
}

ProcessorPlacement RecognitionClient::DetectProcessor() {
  HttpResponse response =
      HttpGet(options_.daemon_url + "/api/ps", kDiagnosticsTimeoutSeconds);
  if (response.transport != HttpResponse::Transport::kOk ||
      !IsSuccessStatus(response.status)) {
    SPDLOG_LOGGER_DEBUG(logger_, "Processor query failed: {} (HTTP {})",
                        response.detail, response.status);
    SPDLOG_LOGGER_WARN(logger_, "Could not read the daemon processor status.");
    return ProcessorPlacement::kUnknown;
  }

  // Find the loaded entry for our model; names carry a ":tag" suffix.
  size_t pos = 0;
  std::string name;
  bool found = false;
  while (JsonGetString(response.body, "name", &name, pos)) {
    pos = JsonFindKey(response.body, "name", pos);
    if (name == options_.model || name.rfind(options_.model + ":", 0) == 0) {
      found = true;
      break;
    }
  }
  if (!found) {
    SPDLOG_LOGGER_DEBUG(logger_, "Model '{}' not listed in /api/ps",
                        options_.model);
    SPDLOG_LOGGER_WARN(logger_, "Could not read the daemon processor status.");
    return ProcessorPlacement::kUnknown;
  }

  int64_t size = 0;
  int64_t size_vram = 0;
  if (!JsonGetInt64(response.body, "size", &size, pos) ||
      !JsonGetInt64(response.body, "size_vram", &size_vram, pos)) {
    SPDLOG_LOGGER_WARN(logger_,
                       "Daemon processor is active but could not be parsed.");
    return ProcessorPlacement::kUnknown;
  }

  if (size_vram <= 0) {
    SPDLOG_LOGGER_WARN(logger_, "Daemon processor: CPU (slow).");
    SPDLOG_LOGGER_WARN(logger_,
                       "Restart the daemon and re-check with `ollama ps`.");
    SPDLOG_LOGGER_WARN(logger_, "Try: `pkill -f \"ollama serve\" && ollama serve`");
    SPDLOG_LOGGER_WARN(logger_,
                       "If still CPU, verify the GPU driver and toolkit.");
    return ProcessorPlacement::kCpu;
  }
  if (size_vram >= size) {
    SPDLOG_LOGGER_INFO(logger_, "Daemon processor: GPU");
    return ProcessorPlacement::kGpu;
  }
  SPDLOG_LOGGER_WARN(logger_, "Daemon processor: {}% GPU / {}% CPU",
                     size_vram * 100 / size, 100 - size_vram * 100 / size);
  return ProcessorPlacement::kSplit;
}

}  // namespace internal
}  // namespace ocrgrab
