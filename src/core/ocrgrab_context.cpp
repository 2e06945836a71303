// Copyright 2026 The ocrgrab Authors

#include "core/ocrgrab_context.h"

#include <utility>
#include <vector>

#include "core/error_text.h"
#include "core/file_util.h"
#include "core/logger.h"
#include "core/platform_capabilities.h"
#include "core/recognition_mode.h"
#include "recognize/recognition_client.h"
#include "sanitize/image_sanitizer.h"

namespace ocrgrab {
namespace internal {

namespace {

std::unique_ptr<ImageSanitizer> MakeSanitizer(
    const Config& config, std::shared_ptr<spdlog::logger> logger) {
  if (!config.sanitize) {
    return std::make_unique<PassthroughSanitizer>("disabled by settings",
                                                  false);
  }
  return CreateImageSanitizer(config.max_dimension, std::move(logger));
}

}  // namespace

OcrGrabContextImpl::OcrGrabContextImpl() : logger_(GetLogger()) {}

OcrGrabContextImpl::~OcrGrabContextImpl() {
  if (initialized_) logger_->flush();
}

bool OcrGrabContextImpl::Initialize(const char* config_path) {
  if (initialized_) return true;

  config_ = DefaultConfig();

  std::string path = config_path ? config_path : DefaultConfigPath();
  bool explicit_path = config_path != nullptr;
  std::vector<std::string> warnings;
  std::string error;
  if (explicit_path || PathExists(path)) {
    if (!LoadConfigFile(path, &config_, &warnings, &error)) {
      SetError(kOcrGrabErrorInvalidParam, error);
      return false;
    }
    SPDLOG_LOGGER_DEBUG(logger_, "Loaded settings from {}", path);
  }

  OcrGrabLogLevel level;
  if (ParseLogLevel(config_.log_level, &level)) {
    SetLogLevel(level);
  } else {
    warnings.push_back("log_level: unknown level '" + config_.log_level + "'");
  }

  if (!OpenDebugLog(config_.debug_log, &error)) {
    SPDLOG_LOGGER_WARN(logger_, "Debug log disabled: {}", error);
  }
  for (const auto& w : warnings) {
    SPDLOG_LOGGER_WARN(logger_, "Ignoring setting: {}", w);
  }

  initialized_ = true;
  ClearError();
  return true;
}

void OcrGrabContextImpl::SetError(OcrGrabError code,
                                  const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  SPDLOG_LOGGER_DEBUG(logger_, "Error {}: {}", static_cast<int>(code),
                      message);
}

void OcrGrabContextImpl::ClearError() {
  last_error_ = kOcrGrabOk;
  last_error_message_ = "No error";
}

OcrGrabError OcrGrabContextImpl::ApplyOverride(const char* key,
                                               const std::string& value) {
  std::string error;
  if (!ApplySetting(key, value, &config_, &error)) {
    SetError(kOcrGrabErrorInvalidParam, error);
    return kOcrGrabErrorInvalidParam;
  }
  ClearError();
  return kOcrGrabOk;
}

OcrGrabError OcrGrabContextImpl::SetDaemonUrl(const char* url) {
  if (!url) {
    SetError(kOcrGrabErrorInvalidParam, "url is NULL");
    return kOcrGrabErrorInvalidParam;
  }
  return ApplyOverride("daemon_url", url);
}

OcrGrabError OcrGrabContextImpl::SetModel(const char* model) {
  if (!model) {
    SetError(kOcrGrabErrorInvalidParam, "model is NULL");
    return kOcrGrabErrorInvalidParam;
  }
  return ApplyOverride("model", model);
}

OcrGrabError OcrGrabContextImpl::SetTimeout(int timeout_seconds) {
  return ApplyOverride("timeout_seconds", std::to_string(timeout_seconds));
}

OcrGrabError OcrGrabContextImpl::SetOutputDir(const char* dir) {
  if (!dir) {
    SetError(kOcrGrabErrorInvalidParam, "dir is NULL");
    return kOcrGrabErrorInvalidParam;
  }
  return ApplyOverride("output_dir", dir);
}

OcrGrabError OcrGrabContextImpl::SetEditor(const char* editor) {
  if (!editor) {
    SetError(kOcrGrabErrorInvalidParam, "editor is NULL");
    return kOcrGrabErrorInvalidParam;
  }
  return ApplyOverride("editor", editor);
}

OcrGrabError OcrGrabContextImpl::SetOpenEditor(bool enabled) {
  config_.open_editor = enabled;
  ClearError();
  return kOcrGrabOk;
}

bool OcrGrabContextImpl::SanitizerAvailable() const {
  return config_.sanitize &&
         CreateImageSanitizer(config_.max_dimension, logger_)->IsAvailable();
}

OcrGrabError OcrGrabContextImpl::Run(OcrGrabMode mode, RunOutcome* out) {
  if (!initialized_) {
    SetError(kOcrGrabErrorNotInitialized, "Context not initialized");
    return kOcrGrabErrorNotInitialized;
  }
  if (!IsValidMode(mode)) {
    SetError(kOcrGrabErrorInvalidParam,
             "Invalid recognition mode " + std::to_string(static_cast<int>(mode)));
    return kOcrGrabErrorInvalidParam;
  }

  RecognitionOptions options;
  options.daemon_url = config_.daemon_url;
  options.model = config_.model;
  options.timeout_seconds = config_.timeout_seconds;

  Pipeline pipeline(config_, CreatePlatformCapabilities(config_, logger_),
                    MakeSanitizer(config_, logger_),
                    CreateRecognitionClient(options, logger_), logger_);
  *out = pipeline.Run(mode);
  logger_->flush();

  if (out->error < 0) {
    SetError(out->error, out->message);
  } else {
    ClearError();
  }
  return out->error;
}

}  // namespace internal
}  // namespace ocrgrab
