// Copyright 2026 The ocrgrab Authors
//
// This file implements all public C API functions declared in ocrgrab.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "ocrgrab/ocrgrab.h"

#include <map>
#include <new>
#include <string>

#include <cstdlib>
#include <cstring>

#include "core/callback_sink.h"
#include "core/error_text.h"
#include "core/logger.h"
#include "core/ocrgrab_context.h"
#include "core/output_paths.h"
#include "core/recognition_mode.h"

using ocrgrab::internal::OcrGrabContextImpl;
using ocrgrab::internal::RunOutcome;

// ---------------------------------------------------------------------------
// The opaque OcrGrabContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct OcrGrabContext {
  OcrGrabContextImpl impl;
};

// malloc'd copy, released by ocrgrab_run_result_free(). NULL for "".
static char* DupString(const std::string& s) {
  if (s.empty()) return nullptr;
  char* out = static_cast<char*>(std::malloc(s.size() + 1));
  if (!out) return nullptr;
  std::memcpy(out, s.c_str(), s.size() + 1);
  return out;
}

// ---------------------------------------------------------------------------
// Modes and paths
// ---------------------------------------------------------------------------

OcrGrabError ocrgrab_mode_parse(const char* arg, OcrGrabMode* out_mode) {
  if (!out_mode) return kOcrGrabErrorInvalidParam;
  if (!ocrgrab::internal::ParseMode(arg ? arg : "", out_mode)) {
    return kOcrGrabErrorInvalidParam;
  }
  return kOcrGrabOk;
}

const char* ocrgrab_mode_name(OcrGrabMode mode) {
  return ocrgrab::internal::ModeName(mode);
}

const char* ocrgrab_mode_display_name(OcrGrabMode mode) {
  return ocrgrab::internal::ModeDisplayName(mode);
}

const char* ocrgrab_mode_instruction(OcrGrabMode mode) {
  return ocrgrab::internal::ModeInstruction(mode);
}

int ocrgrab_text_path_for_image(const char* image_path, char* buf,
                                int buf_size) {
  if (!image_path || !image_path[0] || buf_size < 0) return -1;
  if (buf_size > 0 && !buf) return -1;

  std::string path = ocrgrab::internal::TextPathForImage(image_path);
  if (buf && buf_size > 0) {
    size_t n = path.size() < static_cast<size_t>(buf_size) - 1
                   ? path.size()
                   : static_cast<size_t>(buf_size) - 1;
    std::memcpy(buf, path.data(), n);
    buf[n] = '\0';
  }
  return static_cast<int>(path.size());
}

const char* ocrgrab_error_string(OcrGrabError error) {
  return ocrgrab::internal::ErrorString(error);
}

const char* ocrgrab_error_remediation(OcrGrabError error) {
  // Built once; the returned pointers stay valid for the process lifetime.
  static const std::map<OcrGrabError, std::string> kHints = [] {
    std::map<OcrGrabError, std::string> hints;
    for (OcrGrabError e :
         {kOcrGrabErrorCaptureUnavailable, kOcrGrabErrorDaemonUnreachable,
          kOcrGrabErrorModelMissing, kOcrGrabErrorWriteError,
          kOcrGrabErrorRecognitionFailed, kOcrGrabErrorEmptyResult}) {
      hints[e] = ocrgrab::internal::ErrorRemediation(e, "");
    }
    return hints;
  }();
  auto it = kHints.find(error);
  return it != kHints.end() ? it->second.c_str() : "";
}

int ocrgrab_exit_code(OcrGrabError error) {
  return ocrgrab::internal::ExitCodeFor(error);
}

const char* ocrgrab_state_name(OcrGrabRunState state) {
  return ocrgrab::internal::StateName(state);
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

OcrGrabContext* ocrgrab_context_create(void) {
  return ocrgrab_context_create_with_config(nullptr);
}

OcrGrabContext* ocrgrab_context_create_with_config(const char* config_path) {
  auto* ctx = new (std::nothrow) OcrGrabContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize(config_path)) {
    OCRGRAB_LOG_ERROR("Cannot create context: {}",
                      ctx->impl.last_error_message());
    delete ctx;
    return nullptr;
  }
  OCRGRAB_LOG_DEBUG("Context created (settings: {})",
                    config_path ? config_path : "default");
  return ctx;
}

void ocrgrab_context_destroy(OcrGrabContext* ctx) {
  if (!ctx) return;
  OCRGRAB_LOG_TRACE("Context destroyed");
  delete ctx;
}

OcrGrabError ocrgrab_get_last_error(const OcrGrabContext* ctx) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* ocrgrab_get_last_error_message(const OcrGrabContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Configuration overrides
// ---------------------------------------------------------------------------

OcrGrabError ocrgrab_set_daemon_url(OcrGrabContext* ctx, const char* url) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetDaemonUrl(url);
}

OcrGrabError ocrgrab_set_model(OcrGrabContext* ctx, const char* model) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetModel(model);
}

OcrGrabError ocrgrab_set_timeout(OcrGrabContext* ctx, int timeout_seconds) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetTimeout(timeout_seconds);
}

OcrGrabError ocrgrab_set_output_dir(OcrGrabContext* ctx, const char* dir) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetOutputDir(dir);
}

OcrGrabError ocrgrab_set_editor(OcrGrabContext* ctx, const char* editor) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetEditor(editor);
}

OcrGrabError ocrgrab_set_open_editor(OcrGrabContext* ctx, int enabled) {
  if (!ctx) return kOcrGrabErrorInvalidParam;
  return ctx->impl.SetOpenEditor(enabled != 0);
}

const char* ocrgrab_get_output_dir(const OcrGrabContext* ctx) {
  if (!ctx) return nullptr;
  return ctx->impl.config().output_dir.c_str();
}

int ocrgrab_sanitizer_is_available(const OcrGrabContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.SanitizerAvailable() ? 1 : 0;
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

OcrGrabError ocrgrab_run(OcrGrabContext* ctx, OcrGrabMode mode,
                         OcrGrabRunResult* out_result) {
  if (out_result) std::memset(out_result, 0, sizeof(*out_result));
  if (!ctx) {
    OCRGRAB_LOG_WARN("ocrgrab_run called with a NULL context");
    if (out_result) {
      out_result->error = kOcrGrabErrorInvalidParam;
      out_result->state = kOcrGrabStateFailed;
    }
    return kOcrGrabErrorInvalidParam;
  }

  OCRGRAB_LOG_TRACE("ocrgrab_run: mode {}", static_cast<int>(mode));
  RunOutcome run;
  OcrGrabError err = ctx->impl.Run(mode, &run);
  if (out_result) {
    out_result->error = err;
    if (run.visited.empty()) {
      // Rejected before the pipeline started.
      out_result->state = kOcrGrabStateFailed;
      out_result->message = DupString(ctx->impl.last_error_message());
    } else {
      out_result->state = run.state;
      out_result->failed_in = run.failed_in;
      out_result->warnings = run.warnings;
      out_result->image_path = DupString(run.image_path);
      out_result->text_path = DupString(run.text_path);
      out_result->text = DupString(run.text);
      out_result->message = DupString(run.message);
    }
  }
  return err;
}

void ocrgrab_run_result_free(OcrGrabRunResult* result) {
  if (!result) return;
  std::free(result->image_path);
  std::free(result->text_path);
  std::free(result->text);
  std::free(result->message);
  result->image_path = nullptr;
  result->text_path = nullptr;
  result->text = nullptr;
  result->message = nullptr;
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void ocrgrab_set_log_level(OcrGrabLogLevel level) {
  ocrgrab::internal::SetLogLevel(level);
}

void ocrgrab_set_log_callback(ocrgrab_log_callback_t callback,
                              void* userdata) {
  auto sink = ocrgrab::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void ocrgrab_log(OcrGrabLogLevel level, const char* message) {
  if (!message) return;
  switch (level) {
    case kOcrGrabLogTrace:
      OCRGRAB_LOG_TRACE("{}", message);
      break;
    case kOcrGrabLogDebug:
      OCRGRAB_LOG_DEBUG("{}", message);
      break;
    case kOcrGrabLogWarn:
      OCRGRAB_LOG_WARN("{}", message);
      break;
    case kOcrGrabLogError:
      OCRGRAB_LOG_ERROR("{}", message);
      break;
    case kOcrGrabLogFatal:
      OCRGRAB_LOG_FATAL("{}", message);
      break;
    case kOcrGrabLogInfo:
    default:
      OCRGRAB_LOG_INFO("{}", message);
      break;
  }
}

void ocrgrab_shutdown_logging(void) {
  ocrgrab::internal::ShutdownLogger();
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* ocrgrab_version_string(void) {
  return OCRGRAB_VERSION_STRING;
}

int ocrgrab_version_major(void) { return OCRGRAB_VERSION_MAJOR; }
int ocrgrab_version_minor(void) { return OCRGRAB_VERSION_MINOR; }
int ocrgrab_version_patch(void) { return OCRGRAB_VERSION_PATCH; }
