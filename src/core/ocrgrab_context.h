// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_OCRGRAB_CONTEXT_H_
#define OCRGRAB_CORE_OCRGRAB_CONTEXT_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "ocrgrab/ocrgrab.h"
#include "core/config.h"
#include "core/pipeline.h"

namespace ocrgrab {
namespace internal {

/// Internal implementation of the opaque OcrGrabContext handle.
///
/// Owns the effective configuration and builds a fresh pipeline (platform
/// capabilities, sanitizer, daemon client) for every run, so overrides made
/// between runs take effect.
class OcrGrabContextImpl {
 public:
  OcrGrabContextImpl();
  ~OcrGrabContextImpl();

  // Non-copyable.
  OcrGrabContextImpl(const OcrGrabContextImpl&) = delete;
  OcrGrabContextImpl& operator=(const OcrGrabContextImpl&) = delete;

  /// Load configuration and open the debug log. `config_path` may be null
  /// (use the default file if it exists); an explicit path must exist.
  bool Initialize(const char* config_path);

  bool is_initialized() const { return initialized_; }

  // -- Error state --

  OcrGrabError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(OcrGrabError code, const std::string& message);
  void ClearError();

  // -- Configuration --

  const Config& config() const { return config_; }

  OcrGrabError SetDaemonUrl(const char* url);
  OcrGrabError SetModel(const char* model);
  OcrGrabError SetTimeout(int timeout_seconds);
  OcrGrabError SetOutputDir(const char* dir);
  OcrGrabError SetEditor(const char* editor);
  OcrGrabError SetOpenEditor(bool enabled);

  /// True if the sanitizer is compiled in and enabled by configuration.
  bool SanitizerAvailable() const;

  // -- Pipeline --

  OcrGrabError Run(OcrGrabMode mode, RunOutcome* out);

 private:
  OcrGrabError ApplyOverride(const char* key, const std::string& value);

  std::shared_ptr<spdlog::logger> logger_;
  Config config_;
  bool initialized_ = false;

  OcrGrabError last_error_ = kOcrGrabOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_OCRGRAB_CONTEXT_H_
