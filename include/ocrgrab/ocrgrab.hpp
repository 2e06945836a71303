// Copyright 2026 The ocrgrab Authors
//
// C++ RAII wrapper for the ocrgrab C API.
// Header-only. Requires C++17 or later.
//
// Usage:
//   #include "ocrgrab/ocrgrab.hpp"
//   ocrgrab::Context ctx;
//   ocrgrab::RunResult r = ctx.Run(kOcrGrabModeTable);
//   if (r.ok()) printf("%s\n", r.text_path().c_str());

#ifndef OCRGRAB_OCRGRAB_HPP_
#define OCRGRAB_OCRGRAB_HPP_

#include "ocrgrab/ocrgrab.h"

#include <stdexcept>
#include <string>

namespace ocrgrab {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(OcrGrabError code, const char* msg)
      : std::runtime_error(msg ? msg : "ocrgrab error"), code_(code) {}
  OcrGrabError code() const noexcept { return code_; }

 private:
  OcrGrabError code_;
};

// ---------------------------------------------------------------------------
// Mode helpers
// ---------------------------------------------------------------------------

/// Parse a mode argument; throws Error on unknown input.
inline OcrGrabMode ParseMode(const std::string& arg) {
  OcrGrabMode mode = kOcrGrabModeText;
  if (ocrgrab_mode_parse(arg.c_str(), &mode) != kOcrGrabOk) {
    throw Error(kOcrGrabErrorInvalidParam,
                ("Unknown recognition mode: " + arg).c_str());
  }
  return mode;
}

inline std::string TextPathForImage(const std::string& image_path) {
  int n = ocrgrab_text_path_for_image(image_path.c_str(), nullptr, 0);
  if (n < 0) return {};
  std::string out(static_cast<size_t>(n) + 1, '\0');
  ocrgrab_text_path_for_image(image_path.c_str(), &out[0], n + 1);
  out.resize(static_cast<size_t>(n));
  return out;
}

// ---------------------------------------------------------------------------
// RunResult  (owns the C result strings)
// ---------------------------------------------------------------------------

class RunResult {
 public:
  RunResult() noexcept : raw_() {}
  ~RunResult() { ocrgrab_run_result_free(&raw_); }

  RunResult(RunResult&& o) noexcept : raw_(o.raw_) { o.raw_ = {}; }
  RunResult& operator=(RunResult&& o) noexcept {
    if (this != &o) {
      ocrgrab_run_result_free(&raw_);
      raw_ = o.raw_;
      o.raw_ = {};
    }
    return *this;
  }
  RunResult(const RunResult&) = delete;
  RunResult& operator=(const RunResult&) = delete;

  OcrGrabRunResult* get() noexcept { return &raw_; }

  OcrGrabError error() const noexcept { return raw_.error; }
  bool ok() const noexcept { return raw_.error == kOcrGrabOk; }
  bool cancelled() const noexcept { return raw_.error == kOcrGrabCancelled; }
  OcrGrabRunState state() const noexcept { return raw_.state; }
  uint32_t warnings() const noexcept { return raw_.warnings; }

  std::string image_path() const { return Str(raw_.image_path); }
  std::string text_path() const { return Str(raw_.text_path); }
  std::string text() const { return Str(raw_.text); }
  std::string message() const { return Str(raw_.message); }

  /// Throw Error if the run failed (cancel is not a failure).
  void ThrowIfFailed() const {
    if (raw_.error < 0) throw Error(raw_.error, raw_.message);
  }

 private:
  static std::string Str(const char* s) { return s ? s : ""; }

  OcrGrabRunResult raw_;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(ocrgrab_context_create()) {
    if (!raw_) throw Error(kOcrGrabErrorNotInitialized, "Context creation failed");
  }
  explicit Context(const std::string& config_path)
      : raw_(ocrgrab_context_create_with_config(config_path.c_str())) {
    if (!raw_) {
      throw Error(kOcrGrabErrorInvalidParam,
                  ("Cannot load settings from " + config_path).c_str());
    }
  }
  ~Context() { ocrgrab_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      ocrgrab_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  OcrGrabContext* get() const noexcept { return raw_; }

  OcrGrabError last_error() const { return ocrgrab_get_last_error(raw_); }
  const char* last_error_message() const {
    return ocrgrab_get_last_error_message(raw_);
  }

  void SetDaemonUrl(const std::string& url) {
    Check(ocrgrab_set_daemon_url(raw_, url.c_str()));
  }
  void SetModel(const std::string& model) {
    Check(ocrgrab_set_model(raw_, model.c_str()));
  }
  void SetTimeout(int seconds) { Check(ocrgrab_set_timeout(raw_, seconds)); }
  void SetOutputDir(const std::string& dir) {
    Check(ocrgrab_set_output_dir(raw_, dir.c_str()));
  }
  void SetEditor(const std::string& editor) {
    Check(ocrgrab_set_editor(raw_, editor.c_str()));
  }
  void SetOpenEditor(bool enabled) {
    Check(ocrgrab_set_open_editor(raw_, enabled ? 1 : 0));
  }

  std::string output_dir() const {
    const char* d = ocrgrab_get_output_dir(raw_);
    return d ? d : "";
  }

  /// Execute one run. Does not throw on pipeline failures; inspect the
  /// result or call ThrowIfFailed().
  RunResult Run(OcrGrabMode mode) {
    RunResult result;
    ocrgrab_run(raw_, mode, result.get());
    return result;
  }

 private:
  void Check(OcrGrabError err) const {
    if (err != kOcrGrabOk) throw Error(err, last_error_message());
  }

  OcrGrabContext* raw_ = nullptr;
};

}  // namespace ocrgrab

#endif  // OCRGRAB_OCRGRAB_HPP_
