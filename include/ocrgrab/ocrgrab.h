// Copyright 2026 The ocrgrab Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef OCRGRAB_OCRGRAB_H_
#define OCRGRAB_OCRGRAB_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32) && defined(OCRGRAB_SHARED)
#if defined(OCRGRAB_BUILDING)
#define OCRGRAB_API __declspec(dllexport)
#else
#define OCRGRAB_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define OCRGRAB_API __attribute__((visibility("default")))
#else
#define OCRGRAB_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "ocrgrab/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - A run is strictly sequential and blocks the calling thread until it
//     reaches a terminal state. Callers with a UI loop should call
//     ocrgrab_run() from one background thread.
//   - Operations on the SAME context are NOT thread-safe.
//   - ocrgrab_set_log_level() and ocrgrab_set_log_callback() are
//     process-global and internally synchronized.
//   - ocrgrab_mode_*(), ocrgrab_error_*() and ocrgrab_version_*() are
//     stateless.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct OcrGrabContext OcrGrabContext;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Result codes. Negative values are fatal failures of a run;
/// kOcrGrabCancelled is a normal outcome and not an error.
typedef enum OcrGrabError {
  kOcrGrabOk = 0,
  kOcrGrabCancelled = 1,                     ///< User cancelled the selection
  kOcrGrabErrorNotInitialized = -1,
  kOcrGrabErrorInvalidParam = -2,
  kOcrGrabErrorCaptureUnavailable = -3,      ///< Screenshot tool missing/failed
  kOcrGrabErrorDaemonUnreachable = -4,       ///< Recognition daemon down
  kOcrGrabErrorModelMissing = -5,            ///< Model not pulled
  kOcrGrabErrorWriteError = -6,              ///< Output file not written
  kOcrGrabErrorRecognitionFailed = -7,       ///< Daemon error or timeout
  kOcrGrabErrorEmptyResult = -8,             ///< Model returned no text
  kOcrGrabErrorUnknown = -99,
} OcrGrabError;

/// Recognition mode: selects the instruction sent to the daemon.
typedef enum OcrGrabMode {
  kOcrGrabModeText = 0,
  kOcrGrabModeTable = 1,
  kOcrGrabModeFigure = 2,
} OcrGrabMode;

/// Pipeline states. A run ends in kOcrGrabStateDone, kOcrGrabStateCancelled
/// or kOcrGrabStateFailed.
typedef enum OcrGrabRunState {
  kOcrGrabStateIdle = 0,
  kOcrGrabStateCapturing = 1,
  kOcrGrabStateSanitizing = 2,
  kOcrGrabStateRecognizing = 3,
  kOcrGrabStateWriting = 4,
  kOcrGrabStatePublishing = 5,
  kOcrGrabStateOpening = 6,
  kOcrGrabStateDone = 7,
  kOcrGrabStateCancelled = 8,
  kOcrGrabStateFailed = 9,
} OcrGrabRunState;

/// Degraded-mode warnings raised during a run (bit flags).
typedef enum OcrGrabWarning {
  kOcrGrabWarnNone = 0,
  kOcrGrabWarnDegradedSanitize = 1 << 0,
  kOcrGrabWarnDegradedClipboard = 1 << 1,
  kOcrGrabWarnDegradedEditor = 1 << 2,
} OcrGrabWarning;

/// Log severity levels for the internal logging system.
typedef enum OcrGrabLogLevel {
  kOcrGrabLogTrace = 0,
  kOcrGrabLogDebug = 1,
  kOcrGrabLogInfo = 2,    ///< Default
  kOcrGrabLogWarn = 3,
  kOcrGrabLogError = 4,
  kOcrGrabLogFatal = 5,
} OcrGrabLogLevel;

/// User-defined log callback (e.g. a GUI log panel).
///
/// @param level     Severity of the message.
/// @param message   Null-terminated UTF-8 message without level prefix.
/// @param userdata  Pointer passed to ocrgrab_set_log_callback.
typedef void (*ocrgrab_log_callback_t)(OcrGrabLogLevel level,
                                       const char* message, void* userdata);

/// Outcome of one ocrgrab_run(). Strings are owned by the struct and released
/// by ocrgrab_run_result_free(); any of them may be NULL.
typedef struct OcrGrabRunResult {
  OcrGrabError error;       ///< kOcrGrabOk, kOcrGrabCancelled or a failure
  OcrGrabRunState state;    ///< Terminal state
  OcrGrabRunState failed_in;  ///< State that failed (Idle if none)
  uint32_t warnings;        ///< OcrGrabWarning bit set
  char* image_path;         ///< Captured image (NULL when cancelled)
  char* text_path;          ///< Written text file (NULL unless written)
  char* text;               ///< Recognized text (NULL unless recognized)
  char* message;            ///< Human-readable outcome
} OcrGrabRunResult;

// ---------------------------------------------------------------------------
// Modes and paths (stateless)
// ---------------------------------------------------------------------------

/// Parse a mode argument ("text", "table", "figure", case-insensitive,
/// substring match). NULL or "" yields kOcrGrabModeText.
/// @return kOcrGrabOk, or kOcrGrabErrorInvalidParam for unknown input.
OCRGRAB_API OcrGrabError ocrgrab_mode_parse(const char* arg,
                                            OcrGrabMode* out_mode);

/// Short mode name ("text", "table", "figure").
OCRGRAB_API const char* ocrgrab_mode_name(OcrGrabMode mode);

/// Display name ("Text Recognition", ...).
OCRGRAB_API const char* ocrgrab_mode_display_name(OcrGrabMode mode);

/// Instruction sent to the daemon for the mode. Deterministic per mode.
OCRGRAB_API const char* ocrgrab_mode_instruction(OcrGrabMode mode);

/// Derive the text output path for an image path: same stem, ".txt".
/// Writes at most buf_size bytes including the NUL terminator.
/// @return Required length excluding NUL, or -1 on invalid parameters.
OCRGRAB_API int ocrgrab_text_path_for_image(const char* image_path, char* buf,
                                            int buf_size);

/// Short description of a result code.
OCRGRAB_API const char* ocrgrab_error_string(OcrGrabError error);

/// Remediation hint for a fatal result code ("" when none applies).
OCRGRAB_API const char* ocrgrab_error_remediation(OcrGrabError error);

/// Process exit status for a result code (0 on success and cancel).
OCRGRAB_API int ocrgrab_exit_code(OcrGrabError error);

/// Name of a pipeline state ("Capturing", ...).
OCRGRAB_API const char* ocrgrab_state_name(OcrGrabRunState state);

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a context with the default configuration file
/// (~/.config/ocrgrab/settings.ini when present).
/// @return NULL on allocation failure.
OCRGRAB_API OcrGrabContext* ocrgrab_context_create(void);

/// Create a context from an explicit configuration file. NULL config_path
/// behaves like ocrgrab_context_create(). A missing explicit file fails.
OCRGRAB_API OcrGrabContext* ocrgrab_context_create_with_config(
    const char* config_path);

/// Destroy a context and flush the debug log. NULL is safe.
OCRGRAB_API void ocrgrab_context_destroy(OcrGrabContext* ctx);

OCRGRAB_API OcrGrabError ocrgrab_get_last_error(const OcrGrabContext* ctx);
OCRGRAB_API const char* ocrgrab_get_last_error_message(
    const OcrGrabContext* ctx);

// ---------------------------------------------------------------------------
// Configuration overrides (take effect on the next run)
// ---------------------------------------------------------------------------

OCRGRAB_API OcrGrabError ocrgrab_set_daemon_url(OcrGrabContext* ctx,
                                                const char* url);
OCRGRAB_API OcrGrabError ocrgrab_set_model(OcrGrabContext* ctx,
                                           const char* model);
OCRGRAB_API OcrGrabError ocrgrab_set_timeout(OcrGrabContext* ctx,
                                             int timeout_seconds);
OCRGRAB_API OcrGrabError ocrgrab_set_output_dir(OcrGrabContext* ctx,
                                                const char* dir);
OCRGRAB_API OcrGrabError ocrgrab_set_editor(OcrGrabContext* ctx,
                                            const char* editor);
OCRGRAB_API OcrGrabError ocrgrab_set_open_editor(OcrGrabContext* ctx,
                                                 int enabled);

/// Current output directory (owned by the context).
OCRGRAB_API const char* ocrgrab_get_output_dir(const OcrGrabContext* ctx);

/// 1 if the image sanitizer is built in and enabled, else 0.
OCRGRAB_API int ocrgrab_sanitizer_is_available(const OcrGrabContext* ctx);

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

/// Run capture -> sanitize -> recognize -> write -> clipboard -> editor.
/// Blocks until the run finishes.
/// @param out_result  Optional; filled on every outcome, release with
///                    ocrgrab_run_result_free().
/// @return The run's result code (same as out_result->error).
OCRGRAB_API OcrGrabError ocrgrab_run(OcrGrabContext* ctx, OcrGrabMode mode,
                                     OcrGrabRunResult* out_result);

/// Release strings held by a run result. NULL is safe.
OCRGRAB_API void ocrgrab_run_result_free(OcrGrabRunResult* result);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

OCRGRAB_API void ocrgrab_set_log_level(OcrGrabLogLevel level);

/// Register a log callback. NULL disables forwarding.
OCRGRAB_API void ocrgrab_set_log_callback(ocrgrab_log_callback_t callback,
                                          void* userdata);

/// Emit a message through the library logger. NULL message is ignored.
OCRGRAB_API void ocrgrab_log(OcrGrabLogLevel level, const char* message);

/// Flush and close the debug log file. Logging afterwards still reaches the
/// console and callback.
OCRGRAB_API void ocrgrab_shutdown_logging(void);

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

OCRGRAB_API const char* ocrgrab_version_string(void);
OCRGRAB_API int ocrgrab_version_major(void);
OCRGRAB_API int ocrgrab_version_minor(void);
OCRGRAB_API int ocrgrab_version_patch(void);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // OCRGRAB_OCRGRAB_H_
