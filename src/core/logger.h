// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_LOGGER_H_
#define OCRGRAB_CORE_LOGGER_H_

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

class CallbackSink;

/// Initialize the process-wide ocrgrab logger (tagged console + callback
/// sink). Safe to call multiple times; subsequent calls are no-ops.
void InitLogger();

/// Get the process-wide logger. Components receive this handle at
/// construction instead of reaching for it themselves.
std::shared_ptr<spdlog::logger> GetLogger();

/// Get the global callback sink (used to register/unregister user callback).
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Attach (or replace) the append-only debug log file sink.
/// Returns false and leaves the logger unchanged if the file cannot be opened.
bool OpenDebugLog(const std::string& path, std::string* error);

/// Flush all sinks and close the debug log file.
void ShutdownLogger();

/// Set the global log level.
void SetLogLevel(OcrGrabLogLevel level);

/// Map OcrGrabLogLevel to spdlog::level::level_enum.
spdlog::level::level_enum ToSpdlogLevel(OcrGrabLogLevel level);

/// Map spdlog::level::level_enum to OcrGrabLogLevel.
OcrGrabLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error" or "fatal".
/// Returns false for anything else.
bool ParseLogLevel(const std::string& name, OcrGrabLogLevel* out_level);

}  // namespace internal
}  // namespace ocrgrab

// ---------------------------------------------------------------------------
// Convenience macros for code without an injected logger (C API, CLI).
// ---------------------------------------------------------------------------

#define OCRGRAB_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::ocrgrab::internal::GetLogger(), __VA_ARGS__)
#define OCRGRAB_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::ocrgrab::internal::GetLogger(), __VA_ARGS__)
#define OCRGRAB_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::ocrgrab::internal::GetLogger(), __VA_ARGS__)
#define OCRGRAB_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::ocrgrab::internal::GetLogger(), __VA_ARGS__)
#define OCRGRAB_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::ocrgrab::internal::GetLogger(), __VA_ARGS__)
#define OCRGRAB_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::ocrgrab::internal::GetLogger(), __VA_ARGS__)

#endif  // OCRGRAB_CORE_LOGGER_H_
