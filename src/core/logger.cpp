// Copyright 2026 The ocrgrab Authors

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"
#include "core/console_sink.h"

namespace ocrgrab {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::mutex g_file_mutex;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;

// Log file lines: [2026-10-19 10:15:30] [warning] message
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

void DetachFileSinkLocked() {
  if (!g_file_sink) return;
  g_file_sink->flush();
  auto& sinks = g_logger->sinks();
  sinks.erase(std::remove(sinks.begin(), sinks.end(),
                          std::static_pointer_cast<spdlog::sinks::sink>(
                              g_file_sink)),
              sinks.end());
  g_file_sink.reset();
}

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    // Console lines carry [INFO]/[WARNING]/[ERROR] tags so a wrapping GUI
    // can colorize the stream; the callback receives the bare message.
    auto console_sink = std::make_shared<TaggedConsoleSink>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {console_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("ocrgrab", sinks);

    g_logger->set_pattern("%v");
    g_logger->set_level(spdlog::level::info);

    // The CLI is usually read through a pipe; flush every line.
    g_logger->flush_on(spdlog::level::trace);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

bool OpenDebugLog(const std::string& path, std::string* error) {
  InitLogger();
  std::lock_guard<std::mutex> lock(g_file_mutex);
  if (g_file_sink && g_file_sink->filename() == path) return true;

  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
  try {
    sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        path, /*truncate=*/false);
  } catch (const spdlog::spdlog_ex& ex) {
    if (error) *error = ex.what();
    return false;
  }
  sink->set_pattern(kFilePattern);

  DetachFileSinkLocked();
  g_file_sink = sink;
  g_logger->sinks().push_back(sink);
  return true;
}

void ShutdownLogger() {
  InitLogger();
  std::lock_guard<std::mutex> lock(g_file_mutex);
  g_logger->flush();
  DetachFileSinkLocked();
}

void SetLogLevel(OcrGrabLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(OcrGrabLogLevel level) {
  switch (level) {
    case kOcrGrabLogTrace: return spdlog::level::trace;
    case kOcrGrabLogDebug: return spdlog::level::debug;
    case kOcrGrabLogInfo:  return spdlog::level::info;
    case kOcrGrabLogWarn:  return spdlog::level::warn;
    case kOcrGrabLogError: return spdlog::level::err;
    case kOcrGrabLogFatal: return spdlog::level::critical;
    default:               return spdlog::level::info;
  }
}

OcrGrabLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:    return kOcrGrabLogTrace;
    case spdlog::level::debug:    return kOcrGrabLogDebug;
    case spdlog::level::info:     return kOcrGrabLogInfo;
    case spdlog::level::warn:     return kOcrGrabLogWarn;
    case spdlog::level::err:      return kOcrGrabLogError;
    case spdlog::level::critical: return kOcrGrabLogFatal;
    case spdlog::level::off:      return kOcrGrabLogFatal;
    default:                      return kOcrGrabLogInfo;
  }
}

bool ParseLogLevel(const std::string& name, OcrGrabLogLevel* out_level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace") {
    *out_level = kOcrGrabLogTrace;
  } else if (lower == "debug") {
    *out_level = kOcrGrabLogDebug;
  } else if (lower == "info") {
    *out_level = kOcrGrabLogInfo;
  } else if (lower == "warn" || lower == "warning") {
    *out_level = kOcrGrabLogWarn;
  } else if (lower == "error") {
    *out_level = kOcrGrabLogError;
  } else if (lower == "fatal" || lower == "critical") {
    *out_level = kOcrGrabLogFatal;
  } else {
    return false;
  }
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
