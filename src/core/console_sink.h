// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_CONSOLE_SINK_H_
#define OCRGRAB_CORE_CONSOLE_SINK_H_

#include <cstdio>
#include <mutex>

#include "spdlog/sinks/base_sink.h"

namespace ocrgrab {
namespace internal {

/// Console sink writing "[INFO] message" lines. Errors go to stderr,
/// everything else to stdout, so a parent process can tell them apart.
class TaggedConsoleSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  static const char* Tag(spdlog::level::level_enum level) {
    switch (level) {
      case spdlog::level::trace:    return "TRACE";
      case spdlog::level::debug:    return "DEBUG";
      case spdlog::level::info:     return "INFO";
      case spdlog::level::warn:     return "WARNING";
      case spdlog::level::err:      return "ERROR";
      case spdlog::level::critical: return "FATAL";
      default:                      return "INFO";
    }
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    FILE* out = msg.level >= spdlog::level::err ? stderr : stdout;
    std::fprintf(out, "[%s] %.*s\n", Tag(msg.level),
                 static_cast<int>(msg.payload.size()), msg.payload.data());
    std::fflush(out);
  }

  void flush_() override {
    std::fflush(stdout);
    std::fflush(stderr);
  }
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_CONSOLE_SINK_H_
