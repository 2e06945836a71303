// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_CALLBACK_SINK_H_
#define OCRGRAB_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "core/logger.h"
#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

/// spdlog sink that forwards each message to the user callback registered
/// with ocrgrab_set_log_callback() (a GUI log panel, typically).
///
/// Thread safety: inherits from base_sink which is guarded by Mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Passing nullptr as callback disables forwarding.
  void SetCallback(ocrgrab_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    // The callback gets the bare payload; the level travels separately.
    std::string text(msg.payload.data(), msg.payload.size());
    callback_(FromSpdlogLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  ocrgrab_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_CALLBACK_SINK_H_
