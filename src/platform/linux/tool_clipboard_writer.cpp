// Copyright 2026 The ocrgrab Authors

#include "platform/linux/tool_clipboard_writer.h"

#include <utility>

#include "core/logger.h"
#include "platform/linux/posix_process.h"

namespace ocrgrab {
namespace internal {

std::vector<std::string> DetectClipboardCommand(const std::string& configured) {
  if (!configured.empty()) return SplitCommandLine(configured);

  static const std::vector<std::vector<std::string>> kCandidates = {
      {"wl-copy"},
      {"xclip", "-selection", "clipboard"},
      {"xsel", "--clipboard", "--input"},
  };
  for (const auto& candidate : kCandidates) {
    if (!FindExecutable(candidate[0]).empty()) return candidate;
  }
  return {};
}

ToolClipboardWriter::ToolClipboardWriter(
    std::vector<std::string> argv, std::shared_ptr<spdlog::logger> logger)
    : argv_(std::move(argv)), logger_(std::move(logger)) {}

std::string ToolClipboardWriter::Name() const {
  return argv_.empty() ? std::string("(none)") : argv_[0];
}

bool ToolClipboardWriter::WriteText(const std::string& text,
                                    std::string* error) {
  if (argv_.empty()) {
    if (error) *error = "no clipboard tool found (install wl-clipboard)";
    return false;
  }

  // wl-copy keeps a background process serving the selection; it inherits
  // any stderr pipe, so only stdin is connected.
  ProcessResult run = RunProcess(argv_, &text, /*capture_stderr=*/false);
  if (!run.started) {
    if (error) *error = run.error;
    return false;
  }
  if (!run.exited || run.exit_code != 0) {
    if (error) {
      *error = argv_[0] + (run.exited
                               ? " exited with code " + std::to_string(run.exit_code)
                               : " terminated by signal " +
                                     std::to_string(run.term_signal));
    }
    return false;
  }
  SPDLOG_LOGGER_DEBUG(logger_, "Copied {} bytes with {}", text.size(), argv_[0]);
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
