// Copyright 2026 The ocrgrab Authors

#include "platform/linux/detached_editor_launcher.h"

#include <utility>
#include <vector>

#include "core/logger.h"
#include "platform/linux/posix_process.h"

namespace ocrgrab {
namespace internal {

DetachedEditorLauncher::DetachedEditorLauncher(
    std::string command, std::shared_ptr<spdlog::logger> logger)
    : command_(std::move(command)), logger_(std::move(logger)) {}

std::string DetachedEditorLauncher::Name() const {
  std::vector<std::string> argv = SplitCommandLine(command_);
  return argv.empty() ? std::string("(none)") : argv[0];
}

bool DetachedEditorLauncher::Open(const std::string& path, std::string* error) {
  std::vector<std::string> argv = SplitCommandLine(command_);
  if (argv.empty()) {
    if (error) *error = "no editor configured";
    return false;
  }
  argv.push_back(path);
  if (!SpawnDetached(argv, error)) return false;
  SPDLOG_LOGGER_DEBUG(logger_, "Started {} on {}", argv[0], path);
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
