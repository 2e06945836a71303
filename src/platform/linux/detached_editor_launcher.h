// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_PLATFORM_LINUX_DETACHED_EDITOR_LAUNCHER_H_
#define OCRGRAB_PLATFORM_LINUX_DETACHED_EDITOR_LAUNCHER_H_

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "editor/editor_launcher.h"

namespace ocrgrab {
namespace internal {

constexpr char kDefaultLinuxEditor[] = "kwrite";

/// Starts `command <path>` in its own session and returns immediately.
class DetachedEditorLauncher : public EditorLauncher {
 public:
  DetachedEditorLauncher(std::string command,
                         std::shared_ptr<spdlog::logger> logger);

  std::string Name() const override;
  bool Open(const std::string& path, std::string* error) override;

 private:
  std::string command_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_PLATFORM_LINUX_DETACHED_EDITOR_LAUNCHER_H_
