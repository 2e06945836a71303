// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_PLATFORM_WINDOWS_WIN_EDITOR_LAUNCHER_H_
#define OCRGRAB_PLATFORM_WINDOWS_WIN_EDITOR_LAUNCHER_H_

#ifdef _WIN32

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "editor/editor_launcher.h"

namespace ocrgrab {
namespace internal {

constexpr char kDefaultWindowsEditor[] = "notepad.exe";

/// Starts `editor "<path>"` as a detached process.
class WinEditorLauncher : public EditorLauncher {
 public:
  WinEditorLauncher(std::string editor,
                    std::shared_ptr<spdlog::logger> logger);

  std::string Name() const override { return editor_; }
  bool Open(const std::string& path, std::string* error) override;

 private:
  std::string editor_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32

#endif  // OCRGRAB_PLATFORM_WINDOWS_WIN_EDITOR_LAUNCHER_H_
