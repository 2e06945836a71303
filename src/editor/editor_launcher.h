// Copyright 2026 The ocrgrab Authors
//
// Abstract external editor launcher.

#ifndef OCRGRAB_EDITOR_EDITOR_LAUNCHER_H_
#define OCRGRAB_EDITOR_EDITOR_LAUNCHER_H_

#include <string>

namespace ocrgrab {
namespace internal {

class EditorLauncher {
 public:
  virtual ~EditorLauncher() = default;

  virtual std::string Name() const = 0;

  /// Start the editor on `path`, detached. Never waits for it to exit.
  /// Returns false with `error` set if the editor could not be started.
  virtual bool Open(const std::string& path, std::string* error) = 0;

 protected:
  EditorLauncher() = default;

 private:
  EditorLauncher(const EditorLauncher&) = delete;
  EditorLauncher& operator=(const EditorLauncher&) = delete;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_EDITOR_EDITOR_LAUNCHER_H_
