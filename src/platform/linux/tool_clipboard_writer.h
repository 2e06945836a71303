// Copyright 2026 The ocrgrab Authors
//
// Clipboard writer that pipes text into an external tool (wl-copy, xclip).

#ifndef OCRGRAB_PLATFORM_LINUX_TOOL_CLIPBOARD_WRITER_H_
#define OCRGRAB_PLATFORM_LINUX_TOOL_CLIPBOARD_WRITER_H_

#include <memory>
#include <string>
#include <vector>

#include "spdlog/logger.h"

#include "clipboard/clipboard_writer.h"

namespace ocrgrab {
namespace internal {

class ToolClipboardWriter : public ClipboardWriter {
 public:
  /// `argv` receives the text on stdin. Empty argv means no tool was found;
  /// every write then fails.
  ToolClipboardWriter(std::vector<std::string> argv,
                      std::shared_ptr<spdlog::logger> logger);

  std::string Name() const override;
  bool WriteText(const std::string& text, std::string* error) override;

 private:
  std::vector<std::string> argv_;
  std::shared_ptr<spdlog::logger> logger_;
};

/// Pick a clipboard command: `configured` if set, else the first of
/// wl-copy, xclip, xsel found on $PATH. Empty if none.
std::vector<std::string> DetectClipboardCommand(const std::string& configured);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_PLATFORM_LINUX_TOOL_CLIPBOARD_WRITER_H_
