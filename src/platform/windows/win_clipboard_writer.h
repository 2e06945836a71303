// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_PLATFORM_WINDOWS_WIN_CLIPBOARD_WRITER_H_
#define OCRGRAB_PLATFORM_WINDOWS_WIN_CLIPBOARD_WRITER_H_

#ifdef _WIN32

#include <memory>
#include <string>

#include "spdlog/logger.h"

#include "clipboard/clipboard_writer.h"

namespace ocrgrab {
namespace internal {

/// Places text on the Win32 clipboard as CF_UNICODETEXT.
class WinClipboardWriter : public ClipboardWriter {
 public:
  explicit WinClipboardWriter(std::shared_ptr<spdlog::logger> logger);

  std::string Name() const override { return "win32-clipboard"; }
  bool WriteText(const std::string& text, std::string* error) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32

#endif  // OCRGRAB_PLATFORM_WINDOWS_WIN_CLIPBOARD_WRITER_H_
