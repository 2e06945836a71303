// Copyright 2026 The ocrgrab Authors

#include "platform/windows/win_clipboard_writer.h"

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <cstring>
#include <utility>

#include "core/file_util.h"
#include "core/logger.h"

namespace ocrgrab {
namespace internal {

WinClipboardWriter::WinClipboardWriter(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

bool WinClipboardWriter::WriteText(const std::string& text,
                                   std::string* error) {
  // Line endings are kept as written to the .txt file.
  std::wstring wide = Widen(text);
  size_t bytes = (wide.size() + 1) * sizeof(wchar_t);

  HGLOBAL hmem = GlobalAlloc(GMEM_MOVEABLE, bytes);
  if (!hmem) {
    if (error) *error = "GlobalAlloc failed";
    return false;
  }
  void* dst = GlobalLock(hmem);
  if (!dst) {
    GlobalFree(hmem);
    if (error) *error = "GlobalLock failed";
    return false;
  }
  std::memcpy(dst, wide.c_str(), bytes);
  GlobalUnlock(hmem);

  if (!OpenClipboard(nullptr)) {
    GlobalFree(hmem);
    if (error) {
      *error = "OpenClipboard failed, GetLastError=" +
               std::to_string(GetLastError());
    }
    return false;
  }
  EmptyClipboard();
  if (!SetClipboardData(CF_UNICODETEXT, hmem)) {
    DWORD code = GetLastError();
    CloseClipboard();
    GlobalFree(hmem);
    if (error) {
      *error = "SetClipboardData failed, GetLastError=" + std::to_string(code);
    }
    return false;
  }
  // The clipboard owns hmem now.
  CloseClipboard();
  SPDLOG_LOGGER_DEBUG(logger_, "Copied {} UTF-16 units to the clipboard",
                      wide.size());
  return true;
}

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32
