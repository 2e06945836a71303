// Copyright 2026 The ocrgrab Authors

#include "platform/windows/win_editor_launcher.h"

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <utility>
#include <vector>

#include "core/file_util.h"
#include "core/logger.h"

namespace ocrgrab {
namespace internal {

WinEditorLauncher::WinEditorLauncher(std::string editor,
                                     std::shared_ptr<spdlog::logger> logger)
    : editor_(std::move(editor)), logger_(std::move(logger)) {}

bool WinEditorLauncher::Open(const std::string& path, std::string* error) {
  std::wstring editor = Widen(editor_);
  wchar_t resolved[MAX_PATH] = {};
  DWORD found = SearchPathW(nullptr, editor.c_str(), L".exe", MAX_PATH,
                            resolved, nullptr);
  if (found == 0 || found >= MAX_PATH) {
    if (error) *error = editor_ + " not found";
    return false;
  }

  // CreateProcessW may modify the command line buffer.
  std::wstring command =
      L"\"" + std::wstring(resolved) + L"\" \"" + Widen(path) + L"\"";
  std::vector<wchar_t> buffer(command.begin(), command.end());
  buffer.push_back(L'\0');

  STARTUPINFOW si = {};
  si.cb = sizeof(si);
  PROCESS_INFORMATION pi = {};
  if (!CreateProcessW(resolved, buffer.data(), nullptr, nullptr, FALSE,
                      DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr,
                      nullptr, &si, &pi)) {
    if (error) {
      *error = "CreateProcessW failed, GetLastError=" +
               std::to_string(GetLastError());
    }
    return false;
  }
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  SPDLOG_LOGGER_DEBUG(logger_, "Started {} on {}", Narrow(resolved), path);
  return true;
}

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32
