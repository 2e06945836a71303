// Copyright 2026 The ocrgrab Authors
//
// Small filesystem helpers shared by the pipeline stages.

#ifndef OCRGRAB_CORE_FILE_UTIL_H_
#define OCRGRAB_CORE_FILE_UTIL_H_

#include <cstdint>
#include <string>
#include <vector>

namespace ocrgrab {
namespace internal {

/// Current user's home directory ($HOME, or %USERPROFILE% on Windows).
/// Empty if it cannot be determined.
std::string HomeDirectory();

/// Join two path components with the platform separator.
std::string JoinPath(const std::string& a, const std::string& b);

/// Directory part of a path ("" when there is none).
std::string ParentDirectory(const std::string& path);

/// Replace the extension of the last path component. A leading dot in the
/// file name does not start an extension (".hidden" -> ".hidden.txt").
/// `extension` includes the dot.
std::string ReplaceExtension(const std::string& path,
                             const std::string& extension);

/// Expand a leading "~" to the home directory.
std::string ExpandHome(const std::string& path);

bool PathExists(const std::string& path);
bool IsDirectory(const std::string& path);

/// Size of a regular file in bytes, or -1 if it does not exist.
int64_t FileSize(const std::string& path);

/// Create a directory and any missing parents.
bool MakeDirectories(const std::string& path, std::string* error);

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* out,
                   std::string* error);

/// Write `data` exactly (binary mode), replacing any existing file.
bool WriteFileBytes(const std::string& path, const std::string& data,
                    std::string* error);

/// Remove a file. Returns true if it is gone afterwards.
bool RemoveFile(const std::string& path);

#ifdef _WIN32
/// UTF-8 <-> UTF-16 for Win32 wide APIs.
std::wstring Widen(const std::string& utf8);
std::string Narrow(const wchar_t* wide);
#endif

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_FILE_UTIL_H_
