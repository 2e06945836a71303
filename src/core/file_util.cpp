// Copyright 2026 The ocrgrab Authors

#include "core/file_util.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace ocrgrab {
namespace internal {

namespace {

#ifdef _WIN32
constexpr char kSeparator = '\\';

FILE* OpenFile(const std::string& path, const wchar_t* mode) {
  return _wfopen(Widen(path).c_str(), mode);
}
#else
constexpr char kSeparator = '/';

FILE* OpenFile(const std::string& path, const char* mode) {
  return std::fopen(path.c_str(), mode);
}
#endif

bool IsSeparator(char c) {
#ifdef _WIN32
  return c == '/' || c == '\\';
#else
  return c == '/';
#endif
}

size_t LastSeparator(const std::string& path) {
  for (size_t i = path.size(); i > 0; --i) {
    if (IsSeparator(path[i - 1])) return i - 1;
  }
  return std::string::npos;
}

bool MakeOneDirectory(const std::string& path) {
#ifdef _WIN32
  if (CreateDirectoryW(Widen(path).c_str(), nullptr)) return true;
  return GetLastError() == ERROR_ALREADY_EXISTS && IsDirectory(path);
#else
  if (mkdir(path.c_str(), 0755) == 0) return true;
  return errno == EEXIST && IsDirectory(path);
#endif
}

}  // namespace

#ifdef _WIN32
std::wstring Widen(const std::string& utf8) {
  if (utf8.empty()) return {};
  int len = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, nullptr, 0);
  if (len <= 0) return {};
  std::wstring out(static_cast<size_t>(len), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, &out[0], len);
  out.resize(static_cast<size_t>(len - 1));
  return out;
}

std::string Narrow(const wchar_t* wide) {
  if (!wide || !wide[0]) return {};
  int len = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr,
                                nullptr);
  if (len <= 0) return {};
  std::string out(static_cast<size_t>(len), '\0');
  WideCharToMultiByte(CP_UTF8, 0, wide, -1, &out[0], len, nullptr, nullptr);
  out.resize(static_cast<size_t>(len - 1));
  return out;
}
#endif

std::string HomeDirectory() {
#ifdef _WIN32
  const wchar_t* profile = _wgetenv(L"USERPROFILE");
  if (profile && profile[0]) return Narrow(profile);
  return {};
#else
  const char* home = std::getenv("HOME");
  if (home && home[0]) return home;
  struct passwd* pw = getpwuid(getuid());
  if (pw && pw->pw_dir) return pw->pw_dir;
  return {};
#endif
}

std::string JoinPath(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  if (IsSeparator(a.back())) return a + b;
  return a + kSeparator + b;
}

std::string ParentDirectory(const std::string& path) {
  size_t sep = LastSeparator(path);
  if (sep == std::string::npos) return {};
  if (sep == 0) return path.substr(0, 1);
  return path.substr(0, sep);
}

std::string ReplaceExtension(const std::string& path,
                             const std::string& extension) {
  size_t sep = LastSeparator(path);
  size_t name_start = (sep == std::string::npos) ? 0 : sep + 1;
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || dot <= name_start) return path + extension;
  return path.substr(0, dot) + extension;
}

std::string ExpandHome(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;
  if (path.size() > 1 && !IsSeparator(path[1])) return path;
  return HomeDirectory() + path.substr(1);
}

bool PathExists(const std::string& path) {
#ifdef _WIN32
  return GetFileAttributesW(Widen(path).c_str()) != INVALID_FILE_ATTRIBUTES;
#else
  struct stat st;
  return stat(path.c_str(), &st) == 0;
#endif
}

bool IsDirectory(const std::string& path) {
#ifdef _WIN32
  DWORD attr = GetFileAttributesW(Widen(path).c_str());
  return attr != INVALID_FILE_ATTRIBUTES && (attr & FILE_ATTRIBUTE_DIRECTORY);
#else
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
#endif
}

int64_t FileSize(const std::string& path) {
#ifdef _WIN32
  WIN32_FILE_ATTRIBUTE_DATA data;
  if (!GetFileAttributesExW(Widen(path).c_str(), GetFileExInfoStandard,
                            &data) ||
      (data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY)) {
    return -1;
  }
  return (static_cast<int64_t>(data.nFileSizeHigh) << 32) |
         data.nFileSizeLow;
#else
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return -1;
  return static_cast<int64_t>(st.st_size);
#endif
}

bool MakeDirectories(const std::string& path, std::string* error) {
  if (path.empty()) {
    if (error) *error = "empty directory path";
    return false;
  }
  if (IsDirectory(path)) return true;

  // Create each prefix in turn; existing components are fine.
  for (size_t i = 1; i <= path.size(); ++i) {
    if (i != path.size() && !IsSeparator(path[i])) continue;
    std::string prefix = path.substr(0, i);
    if (prefix.empty() || IsSeparator(prefix.back())) continue;
#ifdef _WIN32
    if (prefix.size() == 2 && prefix[1] == ':') continue;  // drive letter
#endif
    if (!MakeOneDirectory(prefix)) {
      if (error) {
        *error = "cannot create directory " + prefix + ": " +
                 std::strerror(errno);
      }
      return false;
    }
  }
  return true;
}

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* out,
                   std::string* error) {
#ifdef _WIN32
  FILE* f = OpenFile(path, L"rb");
#else
  FILE* f = OpenFile(path, "rb");
#endif
  if (!f) {
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  out->clear();
  uint8_t buf[64 * 1024];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    out->insert(out->end(), buf, buf + n);
  }
  bool ok = !std::ferror(f);
  std::fclose(f);
  if (!ok && error) *error = "read error on " + path;
  return ok;
}

bool WriteFileBytes(const std::string& path, const std::string& data,
                    std::string* error) {
#ifdef _WIN32
  FILE* f = OpenFile(path, L"wb");
#else
  FILE* f = OpenFile(path, "wb");
#endif
  if (!f) {
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  size_t written = std::fwrite(data.data(), 1, data.size(), f);
  bool ok = written == data.size();
  if (!ok && error) {
    *error = "short write on " + path + ": " + std::strerror(errno);
  }
  if (std::fclose(f) != 0 && ok) {
    ok = false;
    if (error) *error = "close failed on " + path + ": " + std::strerror(errno);
  }
  return ok;
}

bool RemoveFile(const std::string& path) {
#ifdef _WIN32
  if (DeleteFileW(Widen(path).c_str())) return true;
#else
  if (unlink(path.c_str()) == 0) return true;
#endif
  return !PathExists(path);
}

}  // namespace internal
}  // namespace ocrgrab
