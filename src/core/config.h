// Copyright 2026 The ocrgrab Authors
//
// Runtime configuration: defaults, overridden by an INI-style settings file
// (Linux: ~/.config/ocrgrab/settings.ini, Windows: %APPDATA%\ocrgrab\...).

#ifndef OCRGRAB_CORE_CONFIG_H_
#define OCRGRAB_CORE_CONFIG_H_

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace ocrgrab {
namespace internal {

struct Config {
  // Recognition daemon.
  std::string daemon_url = "http://localhost:11434";
  std::string model = "glm-ocr";
  int timeout_seconds = 180;
  bool processor_diagnostics = true;

  // Files.
  std::string output_dir;  // default: ~/Pictures/ocr
  std::string debug_log;   // default: ~/ocr_debug.log

  // Platform tools. Empty means the platform default.
  std::string capture_command;
  std::string clipboard_command;
  std::string editor;
  bool open_editor = true;

  // Sanitizer.
  bool sanitize = true;
  int max_dimension = 1120;

  std::string log_level = "info";
};

/// Defaults with per-user paths filled in.
Config DefaultConfig();

/// ~/.config/ocrgrab/settings.ini (or the platform equivalent).
std::string DefaultConfigPath();

/// Parse "key = value" lines. Blank lines, '#'/';' comments and [section]
/// headers are skipped.
std::unordered_map<std::string, std::string> ParseSettings(std::istream& in);

/// Apply one setting. Returns false with `error` set for an unknown key or a
/// malformed value; `config` is left unchanged in that case.
bool ApplySetting(const std::string& key, const std::string& value,
                  Config* config, std::string* error);

/// Load a settings file on top of `config`. A missing file returns false
/// with `error` set. Bad entries are skipped and reported in `warnings`.
bool LoadConfigFile(const std::string& path, Config* config,
                    std::vector<std::string>* warnings, std::string* error);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_CONFIG_H_
