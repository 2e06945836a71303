// Copyright 2026 The ocrgrab Authors

#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "core/file_util.h"

namespace ocrgrab {
namespace internal {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

bool ParseBool(const std::string& value, bool* out) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    *out = true;
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParsePositiveInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = nullptr;
  long v = std::strtol(value.c_str(), &end, 10);
  if (*end != '\0' || v <= 0 || v > 1000000) return false;
  *out = static_cast<int>(v);
  return true;
}

std::string ConfigHome() {
#ifdef _WIN32
  const char* appdata = std::getenv("APPDATA");
  if (appdata && appdata[0]) return appdata;
  return JoinPath(HomeDirectory(), "AppData\\Roaming");
#else
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0]) return xdg;
  return JoinPath(HomeDirectory(), ".config");
#endif
}

}  // namespace

Config DefaultConfig() {
  Config config;
  std::string home = HomeDirectory();
  config.output_dir = JoinPath(JoinPath(home, "Pictures"), "ocr");
  config.debug_log = JoinPath(home, "ocr_debug.log");
  return config;
}

std::string DefaultConfigPath() {
  return JoinPath(JoinPath(ConfigHome(), "ocrgrab"), "settings.ini");
}

std::unordered_map<std::string, std::string> ParseSettings(std::istream& in) {
  std::unordered_map<std::string, std::string> data;
  std::string line;
  while (std::getline(in, line)) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';' ||
        trimmed[0] == '[') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    // Allow quoted values so commands can keep leading/trailing spaces.
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
      val = val.substr(1, val.size() - 2);
    }
    data[key] = val;
  }
  return data;
}

bool ApplySetting(const std::string& key, const std::string& value,
                  Config* config, std::string* error) {
  auto bad_value = [&](const char* expected) {
    if (error) *error = key + ": expected " + expected + ", got '" + value + "'";
    return false;
  };

  if (key == "daemon_url") {
    if (value.empty()) return bad_value("a URL");
    config->daemon_url = value;
    while (config->daemon_url.size() > 1 && config->daemon_url.back() == '/')
      config->daemon_url.pop_back();
  } else if (key == "model") {
    if (value.empty()) return bad_value("a model name");
    config->model = value;
  } else if (key == "timeout_seconds") {
    if (!ParsePositiveInt(value, &config->timeout_seconds))
      return bad_value("a positive integer");
  } else if (key == "processor_diagnostics") {
    if (!ParseBool(value, &config->processor_diagnostics))
      return bad_value("a boolean");
  } else if (key == "output_dir") {
    if (value.empty()) return bad_value("a directory");
    config->output_dir = ExpandHome(value);
  } else if (key == "debug_log") {
    if (value.empty()) return bad_value("a file path");
    config->debug_log = ExpandHome(value);
  } else if (key == "capture_command") {
    config->capture_command = value;
  } else if (key == "clipboard_command") {
    config->clipboard_command = value;
  } else if (key == "editor") {
    config->editor = value;
  } else if (key == "open_editor") {
    if (!ParseBool(value, &config->open_editor)) return bad_value("a boolean");
  } else if (key == "sanitize") {
    if (!ParseBool(value, &config->sanitize)) return bad_value("a boolean");
  } else if (key == "max_dimension") {
    int dim = 0;
    if (!ParsePositiveInt(value, &dim) || dim < 28)
      return bad_value("an integer >= 28");
    config->max_dimension = dim;
  } else if (key == "log_level") {
    config->log_level = value;
  } else {
    if (error) *error = "unknown setting '" + key + "'";
    return false;
  }
  return true;
}

bool LoadConfigFile(const std::string& path, Config* config,
                    std::vector<std::string>* warnings, std::string* error) {
  std::ifstream f(path);
  if (!f) {
    if (error) *error = "cannot open config file " + path;
    return false;
  }
  auto data = ParseSettings(f);

  // Apply in a stable order so warnings are reproducible.
  std::vector<std::string> keys;
  keys.reserve(data.size());
  for (const auto& kv : data) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());

  for (const auto& key : keys) {
    std::string detail;
    if (!ApplySetting(key, data[key], config, &detail) && warnings) {
      warnings->push_back(detail);
    }
  }
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
