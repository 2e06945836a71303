// Copyright 2026 The ocrgrab Authors

#include "core/json_util.h"

#include <cstdio>
#include <cstdlib>

namespace ocrgrab {
namespace internal {

namespace {

bool IsJsonSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t SkipSpace(const std::string& json, size_t pos) {
  while (pos < json.size() && IsJsonSpace(json[pos])) ++pos;
  return pos;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool ReadHex4(const std::string& json, size_t pos, uint32_t* out) {
  if (pos + 4 > json.size()) return false;
  uint32_t v = 0;
  for (size_t i = 0; i < 4; ++i) {
    int h = HexValue(json[pos + i]);
    if (h < 0) return false;
    v = (v << 4) | static_cast<uint32_t>(h);
  }
  *out = v;
  return true;
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

std::string JsonQuote(const std::string& value) {
  std::string result;
  result.reserve(value.size() + 2);
  result += '"';
  for (unsigned char c : value) {
    switch (c) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  result += '"';
  return result;
}

size_t JsonFindKey(const std::string& json, const char* key, size_t start) {
  std::string pattern = std::string("\"") + key + "\"";
  size_t pos = start;
  while ((pos = json.find(pattern, pos)) != std::string::npos) {
    // A string value equal to the key is followed by ',' or '}', not ':'.
    size_t after = SkipSpace(json, pos + pattern.size());
    if (after < json.size() && json[after] == ':') return after + 1;
    pos += pattern.size();
  }
  return std::string::npos;
}

bool JsonGetString(const std::string& json, const char* key,
                   std::string* out, size_t start) {
  size_t pos = JsonFindKey(json, key, start);
  if (pos == std::string::npos) return false;
  pos = SkipSpace(json, pos);
  if (pos >= json.size() || json[pos] != '"') return false;
  ++pos;

  std::string result;
  while (pos < json.size() && json[pos] != '"') {
    char c = json[pos];
    if (c != '\\') {
      result += c;
      ++pos;
      continue;
    }
    if (pos + 1 >= json.size()) return false;
    char esc = json[pos + 1];
    pos += 2;
    switch (esc) {
      case '"':  result += '"';  break;
      case '\\': result += '\\'; break;
      case '/':  result += '/';  break;
      case 'b':  result += '\b'; break;
      case 'f':  result += '\f'; break;
      case 'n':  result += '\n'; break;
      case 'r':  result += '\r'; break;
      case 't':  result += '\t'; break;
      case 'u': {
        uint32_t cp = 0;
        if (!ReadHex4(json, pos, &cp)) return false;
        pos += 4;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          uint32_t low = 0;
          if (pos + 6 <= json.size() && json[pos] == '\\' &&
              json[pos + 1] == 'u' && ReadHex4(json, pos + 2, &low) &&
              low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            pos += 6;
          } else {
            cp = 0xFFFD;
          }
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          cp = 0xFFFD;
        }
        AppendUtf8(cp, &result);
        break;
      }
      default:
        return false;
    }
  }
  if (pos >= json.size()) return false;  // unterminated
  *out = result;
  return true;
}

bool JsonGetInt64(const std::string& json, const char* key, int64_t* out,
                  size_t start) {
  size_t pos = JsonFindKey(json, key, start);
  if (pos == std::string::npos) return false;
  pos = SkipSpace(json, pos);
  if (pos >= json.size()) return false;
  const char* begin = json.c_str() + pos;
  char* end = nullptr;
  long long v = std::strtoll(begin, &end, 10);
  if (end == begin) return false;
  *out = static_cast<int64_t>(v);
  return true;
}

}  // namespace internal
}  // namespace ocrgrab
