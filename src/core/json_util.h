// Copyright 2026 The ocrgrab Authors
//
// Lightweight JSON helpers for the few flat daemon messages we exchange.
// Not a general parser: lookups scan for a "key": token and read the value
// that follows.

#ifndef OCRGRAB_CORE_JSON_UTIL_H_
#define OCRGRAB_CORE_JSON_UTIL_H_

#include <cstdint>
#include <string>

namespace ocrgrab {
namespace internal {

/// Quote and escape a UTF-8 string as a JSON string literal.
std::string JsonQuote(const std::string& value);

/// Find the string value of `key` at or after `start`. Escapes (including
/// \uXXXX and surrogate pairs) are decoded to UTF-8.
/// Returns false if the key is absent or its value is not a string.
bool JsonGetString(const std::string& json, const char* key,
                   std::string* out, size_t start = 0);

/// Find the integer value of `key` at or after `start`.
bool JsonGetInt64(const std::string& json, const char* key, int64_t* out,
                  size_t start = 0);

/// Position just past the "key": token, or npos.
size_t JsonFindKey(const std::string& json, const char* key,
                   size_t start = 0);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_JSON_UTIL_H_
