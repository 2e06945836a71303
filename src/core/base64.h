// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_BASE64_H_
#define OCRGRAB_CORE_BASE64_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace ocrgrab {
namespace internal {

/// Standard base64 (RFC 4648) with '=' padding, no line breaks.
std::string Base64Encode(const uint8_t* data, size_t size);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_BASE64_H_
