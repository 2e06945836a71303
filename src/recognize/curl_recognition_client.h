// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_RECOGNIZE_CURL_RECOGNITION_CLIENT_H_
#define OCRGRAB_RECOGNIZE_CURL_RECOGNITION_CLIENT_H_

#include <curl/curl.h>

#include "recognize/recognition_client.h"

namespace ocrgrab {
namespace internal {

/// Map a finished transfer to a transport outcome. `connected` is false when
/// the connection was never established (CURLINFO_CONNECT_TIME of zero); a
/// timeout in that phase means the daemon could not be contacted.
HttpResponse::Transport ClassifyCurlResult(CURLcode code, bool connected);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_RECOGNIZE_CURL_RECOGNITION_CLIENT_H_
