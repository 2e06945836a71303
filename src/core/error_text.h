// Copyright 2026 The ocrgrab Authors
//
// Descriptions, remediation hints and process exit codes for result codes.

#ifndef OCRGRAB_CORE_ERROR_TEXT_H_
#define OCRGRAB_CORE_ERROR_TEXT_H_

#include <string>

#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

/// Exit status for command-line usage errors (BSD sysexits EX_USAGE).
constexpr int kExitUsage = 64;

const char* ErrorString(OcrGrabError error);

/// Actionable next step for a fatal kind, "" when none applies. `model` is
/// substituted into the pull hint.
std::string ErrorRemediation(OcrGrabError error, const std::string& model);

int ExitCodeFor(OcrGrabError error);

const char* StateName(OcrGrabRunState state);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_ERROR_TEXT_H_
