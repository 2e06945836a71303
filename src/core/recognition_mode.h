// Copyright 2026 The ocrgrab Authors

#ifndef OCRGRAB_CORE_RECOGNITION_MODE_H_
#define OCRGRAB_CORE_RECOGNITION_MODE_H_

#include <string>

#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

/// Parse a mode argument. Matching is case-insensitive and by substring, so
/// "table", "--table" and "Table Recognition" all select the table mode.
/// An empty argument selects text. Returns false for unknown input.
bool ParseMode(const std::string& arg, OcrGrabMode* out_mode);

bool IsValidMode(OcrGrabMode mode);

const char* ModeName(OcrGrabMode mode);
const char* ModeDisplayName(OcrGrabMode mode);

/// Instruction prefixed to the request; the model keys its output format on
/// it. Fixed per mode.
const char* ModeInstruction(OcrGrabMode mode);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CORE_RECOGNITION_MODE_H_
