// Copyright 2026 The ocrgrab Authors

#include "core/recognition_mode.h"

#include <algorithm>
#include <cctype>

namespace ocrgrab {
namespace internal {

bool ParseMode(const std::string& arg, OcrGrabMode* out_mode) {
  std::string lower(arg);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower.empty()) {
    *out_mode = kOcrGrabModeText;
    return true;
  }
  // "table" and "figure" win over "text" when several appear.
  if (lower.find("table") != std::string::npos) {
    *out_mode = kOcrGrabModeTable;
    return true;
  }
  if (lower.find("figure") != std::string::npos) {
    *out_mode = kOcrGrabModeFigure;
    return true;
  }
  if (lower.find("text") != std::string::npos) {
    *out_mode = kOcrGrabModeText;
    return true;
  }
  return false;
}

bool IsValidMode(OcrGrabMode mode) {
  return mode == kOcrGrabModeText || mode == kOcrGrabModeTable ||
         mode == kOcrGrabModeFigure;
}

const char* ModeName(OcrGrabMode mode) {
  switch (mode) {
    case kOcrGrabModeText:   return "text";
    case kOcrGrabModeTable:  return "table";
    case kOcrGrabModeFigure: return "figure";
  }
  return "unknown";
}

const char* ModeDisplayName(OcrGrabMode mode) {
  switch (mode) {
    case kOcrGrabModeText:   return "Text Recognition";
    case kOcrGrabModeTable:  return "Table Recognition";
    case kOcrGrabModeFigure: return "Figure Recognition";
  }
  return "Unknown";
}

const char* ModeInstruction(OcrGrabMode mode) {
  switch (mode) {
    case kOcrGrabModeText:   return "Text Recognition:";
    case kOcrGrabModeTable:  return "Table Recognition:";
    case kOcrGrabModeFigure: return "Figure Recognition:";
  }
  return "Text Recognition:";
}

}  // namespace internal
}  // namespace ocrgrab
