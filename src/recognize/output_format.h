// Copyright 2026 The ocrgrab Authors
//
// Post-processing of raw model output before it is written.

#ifndef OCRGRAB_RECOGNIZE_OUTPUT_FORMAT_H_
#define OCRGRAB_RECOGNIZE_OUTPUT_FORMAT_H_

#include <string>

#include "ocrgrab/ocrgrab.h"

namespace ocrgrab {
namespace internal {

/// CSS prepended to styled HTML tables.
extern const char kTableStyleBlock[];

/// Remove leading/trailing whitespace.
std::string TrimWhitespace(const std::string& text);

/// Wrap every HTML <table> in a horizontally scrollable div and prepend
/// kTableStyleBlock unless the text has its own <style>. Text without an
/// HTML table (e.g. a Markdown table) is returned unchanged.
std::string ApplyTableStyling(const std::string& text);

/// Full post-processing for `mode`: strip daemon chatter, trim, and style
/// tables in table mode. An empty result means nothing was recognized.
std::string FormatRecognizedText(OcrGrabMode mode, const std::string& raw);

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_RECOGNIZE_OUTPUT_FORMAT_H_
