// Copyright 2026 The ocrgrab Authors

#include "recognize/output_format.h"

#include <cctype>

namespace ocrgrab {
namespace internal {

const char kTableStyleBlock[] =
    "<style>\n"
    "table {\n"
    "  width: auto;\n"
    "  max-width: 100%;\n"
    "  display: inline-table;\n"
    "  border-collapse: collapse;\n"
    "  font-family: sans-serif;\n"
    "  font-size: 14px;\n"
    "}\n"
    "\n"
    "th, td {\n"
    "  padding: 8px 10px;\n"
    "  border: 1px solid #ddd;\n"
    "  text-align: left;\n"
    "  vertical-align: top;\n"
    "  max-width: 48ch;\n"
    "  white-space: normal;\n"
    "  overflow-wrap: anywhere;\n"
    "}\n"
    "\n"
    "th {\n"
    "  background: #f5f5f5;\n"
    "  font-weight: 600;\n"
    "}\n"
    "</style>\n";

namespace {

constexpr char kScrollDivOpen[] = "<div style=\"overflow-x:auto;\">";
constexpr char kTableClose[] = "</table>";

std::string ToLower(const std::string& s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

// True if `lower` has an opening <table> tag at `pos` ("<table>" or
// "<table " with attributes, not "<tablefoo>").
bool IsTableOpenTag(const std::string& lower, size_t pos) {
  if (lower.compare(pos, 6, "<table") != 0) return false;
  size_t next = pos + 6;
  if (next >= lower.size()) return false;
  char c = lower[next];
  return c == '>' || std::isspace(static_cast<unsigned char>(c));
}

// Remove "Added image '...'" notices some daemon front ends echo.
std::string StripImageNotices(const std::string& text) {
  static const std::string kNotice = "Added image '";
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t hit = text.find(kNotice, pos);
    if (hit == std::string::npos) break;
    size_t end = text.find('\'', hit + kNotice.size());
    if (end == std::string::npos) break;
    out.append(text, pos, hit - pos);
    pos = end + 1;
  }
  out.append(text, pos, std::string::npos);
  return out;
}

}  // namespace

std::string TrimWhitespace(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string ApplyTableStyling(const std::string& text) {
  const std::string lower = ToLower(text);
  if (lower.find("<table") == std::string::npos) return text;

  std::string styled;
  styled.reserve(text.size() + 256);
  size_t i = 0;
  while (i < text.size()) {
    if (lower[i] == '<') {
      if (IsTableOpenTag(lower, i)) {
        styled += kScrollDivOpen;
        styled += '<';
        ++i;
        continue;
      }
      if (lower.compare(i, sizeof(kTableClose) - 1, kTableClose) == 0) {
        styled.append(text, i, sizeof(kTableClose) - 1);
        styled += "</div>";
        i += sizeof(kTableClose) - 1;
        continue;
      }
    }
    styled += text[i];
    ++i;
  }

  if (lower.find("<style") != std::string::npos) return styled;
  return std::string(kTableStyleBlock) + "\n" + styled;
}

std::string FormatRecognizedText(OcrGrabMode mode, const std::string& raw) {
  std::string text = TrimWhitespace(StripImageNotices(raw));
  if (text.empty()) return text;
  if (mode == kOcrGrabModeTable) text = ApplyTableStyling(text);
  return text;
}

}  // namespace internal
}  // namespace ocrgrab
