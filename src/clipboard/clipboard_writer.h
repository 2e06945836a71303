// Copyright 2026 The ocrgrab Authors
//
// Abstract clipboard text writer.

#ifndef OCRGRAB_CLIPBOARD_CLIPBOARD_WRITER_H_
#define OCRGRAB_CLIPBOARD_CLIPBOARD_WRITER_H_

#include <string>

namespace ocrgrab {
namespace internal {

class ClipboardWriter {
 public:
  virtual ~ClipboardWriter() = default;

  virtual std::string Name() const = 0;

  /// Put UTF-8 text on the system clipboard. Best effort: returns false with
  /// `error` set when the mechanism is absent or fails. Success only means
  /// the mechanism did not report an error.
  virtual bool WriteText(const std::string& text, std::string* error) = 0;

 protected:
  ClipboardWriter() = default;

 private:
  ClipboardWriter(const ClipboardWriter&) = delete;
  ClipboardWriter& operator=(const ClipboardWriter&) = delete;
};

}  // namespace internal
}  // namespace ocrgrab

#endif  // OCRGRAB_CLIPBOARD_CLIPBOARD_WRITER_H_
