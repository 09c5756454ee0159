#pragma once

#include <string>

namespace gateway {

// Client-visible stream status for one run.
class StreamState {
 public:
  // True exactly once, on the first call.
  bool MarkOpened() {
    if (opened_) return false;
    opened_ = true;
    return true;
  }

  bool opened() const { return opened_; }

  // Diagnostics only; never replayed to the client.
  void Append(const std::string& text) { text_ += text; }
  const std::string& text() const { return text_; }

 private:
  bool opened_ = false;
  std::string text_;
};

}  // namespace gateway
