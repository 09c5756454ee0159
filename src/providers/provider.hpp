#pragma once

#include "tooling.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

struct ModelInfo {
  std::string id;
  std::string owned_by;
};

// One chat turn in provider wire terms. role is "system", "user",
// "assistant" or "tool".
struct ChatMessage {
  std::string role;
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::string tool_call_id;
  std::string name;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::vector<ToolSchema> tools;
  bool stream = false;
  std::optional<int> max_tokens;
  std::optional<float> temperature;
};

struct ChatResponse {
  std::string model;
  std::string content;
  std::vector<ToolCall> tool_calls;
  bool done = true;
  std::string finish_reason = "stop";
};

// Return false to stop delivery.
using DeltaCallback = std::function<bool(const std::string& delta)>;
using DoneCallback = std::function<void(const ChatResponse& response)>;

class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string Name() const = 0;
  virtual std::vector<ModelInfo> ListModels(std::string* err) = 0;

  virtual std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) = 0;
  virtual bool ChatStream(const ChatRequest& req,
                          const DeltaCallback& on_delta,
                          const DoneCallback& on_done,
                          std::string* err) = 0;
};

// Streams a completed response as content deltas of at most 64 bytes. Cuts
// never fall inside a UTF-8 sequence.
inline bool StreamChunked(const ChatResponse& once, const DeltaCallback& on_delta, const DoneCallback& on_done, std::string* err) {
  constexpr size_t kChunkSize = 64;
  const std::string& text = once.content;
  size_t i = 0;
  while (i < text.size()) {
    size_t end = std::min(i + kChunkSize, text.size());
    while (end < text.size() && end > i && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) end--;
    if (end == i) end = std::min(i + kChunkSize, text.size());
    if (!on_delta(text.substr(i, end - i))) {
      if (err) *err = "stream stopped by consumer";
      return false;
    }
    i = end;
  }
  on_done(once);
  return true;
}

}  // namespace gateway
