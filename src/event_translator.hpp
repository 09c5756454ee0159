#pragma once

#include "run_events.hpp"
#include "sse.hpp"
#include "stream_state.hpp"
#include "tool_call_tracker.hpp"

#include <string>
#include <vector>

namespace gateway {

struct TranslatorOptions {
  // When the run streams tokens on the messages channel, AI text carried by
  // node updates is a duplicate and is dropped.
  bool text_from_token_channel = true;
};

// Turns runtime events of one run into SSE frames. Every emitted frame is
// preceded, once per run, by stream_start.
class EventTranslator {
 public:
  EventTranslator(std::string user_input, ToolCallTracker* tracker, StreamState* state, TranslatorOptions options = {});

  std::vector<SseFrame> Translate(const RunEvent& event);

 private:
  void TranslateUpdate(const UpdateEvent& ev, std::vector<SseFrame>* out);
  void TranslateInterrupt(const InterruptEvent& ev, std::vector<SseFrame>* out);
  void TranslateChunk(const MessageChunkEvent& ev, std::vector<SseFrame>* out);
  void TranslateCustom(const CustomEvent& ev, std::vector<SseFrame>* out);
  void TranslateMessage(const AgentMessage& msg, std::vector<SseFrame>* out);

  void Emit(SseFrame frame, std::vector<SseFrame>* out);

  std::string user_input_;
  ToolCallTracker* tracker_;
  StreamState* state_;
  TranslatorOptions options_;
};

}  // namespace gateway
