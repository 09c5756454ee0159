#include "event_translator.hpp"

#include "errors.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace gateway {
namespace {

static void LogAnomaly(const std::string& what, const std::string& detail) {
  std::cout << "[stream-anomaly] " << what << " " << detail << "\n";
}

static bool HasTag(const std::vector<std::string>& tags, const char* tag) {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

}  // namespace

EventTranslator::EventTranslator(std::string user_input,
                                 ToolCallTracker* tracker,
                                 StreamState* state,
                                 TranslatorOptions options)
    : user_input_(std::move(user_input)), tracker_(tracker), state_(state), options_(options) {}

std::vector<SseFrame> EventTranslator::Translate(const RunEvent& event) {
  std::vector<SseFrame> out;
  if (const auto* update = std::get_if<UpdateEvent>(&event)) {
    TranslateUpdate(*update, &out);
  } else if (const auto* interrupt = std::get_if<InterruptEvent>(&event)) {
    TranslateInterrupt(*interrupt, &out);
  } else if (const auto* chunk = std::get_if<MessageChunkEvent>(&event)) {
    TranslateChunk(*chunk, &out);
  } else if (const auto* custom = std::get_if<CustomEvent>(&event)) {
    TranslateCustom(*custom, &out);
  }
  // Values snapshots repeat what updates already delivered.
  return out;
}

void EventTranslator::Emit(SseFrame frame, std::vector<SseFrame>* out) {
  if (state_->MarkOpened()) out->push_back(StreamStartFrame());
  out->push_back(std::move(frame));
}

void EventTranslator::TranslateUpdate(const UpdateEvent& ev, std::vector<SseFrame>* out) {
  for (const auto& msg : ev.messages) {
    try {
      TranslateMessage(msg, out);
    } catch (const std::exception& e) {
      std::cout << "[stream] message translation failed node=" << ev.node << " role=" << RoleName(msg.role)
                << " error=" << e.what() << "\n";
      if (!msg.tool_call_id.empty()) tracker_->Resolve(msg.tool_call_id);
      Emit(ErrorFrame("Unexpected error"), out);
    }
  }
}

void EventTranslator::TranslateMessage(const AgentMessage& msg, std::vector<SseFrame>* out) {
  switch (msg.role) {
    case MessageRole::kHuman: {
      const auto text = ContentToString(msg.content);
      if (text == user_input_) return;
      if (!text.empty()) Emit(TokenFrame(text), out);
      return;
    }
    case MessageRole::kAi: {
      if (!msg.tool_calls.empty()) {
        for (const auto& call : msg.tool_calls) {
          if (call.id.empty()) throw TranslationError("tool call without id: " + call.name);
          tracker_->RecordStart(call.id, call.name, call.args);
          Emit(ToolStartFrame(call.name, call.args), out);
        }
        return;
      }
      if (options_.text_from_token_channel) return;
      const auto text = ContentToString(RemoveToolCallParts(msg.content));
      if (text.empty()) return;
      state_->Append(text);
      Emit(TokenFrame(text), out);
      return;
    }
    case MessageRole::kTool: {
      if (msg.tool_call_id.empty()) throw TranslationError("tool result without tool_call_id");
      auto pending = tracker_->Resolve(msg.tool_call_id);
      if (!pending) {
        LogAnomaly("unmatched tool result", "tool_call_id=" + msg.tool_call_id + " name=" + msg.name);
        return;
      }
      if (msg.status == "error") {
        Emit(ToolErrorFrame(pending->name, ContentToString(msg.content)), out);
      } else {
        Emit(ToolCompleteFrame(pending->name, pending->args), out);
      }
      return;
    }
    case MessageRole::kSystem:
      return;
  }
}

void EventTranslator::TranslateInterrupt(const InterruptEvent& ev, std::vector<SseFrame>* out) {
  for (const auto& interrupt : ev.interrupts) {
    const auto text = InterruptText(interrupt.value);
    if (text.empty()) continue;
    Emit(TokenFrame(text), out);
  }
}

void EventTranslator::TranslateChunk(const MessageChunkEvent& ev, std::vector<SseFrame>* out) {
  if (HasTag(ev.tags, kSkipStreamTag)) return;
  if (ev.chunk.role != MessageRole::kAi) return;
  std::string text;
  try {
    text = ContentToString(RemoveToolCallParts(ev.chunk.content));
  } catch (const std::exception& e) {
    std::cout << "[stream] chunk translation failed node=" << ev.node << " error=" << e.what() << "\n";
    Emit(ErrorFrame("Unexpected error"), out);
    return;
  }
  if (text.empty()) return;
  state_->Append(text);
  Emit(TokenFrame(text), out);
}

void EventTranslator::TranslateCustom(const CustomEvent& ev, std::vector<SseFrame>* out) {
  if (ev.is_error) {
    Emit(ErrorFrame(ev.error), out);
    return;
  }
  if (ev.event_type.empty()) {
    LogAnomaly("custom event without type", "data=" + ev.data.dump());
    return;
  }
  Emit(SseFrame{ev.event_type, ev.data}, out);
}

}  // namespace gateway
