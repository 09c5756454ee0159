#include "run_events.hpp"

#include "errors.hpp"

#include <string>
#include <utility>

namespace gateway {

const char* RoleName(MessageRole role) {
  switch (role) {
    case MessageRole::kHuman:
      return "human";
    case MessageRole::kAi:
      return "ai";
    case MessageRole::kTool:
      return "tool";
    case MessageRole::kSystem:
      return "system";
  }
  return "unknown";
}

StreamChannel ChannelOf(const RunEvent& event) {
  if (std::holds_alternative<MessageChunkEvent>(event)) return StreamChannel::kMessages;
  if (std::holds_alternative<CustomEvent>(event)) return StreamChannel::kCustom;
  if (std::holds_alternative<ValuesEvent>(event)) return StreamChannel::kValues;
  return StreamChannel::kUpdates;
}

const char* ChannelName(StreamChannel channel) {
  switch (channel) {
    case StreamChannel::kUpdates:
      return "updates";
    case StreamChannel::kMessages:
      return "messages";
    case StreamChannel::kCustom:
      return "custom";
    case StreamChannel::kValues:
      return "values";
  }
  return "unknown";
}

std::string ContentToString(const nlohmann::json& content) {
  if (content.is_null()) return {};
  if (content.is_string()) return content.get<std::string>();
  if (!content.is_array()) throw TranslationError("unsupported message content type: " + std::string(content.type_name()));
  std::string out;
  for (const auto& part : content) {
    if (part.is_string()) {
      out += part.get<std::string>();
      continue;
    }
    if (part.is_object() && part.contains("type") && part["type"] == "text") {
      if (part.contains("text")) out += part["text"].get<std::string>();
    }
  }
  return out;
}

nlohmann::json RemoveToolCallParts(const nlohmann::json& content) {
  if (!content.is_array()) return content;
  nlohmann::json out = nlohmann::json::array();
  for (const auto& part : content) {
    if (part.is_object() && part.contains("type") && part["type"] == "tool_use") continue;
    out.push_back(part);
  }
  return out;
}

std::string InterruptText(const nlohmann::json& value) {
  if (value.is_null()) return {};
  if (value.is_string()) return value.get<std::string>();
  return value.dump();
}

AgentMessage HumanMessage(const std::string& text) {
  AgentMessage m;
  m.role = MessageRole::kHuman;
  m.content = text;
  return m;
}

AgentMessage AiMessage(const std::string& text, std::vector<ToolCallRequest> tool_calls) {
  AgentMessage m;
  m.role = MessageRole::kAi;
  m.content = text;
  m.tool_calls = std::move(tool_calls);
  return m;
}

AgentMessage ToolMessage(const std::string& tool_call_id, const std::string& name, const std::string& text, bool ok) {
  AgentMessage m;
  m.role = MessageRole::kTool;
  m.content = text;
  m.tool_call_id = tool_call_id;
  m.name = name;
  m.status = ok ? "success" : "error";
  return m;
}

}  // namespace gateway
