#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace gateway {

enum class MessageRole { kHuman, kAi, kTool, kSystem };

const char* RoleName(MessageRole role);

struct ToolCallRequest {
  std::string id;
  std::string name;
  nlohmann::json args = nlohmann::json::object();
};

struct AgentMessage {
  MessageRole role = MessageRole::kAi;
  // A string, or a list of content parts ({"type":"text","text":...}, ...).
  nlohmann::json content = "";
  std::vector<ToolCallRequest> tool_calls;
  // Tool results only.
  std::string tool_call_id;
  std::string name;
  std::string status = "success";
};

struct Interrupt {
  nlohmann::json value;
  std::string id;
};

// Node output on the updates channel.
struct UpdateEvent {
  std::string node;
  std::vector<AgentMessage> messages;
};

// The run paused waiting for external input (updates channel).
struct InterruptEvent {
  std::vector<Interrupt> interrupts;
};

// Incremental model output on the messages channel.
struct MessageChunkEvent {
  AgentMessage chunk;
  std::vector<std::string> tags;
  std::string node;
};

// Out-of-band event written by a tool. error is set for error conditions.
struct CustomEvent {
  std::string event_type;
  nlohmann::json data;
  std::string error;
  bool is_error = false;
};

// Full state at the end of a completed run (values channel).
struct ValuesEvent {
  std::vector<AgentMessage> messages;
};

using RunEvent = std::variant<UpdateEvent, InterruptEvent, MessageChunkEvent, CustomEvent, ValuesEvent>;

enum class StreamChannel { kUpdates, kMessages, kCustom, kValues };

StreamChannel ChannelOf(const RunEvent& event);
const char* ChannelName(StreamChannel channel);

// Tag on a model call whose tokens must not reach the client.
constexpr const char* kSkipStreamTag = "skip_stream";

// Flattens string or content-part content into text. Throws TranslationError
// for content of any other shape.
std::string ContentToString(const nlohmann::json& content);

// Drops tool_use parts from list content.
nlohmann::json RemoveToolCallParts(const nlohmann::json& content);

// Interrupt values are surfaced as text: strings as-is, null as empty, other
// JSON values serialized.
std::string InterruptText(const nlohmann::json& value);

AgentMessage HumanMessage(const std::string& text);
AgentMessage AiMessage(const std::string& text, std::vector<ToolCallRequest> tool_calls = {});
AgentMessage ToolMessage(const std::string& tool_call_id, const std::string& name, const std::string& text,
                         bool ok = true);

}  // namespace gateway
