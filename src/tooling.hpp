#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway {

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments_json;
};

// Out-of-band notification raised by a tool while it runs.
struct ToolEvent {
  std::string type;
  nlohmann::json data;
  bool is_error = false;
  std::string error;
};

struct ToolResult {
  std::string tool_call_id;
  std::string name;
  nlohmann::json result;
  bool ok = true;
  std::string error;
  std::vector<ToolEvent> events;
  // Set when the tool needs external input before the run can go on.
  std::optional<nlohmann::json> interrupt;
};

using ToolHandler = std::function<ToolResult(const std::string& tool_call_id, const nlohmann::json& arguments)>;

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  ToolRegistry(ToolRegistry&& other) noexcept;
  ToolRegistry& operator=(ToolRegistry&& other) noexcept;

  void RegisterTool(ToolSchema schema, ToolHandler handler);
  bool HasTool(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;

  // Sorted by name.
  std::vector<ToolSchema> ListSchemas() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

// Add, Sous, Multiple, Divide and get_weather.
ToolRegistry BuildDefaultToolRegistry();

// Looks the tool up, checks the arguments and runs it. Unknown tools, bad
// arguments and handler exceptions come back as failed results.
ToolResult ExecuteToolCall(const ToolRegistry& registry, const ToolCall& call);

// Text handed back to the model for a tool result.
std::string ToolResultText(const ToolResult& result);

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text);
std::optional<std::vector<ToolCall>> ParseToolCallsFromAssistantText(const std::string& assistant_text);
// {"final": "..."} answers from models that were told to reply in JSON.
std::optional<std::string> ExtractFinalFromAssistantText(const std::string& assistant_text);

}  // namespace gateway
