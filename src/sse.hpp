#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gateway {

namespace sse_event {
constexpr const char* kStreamStart = "stream_start";
constexpr const char* kStreamToken = "stream_token";
constexpr const char* kToolExecutionStart = "tool_execution_start";
constexpr const char* kToolExecutionComplete = "tool_execution_complete";
constexpr const char* kToolExecutionError = "tool_execution_error";
constexpr const char* kError = "error";
constexpr const char* kStreamEnd = "stream_end";
}  // namespace sse_event

// One SSE unit. A null content means the frame has no data line.
struct SseFrame {
  std::string type;
  nlohmann::json content;
};

std::string EncodeSseFrame(const std::string& type, const nlohmann::json& content);
std::string EncodeSseFrame(const SseFrame& frame);

SseFrame StreamStartFrame();
SseFrame TokenFrame(const std::string& token);
SseFrame ToolStartFrame(const std::string& name, const nlohmann::json& params);
SseFrame ToolCompleteFrame(const std::string& name, const nlohmann::json& params);
SseFrame ToolErrorFrame(const std::string& name, const std::string& error);
SseFrame ErrorFrame(const std::string& message);
SseFrame StreamEndFrame(const std::string& thread_id);

// Incremental decoder for a text/event-stream body. Frames may be split
// across Feed() calls at any byte.
class SseParser {
 public:
  std::vector<SseFrame> Feed(const std::string& chunk);
  // Flushes a trailing frame that was not terminated by a blank line.
  std::vector<SseFrame> Finish();

 private:
  static std::optional<SseFrame> ParseBlock(const std::string& block);
  std::string buffer_;
};

}  // namespace gateway
