#include "sse.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace gateway {

std::string EncodeSseFrame(const std::string& type, const nlohmann::json& content) {
  std::string out = "event: " + type + "\n";
  if (!content.is_null()) {
    out += "data: ";
    out += content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += "\n";
  }
  out += "\n";
  return out;
}

std::string EncodeSseFrame(const SseFrame& frame) {
  return EncodeSseFrame(frame.type, frame.content);
}

SseFrame StreamStartFrame() {
  return {sse_event::kStreamStart, nullptr};
}

SseFrame TokenFrame(const std::string& token) {
  return {sse_event::kStreamToken, {{"token", token}}};
}

SseFrame ToolStartFrame(const std::string& name, const nlohmann::json& params) {
  return {sse_event::kToolExecutionStart, {{"name", name}, {"params", params}}};
}

SseFrame ToolCompleteFrame(const std::string& name, const nlohmann::json& params) {
  return {sse_event::kToolExecutionComplete, {{"name", name}, {"params", params}}};
}

SseFrame ToolErrorFrame(const std::string& name, const std::string& error) {
  return {sse_event::kToolExecutionError, {{"name", name}, {"error", error}}};
}

SseFrame ErrorFrame(const std::string& message) {
  return {sse_event::kError, message};
}

SseFrame StreamEndFrame(const std::string& thread_id) {
  return {sse_event::kStreamEnd, {{"thread_id", thread_id}}};
}

std::vector<SseFrame> SseParser::Feed(const std::string& chunk) {
  for (char c : chunk) {
    if (c != '\r') buffer_.push_back(c);
  }

  std::vector<SseFrame> out;
  size_t pos = 0;
  while (true) {
    auto end = buffer_.find("\n\n", pos);
    if (end == std::string::npos) break;
    if (auto frame = ParseBlock(buffer_.substr(pos, end - pos))) out.push_back(std::move(*frame));
    pos = end + 2;
  }
  buffer_.erase(0, pos);
  return out;
}

std::vector<SseFrame> SseParser::Finish() {
  std::vector<SseFrame> out;
  if (auto frame = ParseBlock(buffer_)) out.push_back(std::move(*frame));
  buffer_.clear();
  return out;
}

std::optional<SseFrame> SseParser::ParseBlock(const std::string& block) {
  std::string type;
  std::string data;
  bool has_data = false;

  std::istringstream iss(block);
  std::string line;
  while (std::getline(iss, line)) {
    if (line.empty() || line[0] == ':') continue;
    auto colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
      value = line.substr(colon + 1);
      if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }
    if (field == "event") {
      type = value;
    } else if (field == "data") {
      if (has_data) data += "\n";
      data += value;
      has_data = true;
    }
  }

  if (type.empty() && !has_data) return std::nullopt;
  SseFrame frame;
  frame.type = type.empty() ? "message" : type;
  if (has_data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    frame.content = j.is_discarded() ? nlohmann::json(data) : std::move(j);
  }
  return frame;
}

}  // namespace gateway
