#include "openai_compatible_http_provider.hpp"

#include "ids.hpp"
#include "sse.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace gateway {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static nlohmann::json ToWireMessage(const ChatMessage& m) {
  nlohmann::json jm;
  jm["role"] = m.role;
  jm["content"] = m.content;
  if (m.role == "assistant" && !m.tool_calls.empty()) {
    jm["tool_calls"] = nlohmann::json::array();
    for (const auto& c : m.tool_calls) {
      jm["tool_calls"].push_back(
          {{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
    }
  }
  if (m.role == "tool") {
    jm["tool_call_id"] = m.tool_call_id;
    if (!m.name.empty()) jm["name"] = m.name;
  }
  return jm;
}

static nlohmann::json ToWireTools(const std::vector<ToolSchema>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) {
    out.push_back({{"type", "function"},
                   {"function", {{"name", t.name}, {"description", t.description}, {"parameters", t.parameters}}}});
  }
  return out;
}

static nlohmann::json BuildChatBody(const ChatRequest& req, bool stream) {
  nlohmann::json body = {{"model", req.model}, {"stream", stream}, {"messages", nlohmann::json::array()}};
  if (req.max_tokens && *req.max_tokens > 0) body["max_tokens"] = *req.max_tokens;
  if (req.temperature) body["temperature"] = *req.temperature;
  for (const auto& m : req.messages) body["messages"].push_back(ToWireMessage(m));
  if (!req.tools.empty()) body["tools"] = ToWireTools(req.tools);
  return body;
}

static std::vector<ToolCall> ParseWireToolCalls(const nlohmann::json& message) {
  std::vector<ToolCall> out;
  if (!message.contains("tool_calls") || !message["tool_calls"].is_array()) return out;
  for (const auto& it : message["tool_calls"]) {
    if (!it.is_object() || !it.contains("function") || !it["function"].is_object()) continue;
    const auto& fn = it["function"];
    ToolCall c;
    c.id = (it.contains("id") && it["id"].is_string()) ? it["id"].get<std::string>() : NewId("call");
    if (fn.contains("name") && fn["name"].is_string()) c.name = fn["name"].get<std::string>();
    if (fn.contains("arguments")) {
      c.arguments_json = fn["arguments"].is_string() ? fn["arguments"].get<std::string>() : fn["arguments"].dump();
    }
    if (c.arguments_json.empty()) c.arguments_json = "{}";
    if (!c.name.empty()) out.push_back(std::move(c));
  }
  return out;
}

}  // namespace

OpenAiCompatibleHttpProvider::OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key)
    : name_(std::move(name)), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleHttpProvider::Name() const {
  return name_;
}

std::vector<ModelInfo> OpenAiCompatibleHttpProvider::ListModels(std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!api_key_.empty()) cli->set_bearer_token_auth(api_key_);
  auto res = cli->Get(JoinPath(endpoint_.base_path, "/models"));
  if (!res) {
    if (err) *err = name_ + ": failed to connect";
    return {};
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = name_ + ": /models http " + std::to_string(res->status);
    return {};
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.contains("data") || !j["data"].is_array()) {
    if (err) *err = name_ + ": invalid json from /models";
    return {};
  }
  std::vector<ModelInfo> out;
  for (const auto& it : j["data"]) {
    if (!it.is_object()) continue;
    ModelInfo m;
    if (it.contains("id") && it["id"].is_string()) m.id = it["id"].get<std::string>();
    if (it.contains("owned_by") && it["owned_by"].is_string()) m.owned_by = it["owned_by"].get<std::string>();
    if (m.owned_by.empty()) m.owned_by = name_;
    if (!m.id.empty()) out.push_back(std::move(m));
  }
  return out;
}

std::optional<ChatResponse> OpenAiCompatibleHttpProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!api_key_.empty()) cli->set_bearer_token_auth(api_key_);
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/chat/completions"), BuildChatBody(req, false).dump(),
                       "application/json");
  if (!res) {
    if (err) *err = name_ + ": failed to connect";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = name_ + ": /chat/completions http " + std::to_string(res->status);
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") || !jr["choices"][0]["message"].is_object()) {
    if (err) *err = name_ + ": invalid json from /chat/completions";
    return std::nullopt;
  }
  const auto& msg = jr["choices"][0]["message"];
  ChatResponse out;
  out.model = req.model;
  if (msg.contains("content") && msg["content"].is_string()) out.content = msg["content"].get<std::string>();
  out.tool_calls = ParseWireToolCalls(msg);
  if (jr["choices"][0].contains("finish_reason") && jr["choices"][0]["finish_reason"].is_string()) {
    out.finish_reason = jr["choices"][0]["finish_reason"].get<std::string>();
  }
  out.done = true;
  return out;
}

// Content arrives as SSE chunks ending with "data: [DONE]". Tool calls are
// streamed in pieces keyed by index and assembled before on_done.
bool OpenAiCompatibleHttpProvider::ChatStream(const ChatRequest& req,
                                              const DeltaCallback& on_delta,
                                              const DoneCallback& on_done,
                                              std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!api_key_.empty()) cli->set_bearer_token_auth(api_key_);

  ChatResponse out;
  out.model = req.model;
  std::map<int, ToolCall> partial_calls;
  SseParser parser;
  int status = 0;
  bool stopped = false;

  auto consume = [&](const std::vector<SseFrame>& frames) -> bool {
    for (const auto& f : frames) {
      const auto& chunk = f.content;
      if (!chunk.is_object() || !chunk.contains("choices") || !chunk["choices"].is_array()) continue;
      for (const auto& choice : chunk["choices"]) {
        if (!choice.is_object()) continue;
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
          out.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (!choice.contains("delta") || !choice["delta"].is_object()) continue;
        const auto& delta = choice["delta"];
        if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
          for (const auto& tc : delta["tool_calls"]) {
            const int index = tc.contains("index") && tc["index"].is_number_integer() ? tc["index"].get<int>() : 0;
            auto& call = partial_calls[index];
            if (tc.contains("id") && tc["id"].is_string()) call.id = tc["id"].get<std::string>();
            if (!tc.contains("function") || !tc["function"].is_object()) continue;
            const auto& fn = tc["function"];
            if (fn.contains("name") && fn["name"].is_string()) call.name += fn["name"].get<std::string>();
            if (fn.contains("arguments") && fn["arguments"].is_string()) {
              call.arguments_json += fn["arguments"].get<std::string>();
            }
          }
        }
        if (delta.contains("content") && delta["content"].is_string()) {
          const auto text = delta["content"].get<std::string>();
          out.content += text;
          if (!text.empty() && !on_delta(text)) {
            stopped = true;
            return false;
          }
        }
      }
    }
    return true;
  };

  httplib::Request hr;
  hr.method = "POST";
  hr.path = JoinPath(endpoint_.base_path, "/chat/completions");
  hr.set_header("Accept", "text/event-stream");
  hr.set_header("Content-Type", "application/json");
  hr.body = BuildChatBody(req, true).dump();
  hr.response_handler = [&](const httplib::Response& r) {
    status = r.status;
    return true;
  };
  hr.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (status < 200 || status >= 300) return true;
    return consume(parser.Feed(std::string(data, len)));
  };

  auto res = cli->send(hr);
  if (stopped) {
    if (err) *err = "stream stopped by consumer";
    return false;
  }
  if (!res) {
    if (err) *err = name_ + ": failed to connect";
    return false;
  }
  if (status < 200 || status >= 300) {
    if (err) *err = name_ + ": /chat/completions http " + std::to_string(status);
    return false;
  }
  if (!consume(parser.Finish())) {
    if (err) *err = "stream stopped by consumer";
    return false;
  }

  for (auto& [_, call] : partial_calls) {
    if (call.name.empty()) continue;
    if (call.id.empty()) call.id = NewId("call");
    if (call.arguments_json.empty()) call.arguments_json = "{}";
    out.tool_calls.push_back(std::move(call));
  }
  on_done(out);
  return true;
}

}  // namespace gateway
