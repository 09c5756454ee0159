#include "ollama_provider.hpp"

#include "ids.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

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

static bool IsSuccess(int status) {
  return status >= 200 && status < 300;
}

static nlohmann::json ToWireMessage(const ChatMessage& m) {
  nlohmann::json jm = {{"role", m.role}, {"content", m.content}};
  if (!m.tool_calls.empty()) {
    auto& calls = jm["tool_calls"] = nlohmann::json::array();
    for (const auto& c : m.tool_calls) {
      auto args = nlohmann::json::parse(c.arguments_json, nullptr, false);
      if (args.is_discarded()) args = nlohmann::json::object();
      calls.push_back({{"function", {{"name", c.name}, {"arguments", args}}}});
    }
  }
  if (m.role == "tool" && !m.name.empty()) jm["tool_name"] = m.name;
  return jm;
}

static nlohmann::json BuildChatBody(const ChatRequest& req, bool stream) {
  nlohmann::json body = {{"model", req.model}, {"stream", stream}, {"messages", nlohmann::json::array()}};
  nlohmann::json options = nlohmann::json::object();
  if (req.temperature) options["temperature"] = *req.temperature;
  if (req.max_tokens && *req.max_tokens > 0) options["num_predict"] = *req.max_tokens;
  if (!options.empty()) body["options"] = std::move(options);

  for (const auto& m : req.messages) body["messages"].push_back(ToWireMessage(m));
  if (!req.tools.empty()) {
    auto& tools = body["tools"] = nlohmann::json::array();
    for (const auto& t : req.tools) {
      tools.push_back({{"type", "function"},
                       {"function", {{"name", t.name}, {"description", t.description}, {"parameters", t.parameters}}}});
    }
  }
  return body;
}

// Ollama does not assign call ids.
static void AppendToolCalls(const nlohmann::json& msg, std::vector<ToolCall>* out) {
  if (!msg.contains("tool_calls") || !msg["tool_calls"].is_array()) return;
  for (const auto& it : msg["tool_calls"]) {
    if (!it.is_object() || !it.contains("function") || !it["function"].is_object()) continue;
    const auto& fn = it["function"];
    if (!fn.contains("name") || !fn["name"].is_string()) continue;
    ToolCall c;
    c.id = NewId("call");
    c.name = fn["name"].get<std::string>();
    if (fn.contains("arguments")) {
      c.arguments_json = fn["arguments"].is_string() ? fn["arguments"].get<std::string>() : fn["arguments"].dump();
    }
    if (c.arguments_json.empty()) c.arguments_json = "{}";
    out->push_back(std::move(c));
  }
}

static void FinishResponse(const nlohmann::json& reply, ChatResponse* out) {
  if (reply.contains("done") && reply["done"].is_boolean()) out->done = reply["done"].get<bool>();
  if (reply.contains("done_reason") && reply["done_reason"].is_string()) {
    out->finish_reason = reply["done_reason"].get<std::string>();
  }
  if (!out->tool_calls.empty()) out->finish_reason = "tool_calls";
}

}  // namespace

OllamaProvider::OllamaProvider(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

std::string OllamaProvider::Name() const {
  return "ollama";
}

std::vector<ModelInfo> OllamaProvider::ListModels(std::string* err) {
  auto cli = MakeClient(endpoint_);
  auto res = cli->Get(JoinPath(endpoint_.base_path, "/api/tags"));
  if (!res) {
    if (err) *err = "ollama: failed to connect";
    return {};
  }
  if (!IsSuccess(res->status)) {
    if (err) *err = "ollama: /api/tags http " + std::to_string(res->status);
    return {};
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "ollama: invalid json from /api/tags";
    return {};
  }

  std::vector<ModelInfo> out;
  if (!j.contains("models") || !j["models"].is_array()) return out;
  for (const auto& m : j["models"]) {
    if (m.is_object() && m.contains("name") && m["name"].is_string()) {
      out.push_back(ModelInfo{m["name"].get<std::string>(), "ollama"});
    }
  }
  return out;
}

std::optional<ChatResponse> OllamaProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  auto cli = MakeClient(endpoint_);
  auto res = cli->Post(JoinPath(endpoint_.base_path, "/api/chat"), BuildChatBody(req, false).dump(), "application/json");
  if (!res) {
    if (err) *err = "ollama: failed to connect";
    return std::nullopt;
  }
  if (!IsSuccess(res->status)) {
    if (err) *err = "ollama: /api/chat http " + std::to_string(res->status);
    return std::nullopt;
  }
  auto reply = nlohmann::json::parse(res->body, nullptr, false);
  if (reply.is_discarded() || !reply.contains("message") || !reply["message"].is_object()) {
    if (err) *err = "ollama: invalid json from /api/chat";
    return std::nullopt;
  }

  const auto& msg = reply["message"];
  ChatResponse out;
  out.model = req.model;
  if (msg.contains("content") && msg["content"].is_string()) out.content = msg["content"].get<std::string>();
  AppendToolCalls(msg, &out.tool_calls);
  FinishResponse(reply, &out);
  return out;
}

// /api/chat streams one JSON object per line; tool calls arrive whole.
bool OllamaProvider::ChatStream(const ChatRequest& req,
                                const DeltaCallback& on_delta,
                                const DoneCallback& on_done,
                                std::string* err) {
  auto cli = MakeClient(endpoint_);
  ChatResponse out;
  out.model = req.model;
  int status = 0;
  std::string pending;
  std::string stream_error;
  bool stopped = false;

  auto consume_line = [&](const std::string& line) -> bool {
    auto chunk = nlohmann::json::parse(line, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object()) return true;
    if (chunk.contains("error")) {
      stream_error = chunk["error"].is_string() ? chunk["error"].get<std::string>() : chunk["error"].dump();
      return false;
    }
    if (chunk.contains("message") && chunk["message"].is_object()) {
      const auto& msg = chunk["message"];
      AppendToolCalls(msg, &out.tool_calls);
      if (msg.contains("content") && msg["content"].is_string()) {
        const auto delta = msg["content"].get<std::string>();
        out.content += delta;
        if (!delta.empty() && !on_delta(delta)) {
          stopped = true;
          return false;
        }
      }
    }
    FinishResponse(chunk, &out);
    return true;
  };

  httplib::Request hr;
  hr.method = "POST";
  hr.path = JoinPath(endpoint_.base_path, "/api/chat");
  hr.set_header("Content-Type", "application/json");
  hr.body = BuildChatBody(req, true).dump();
  hr.response_handler = [&](const httplib::Response& r) {
    status = r.status;
    return true;
  };
  hr.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (!IsSuccess(status)) return true;
    pending.append(data, len);
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      const auto line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      if (!consume_line(line)) return false;
    }
    return true;
  };

  auto res = cli->send(hr);
  if (stopped) {
    if (err) *err = "stream stopped by consumer";
    return false;
  }
  if (!stream_error.empty()) {
    if (err) *err = "ollama: " + stream_error;
    return false;
  }
  if (!res) {
    if (err) *err = "ollama: failed to connect";
    return false;
  }
  if (!IsSuccess(status)) {
    if (err) *err = "ollama: /api/chat http " + std::to_string(status);
    return false;
  }
  if (!pending.empty() && !consume_line(pending)) {
    if (err) *err = stopped ? std::string("stream stopped by consumer") : "ollama: " + stream_error;
    return false;
  }
  on_done(out);
  return true;
}

}  // namespace gateway
