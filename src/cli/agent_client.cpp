#include "cli/agent_client.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace gateway {
namespace cli {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const std::string& bearer_token) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(5);
  cli->set_read_timeout(60);
  cli->set_write_timeout(30);
  if (!bearer_token.empty()) cli->set_bearer_token_auth(bearer_token);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  return base + path;
}

}  // namespace

AgentClient::AgentClient(const std::string& api_url, std::string bearer_token)
    : endpoint_(ParseHttpEndpoint(api_url, 8080)), bearer_token_(std::move(bearer_token)) {}

nlohmann::json AgentClient::MakeBody(const std::string& message, const std::string& thread_id) const {
  nlohmann::json j;
  j["message"] = message;
  if (!thread_id.empty()) j["thread_id"] = thread_id;
  return j;
}

std::optional<nlohmann::json> AgentClient::GetJson(const std::string& path, std::string* err) {
  auto cli = MakeClient(endpoint_, bearer_token_);
  auto res = cli->Get(JoinPath(endpoint_.base_path, path));
  if (!res) {
    if (err) *err = "failed to connect: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status != 200) {
    if (err) *err = path + " http " + std::to_string(res->status) + ": " + DescribeErrorBody(res->body);
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json from " + path;
    return std::nullopt;
  }
  return j;
}

std::optional<nlohmann::json> AgentClient::Health(std::string* err) {
  return GetJson("/health", err);
}

std::optional<nlohmann::json> AgentClient::ListAgents(std::string* err) {
  return GetJson("/agents", err);
}

std::optional<InvokeReply> AgentClient::Invoke(const std::string& agent_id,
                                               const std::string& message,
                                               const std::string& thread_id,
                                               std::string* err) {
  auto cli = MakeClient(endpoint_, bearer_token_);
  const auto path = JoinPath(endpoint_.base_path, "/" + agent_id + "/invoke");
  auto res = cli->Post(path, MakeBody(message, thread_id).dump(), "application/json");
  if (!res) {
    if (err) *err = "failed to connect: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status != 200) {
    if (err) *err = "http " + std::to_string(res->status) + ": " + DescribeErrorBody(res->body);
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("content") || !j["content"].is_string()) {
    if (err) *err = "invalid json from " + path;
    return std::nullopt;
  }
  InvokeReply out;
  out.content = j["content"].get<std::string>();
  if (j.contains("thread_id") && j["thread_id"].is_string()) out.thread_id = j["thread_id"].get<std::string>();
  if (j.contains("run_id") && j["run_id"].is_string()) out.run_id = j["run_id"].get<std::string>();
  return out;
}

std::optional<StreamReply> AgentClient::Stream(const std::string& agent_id,
                                               const std::string& message,
                                               const std::string& thread_id,
                                               const std::function<bool(const SseFrame&)>& on_frame,
                                               std::string* err) {
  auto cli = MakeClient(endpoint_, bearer_token_);
  StreamReply out;
  SseParser parser;
  bool stopped = false;

  auto deliver = [&](const std::vector<SseFrame>& frames) {
    for (const auto& f : frames) {
      if (f.type == sse_event::kStreamEnd && f.content.is_object() && f.content.contains("thread_id") &&
          f.content["thread_id"].is_string()) {
        out.thread_id = f.content["thread_id"].get<std::string>();
      }
      if (!stopped && !on_frame(f)) stopped = true;
    }
  };

  httplib::Request req;
  req.method = "POST";
  req.path = JoinPath(endpoint_.base_path, "/" + agent_id + "/stream");
  req.set_header("Accept", "text/event-stream");
  req.set_header("Content-Type", "application/json");
  req.body = MakeBody(message, thread_id).dump();
  req.response_handler = [&](const httplib::Response& r) {
    out.status = r.status;
    if (r.has_header("x-thread-id")) out.thread_id = r.get_header_value("x-thread-id");
    return true;
  };
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (out.status != 200) {
      out.error_body.append(data, len);
      return true;
    }
    deliver(parser.Feed(std::string(data, len)));
    return !stopped;
  };

  auto res = cli->send(req);
  if (!res && !stopped) {
    if (err) *err = "failed to connect: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (out.status == 200 && !stopped) deliver(parser.Finish());
  return out;
}

std::string DescribeErrorBody(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return body;
  std::string kind = j.contains("error") && j["error"].is_string() ? j["error"].get<std::string>() : "";
  std::string message = j.contains("message") && j["message"].is_string() ? j["message"].get<std::string>() : "";
  if (kind.empty() && message.empty()) return body;
  if (kind.empty()) return message;
  if (message.empty()) return kind;
  return kind + ": " + message;
}

}  // namespace cli
}  // namespace gateway
