#pragma once

#include "agent_registry.hpp"

#include <httplib.h>

#include <string>

namespace gateway {

struct RouterOptions {
  std::string user_info = "Operator";
  int run_timeout_s = 0;
  bool stream_tokens = true;
  // Logs request bodies.
  bool verbose = false;
};

constexpr const char* kApiVersion = "0.1.0";
constexpr const char* kStoppedContent = "Generation was stopped.";

// HTTP surface: POST /{agent_id}/invoke, POST /{agent_id}/stream,
// GET /health, GET /agents, plus CORS and JSON error bodies.
class AgentRouter {
 public:
  AgentRouter(const AgentRegistry* agents, RouterOptions options);
  void Register(httplib::Server* server);

 private:
  void HandleInvoke(const httplib::Request& req, httplib::Response& res);
  void HandleStream(const httplib::Request& req, httplib::Response& res);

  const AgentRegistry* agents_;
  RouterOptions options_;
};

}  // namespace gateway
