#include "agent_router.hpp"

#include "errors.hpp"
#include "ids.hpp"
#include "log_util.hpp"
#include "prompt.hpp"
#include "stream_driver.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace gateway {
namespace {

struct UserInput {
  std::string message;
  std::string thread_id;
};

class RequestValidationError : public AgentError {
 public:
  explicit RequestValidationError(const std::string& message) : AgentError(message, 422) {}
  const char* kind() const override { return "RequestValidationError"; }
};

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static void SendError(httplib::Response* res, int status, const std::string& kind, const std::string& message,
                      const std::string& path) {
  SendJson(res, status, {{"error", kind}, {"message", message}, {"path", path}});
}

static UserInput ParseUserInput(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) throw RequestValidationError("request body must be a JSON object");
  if (!j.contains("message") || !j["message"].is_string()) throw RequestValidationError("field required: message (string)");
  UserInput in;
  in.message = j["message"].get<std::string>();
  if (j.contains("thread_id") && !j["thread_id"].is_null()) {
    if (!j["thread_id"].is_string()) throw RequestValidationError("thread_id must be a string");
    in.thread_id = j["thread_id"].get<std::string>();
  }
  return in;
}

static std::string FinalContent(const RunEvent& final) {
  if (const auto* values = std::get_if<ValuesEvent>(&final)) {
    if (values->messages.empty()) throw AgentExecutionError("No response received from agent");
    return ContentToString(values->messages.back().content);
  }
  if (const auto* interrupt = std::get_if<InterruptEvent>(&final)) {
    if (interrupt->interrupts.empty()) throw AgentExecutionError("interrupt without value");
    return InterruptText(interrupt->interrupts.front().value);
  }
  throw AgentExecutionError(std::string("Unexpected response type: ") + ChannelName(ChannelOf(final)));
}

}  // namespace

AgentRouter::AgentRouter(const AgentRegistry* agents, RouterOptions options)
    : agents_(agents), options_(std::move(options)) {}

void AgentRouter::HandleInvoke(const httplib::Request& req, httplib::Response& res) {
  const std::string agent_id = req.matches[1];
  RunInput input;
  try {
    auto* agent = agents_->Find(agent_id);
    if (!agent) throw AgentNotFoundError(agent_id);
    auto user = ParseUserInput(req.body);

    input.run_id = NewUuid();
    input.thread_id = user.thread_id.empty() ? NewUuid() : user.thread_id;
    input.message = user.message;
    input.user_info = options_.user_info;
    input.today_date = FormatToday(std::chrono::system_clock::now());
    std::cout << "[invoke] agent=" << agent_id << " run_id=" << input.run_id << " thread_id=" << input.thread_id << "\n";
    if (options_.verbose) std::cout << "[request] path=" << req.path << " body=" << TruncateForLog(req.body, 2000) << "\n";

    CancelToken cancel;
    cancel.SetTimeout(options_.run_timeout_s);
    RunConfig config;
    config.cancel = &cancel;
    config.stream_tokens = false;

    std::string content;
    try {
      std::string err;
      auto final = agent->Invoke(input, config, &err);
      if (!final) throw AgentExecutionError(err.empty() ? std::string("No response received from agent") : err);
      content = FinalContent(*final);
    } catch (const RunCancelled&) {
      std::cout << "[invoke] cancelled run_id=" << input.run_id << "\n";
      content = kStoppedContent;
    }
    SendJson(&res, 200, {{"content", content}, {"thread_id", input.thread_id}, {"run_id", input.run_id}});
  } catch (const AgentError& e) {
    std::cout << "[invoke] error agent=" << agent_id << " kind=" << e.kind() << " status=" << e.status()
              << " message=" << e.what() << "\n";
    SendError(&res, e.status(), e.kind(), e.what(), req.path);
  } catch (const std::exception& e) {
    std::cout << "[invoke] unexpected error agent=" << agent_id << " error=" << e.what() << "\n";
    SendError(&res, 500, "AgentError", "An unexpected error occurred", req.path);
  }
}

void AgentRouter::HandleStream(const httplib::Request& req, httplib::Response& res) {
  const std::string agent_id = req.matches[1];
  IAgentRuntime* agent = nullptr;
  UserInput user;
  try {
    agent = agents_->Find(agent_id);
    if (!agent) throw AgentNotFoundError(agent_id);
    user = ParseUserInput(req.body);
  } catch (const AgentError& e) {
    std::cout << "[stream] rejected agent=" << agent_id << " kind=" << e.kind() << " message=" << e.what() << "\n";
    SendError(&res, e.status(), e.kind(), e.what(), req.path);
    return;
  }

  RunInput input;
  input.run_id = NewUuid();
  input.thread_id = user.thread_id.empty() ? NewUuid() : user.thread_id;
  input.message = user.message;
  input.user_info = options_.user_info;
  input.today_date = FormatToday(std::chrono::system_clock::now());
  if (options_.verbose) std::cout << "[request] path=" << req.path << " body=" << TruncateForLog(req.body, 2000) << "\n";

  res.status = 200;
  res.set_header("Cache-Control", "no-cache");
  res.set_header("x-thread-id", input.thread_id);
  res.set_header("x-run-id", input.run_id);

  const int timeout_s = options_.run_timeout_s;
  const bool stream_tokens = options_.stream_tokens;
  res.set_chunked_content_provider(
      "text/event-stream",
      [agent, input = std::move(input), timeout_s, stream_tokens](size_t, httplib::DataSink& sink) {
        CancelToken cancel;
        cancel.SetTimeout(timeout_s);
        RunConfig config;
        config.cancel = &cancel;
        config.stream_tokens = stream_tokens;

        auto write_bytes = [&](const std::string& s) -> bool {
          if (sink.is_writable && !sink.is_writable()) return false;
          if (!sink.write) return false;
          return sink.write(s.data(), s.size());
        };

        StreamDriver driver(agent, input, config);
        driver.Run(write_bytes);
        sink.done();
        return true;
      },
      [](bool) {});
}

void AgentRouter::Register(httplib::Server* server) {
  server->set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
  });

  server->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "*");
  });

  server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
    SendJson(&res, 200, {{"status", "ok"}, {"version", kApiVersion}, {"message", "Agent gateway is running"}});
  });

  server->Get("/agents", [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& a : agents_->List()) out.push_back({{"key", a.key}, {"description", a.description}});
    SendJson(&res, 200, out);
  });

  server->Post(R"(/([^/]+)/invoke)",
               [this](const httplib::Request& req, httplib::Response& res) { HandleInvoke(req, res); });
  server->Post(R"(/([^/]+)/stream)",
               [this](const httplib::Request& req, httplib::Response& res) { HandleStream(req, res); });

  server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] unhandled exception path=" << req.path << " error=" << message << "\n";
    SendError(&res, 500, "AgentError", "An unexpected error occurred", req.path);
  });

  server->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) {
      SendError(&res, 404, "NotFound", "not found", req.path);
    } else if (res.status >= 500) {
      SendError(&res, res.status, "AgentError", "An unexpected error occurred", req.path);
    } else {
      SendError(&res, res.status, "BadRequest", "bad request", req.path);
    }
  });
}

}  // namespace gateway
