#include "cli/agent_client.hpp"
#include "cli/cli_config.hpp"
#include "config.hpp"
#include "sse.hpp"

#include <getopt.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace {

struct CliOptions {
  std::string command;
  std::string agent = "Agent-AI";
  std::string api_url;
  std::string bearer_token;
  std::string config_path = "agents_config.json";
  bool invoke = false;
  bool debug = false;
  bool no_context = false;
};

static std::string FieldOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return fallback;
  return j[key].get<std::string>();
}

static void PrintUsage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " <check|chat> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  check                 Check /health and list the agents of the API\n"
            << "  chat                  Interactive chat with an agent\n"
            << "\n"
            << "Options:\n"
            << "  -a, --agent ID        Agent to chat with (default: Agent-AI)\n"
            << "  -i, --invoke          Use /invoke instead of /stream\n"
            << "      --api-url URL     API base URL (default: API_URL or http://localhost:8080)\n"
            << "      --bearer-token T  Bearer token sent with every request\n"
            << "  -c, --config PATH     CLI config file (default: agents_config.json)\n"
            << "  -d, --debug           Show raw frames and request details\n"
            << "      --no-context      Start a new thread for every message\n"
            << "  -h, --help            Show this help\n"
            << "\n"
            << "In chat: 'exit' quits, '!clear' starts a new thread, '!debug' toggles debug output.\n";
}

static int RunCheck(gateway::cli::AgentClient& client, const CliOptions& opts) {
  std::string err;
  auto health = client.Health(&err);
  if (!health) {
    std::cout << "API not reachable at " << gateway::EndpointUrl(client.endpoint()) << ": " << err << "\n";
    return 1;
  }
  std::cout << "API is up: " << FieldOr(*health, "message", "") << " (version "
            << FieldOr(*health, "version", "?") << ")\n";
  if (opts.debug) std::cout << "health: " << health->dump() << "\n";

  auto agents = client.ListAgents(&err);
  if (!agents || !agents->is_array()) {
    std::cout << "Could not list agents: " << err << "\n";
    return 1;
  }
  std::cout << "Agents:\n";
  for (const auto& a : *agents) {
    std::cout << "  " << FieldOr(a, "key", "") << " - " << FieldOr(a, "description", "") << "\n";
  }
  return 0;
}

static std::string StreamTurn(gateway::cli::AgentClient& client,
                              const CliOptions& opts,
                              const std::string& message,
                              const std::string& thread_id) {
  bool any_token = false;
  std::cout << "Agent: ";
  std::string err;
  auto reply = client.Stream(
      opts.agent, message, thread_id,
      [&](const gateway::SseFrame& f) {
        if (opts.debug) std::cout << "\n[frame] " << f.type << " " << f.content.dump() << "\n";
        if (f.type == gateway::sse_event::kStreamToken) {
          if (f.content.is_object() && f.content.contains("token") && f.content["token"].is_string()) {
            std::cout << f.content["token"].get<std::string>() << std::flush;
            any_token = true;
          }
        } else if (f.type == gateway::sse_event::kToolExecutionStart) {
          std::cout << "\nUsing tool: " << FieldOr(f.content, "name", "unknown") << "\n";
          if (f.content.contains("params")) std::cout << "  input: " << f.content["params"].dump(2) << "\n";
        } else if (f.type == gateway::sse_event::kToolExecutionComplete) {
          std::cout << "Tool complete: " << FieldOr(f.content, "name", "unknown") << "\nAgent: ";
        } else if (f.type == gateway::sse_event::kToolExecutionError) {
          std::cout << "\nTool error: " << FieldOr(f.content, "name", "unknown") << ": "
                    << FieldOr(f.content, "error", "unknown error") << "\nAgent: ";
        } else if (f.type == gateway::sse_event::kError) {
          std::cout << "\nError: " << (f.content.is_string() ? f.content.get<std::string>() : f.content.dump()) << "\n";
        }
        return true;
      },
      &err);
  std::cout << "\n";

  if (!reply) {
    std::cout << "HTTP error: " << err << "\n";
    return thread_id;
  }
  if (reply->status != 200) {
    std::cout << "Error: server returned status " << reply->status;
    if (!reply->error_body.empty()) std::cout << " (" << gateway::cli::DescribeErrorBody(reply->error_body) << ")";
    std::cout << "\n";
    return thread_id;
  }
  if (!any_token) std::cout << "Warning: no displayable content in the response\n";
  if (opts.debug && !reply->thread_id.empty()) std::cout << "[thread] " << reply->thread_id << "\n";
  return reply->thread_id.empty() ? thread_id : reply->thread_id;
}

static std::string InvokeTurn(gateway::cli::AgentClient& client,
                              const CliOptions& opts,
                              const std::string& message,
                              const std::string& thread_id) {
  std::string err;
  auto reply = client.Invoke(opts.agent, message, thread_id, &err);
  if (!reply) {
    std::cout << "Error: " << err << "\n";
    return thread_id;
  }
  std::cout << "Agent: " << reply->content << "\n";
  if (opts.debug) std::cout << "[thread] " << reply->thread_id << " [run] " << reply->run_id << "\n";
  return reply->thread_id.empty() ? thread_id : reply->thread_id;
}

static int RunChat(gateway::cli::AgentClient& client, CliOptions opts, const gateway::cli::CliConfig& cfg) {
  for (const auto& a : cfg.agents) {
    if (a.id == opts.agent) std::cout << a.name << ": " << a.description << "\n";
  }
  std::cout << "Chatting with " << opts.agent << " via " << (opts.invoke ? "invoke" : "stream")
            << ". Type 'exit' to quit.\n";

  std::string thread_id;
  std::string line;
  while (true) {
    std::cout << "You: " << std::flush;
    if (!std::getline(std::cin, line)) break;
    if (line == "exit" || line == "quit") break;
    if (line.empty()) continue;
    if (line == "!clear") {
      thread_id.clear();
      std::cout << "Started a new conversation.\n";
      continue;
    }
    if (line == "!debug") {
      opts.debug = !opts.debug;
      std::cout << "Debug " << (opts.debug ? "on" : "off") << "\n";
      continue;
    }

    const std::string use_thread = opts.no_context ? std::string() : thread_id;
    auto next = opts.invoke ? InvokeTurn(client, opts, line, use_thread) : StreamTurn(client, opts, line, use_thread);
    if (!opts.no_context) thread_id = next;
  }
  std::cout << "Bye.\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  CliOptions opts;
  opts.command = argv[1];
  if (opts.command == "-h" || opts.command == "--help") {
    PrintUsage(argv[0]);
    return 0;
  }

  static struct option long_options[] = {
      {"agent", required_argument, 0, 'a'},
      {"invoke", no_argument, 0, 'i'},
      {"api-url", required_argument, 0, 1000},
      {"bearer-token", required_argument, 0, 1001},
      {"no-context", no_argument, 0, 1002},
      {"config", required_argument, 0, 'c'},
      {"debug", no_argument, 0, 'd'},
      {"help", no_argument, 0, 'h'},
      {0, 0, 0, 0},
  };

  optind = 2;
  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, "a:ic:dh", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'a':
        opts.agent = optarg;
        break;
      case 'i':
        opts.invoke = true;
        break;
      case 1000:
        opts.api_url = optarg;
        break;
      case 1001:
        opts.bearer_token = optarg;
        break;
      case 1002:
        opts.no_context = true;
        break;
      case 'c':
        opts.config_path = optarg;
        break;
      case 'd':
        opts.debug = true;
        break;
      case 'h':
        PrintUsage(argv[0]);
        return 0;
      default:
        PrintUsage(argv[0]);
        return 1;
    }
  }

  if (gateway::LoadDotEnvFile(".env", false) >= 0) {
    std::cout << "Loaded environment variables from .env\n";
  }

  std::string warn;
  auto cfg = gateway::cli::LoadCliConfig(opts.config_path, &warn);
  if (!warn.empty()) std::cout << warn << "\n";
  if (!opts.api_url.empty()) cfg.api_url = opts.api_url;
  if (!opts.bearer_token.empty()) cfg.bearer_token = opts.bearer_token;
  if (opts.debug) {
    std::cout << "api_url=" << cfg.api_url << " bearer_token=" << (cfg.bearer_token.empty() ? "-" : "<set>") << "\n";
  }

  gateway::cli::AgentClient client(cfg.api_url, cfg.bearer_token);
  if (opts.command == "check") return RunCheck(client, opts);
  if (opts.command == "chat") return RunChat(client, opts, cfg);

  std::cout << "Unknown command: " << opts.command << "\n";
  PrintUsage(argv[0]);
  return 1;
}
