#include "agent_registry.hpp"
#include "agent_router.hpp"
#include "config.hpp"
#include "ollama_provider.hpp"
#include "openai_compatible_http_provider.hpp"
#include "prompt.hpp"
#include "providers/registry.hpp"
#include "react_agent.hpp"
#include "scripted_provider.hpp"
#include "tooling.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = gateway::LoadConfigFromEnv();

  gateway::ProviderRegistry providers(cfg.provider);
  providers.Register(std::make_unique<gateway::OpenAiCompatibleHttpProvider>("openai", cfg.openai, cfg.openai_api_key));
  providers.Register(std::make_unique<gateway::OllamaProvider>(cfg.ollama));
  providers.Register(std::make_unique<gateway::ScriptedProvider>());

  std::string resolve_err;
  auto resolved = providers.Resolve(cfg.model, &resolve_err);
  if (!resolved) {
    std::cout << "[gateway] " << resolve_err << "\n";
    return 1;
  }
  std::cout << "[provider] name=" << resolved->provider_name << " model=" << resolved->model;
  if (resolved->provider_name == "openai") std::cout << " url=" << gateway::EndpointUrl(cfg.openai);
  if (resolved->provider_name == "ollama") std::cout << " url=" << gateway::EndpointUrl(cfg.ollama);
  std::cout << "\n";
  {
    std::string err;
    auto models = resolved->provider->ListModels(&err);
    if (!err.empty()) {
      std::cout << "[provider] list_models failed error=" << err << "\n";
    } else {
      std::cout << "[provider] list_models ok models=" << models.size() << "\n";
    }
  }

  gateway::ReactAgentOptions agent_opts;
  agent_opts.model = resolved->model;
  agent_opts.temperature = cfg.temperature;
  agent_opts.max_steps = cfg.max_steps;
  if (!cfg.prompt_file.empty()) {
    std::string err;
    auto tmpl = gateway::LoadPromptTemplate(cfg.prompt_file, &err);
    if (!tmpl) {
      std::cout << "[gateway] " << err << "\n";
      return 1;
    }
    agent_opts.prompt_template = *tmpl;
  }

  auto tools = gateway::BuildDefaultToolRegistry();
  std::cout << "[gateway] tools=" << tools.ListSchemas().size() << "\n";

  gateway::AgentRegistry agents;
  agents.Register("Agent-AI", "ReAct agent with arithmetic and weather tools",
                  std::make_unique<gateway::ReactAgent>("Agent-AI", resolved->provider, &tools, agent_opts));

  gateway::RouterOptions router_opts;
  router_opts.user_info = cfg.user_info;
  router_opts.run_timeout_s = cfg.run_timeout_s;
  router_opts.stream_tokens = cfg.stream_tokens;
  router_opts.verbose = cfg.IsDev();
  gateway::AgentRouter router(&agents, router_opts);

  httplib::Server server;
  router.Register(&server);

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << " mode="
            << (cfg.mode.empty() ? "-" : cfg.mode) << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
