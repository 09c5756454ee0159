#include "cli/cli_config.hpp"

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace gateway {
namespace cli {

CliConfig DefaultCliConfig() {
  CliConfig cfg;
  cfg.agents.push_back(CliAgent{"Agent-AI", "Agent-AI", "ReAct agent with arithmetic and weather tools."});
  return cfg;
}

std::optional<CliConfig> ParseCliConfigJson(const std::string& text, std::string* err) {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json";
    return std::nullopt;
  }
  CliConfig cfg;
  if (j.contains("api_url")) {
    if (!j["api_url"].is_string()) {
      if (err) *err = "api_url must be a string";
      return std::nullopt;
    }
    cfg.api_url = j["api_url"].get<std::string>();
  }
  if (j.contains("bearer_token") && j["bearer_token"].is_string()) cfg.bearer_token = j["bearer_token"].get<std::string>();
  if (j.contains("agents")) {
    if (!j["agents"].is_array()) {
      if (err) *err = "agents must be a list";
      return std::nullopt;
    }
    for (const auto& a : j["agents"]) {
      if (!a.is_object() || !a.contains("id") || !a["id"].is_string() || !a.contains("name") || !a["name"].is_string() ||
          !a.contains("description") || !a["description"].is_string()) {
        if (err) *err = "each agent needs string id, name and description";
        return std::nullopt;
      }
      cfg.agents.push_back(
          CliAgent{a["id"].get<std::string>(), a["name"].get<std::string>(), a["description"].get<std::string>()});
    }
  }
  return cfg;
}

CliConfig LoadCliConfig(const std::string& config_path, std::string* warn) {
  CliConfig cfg;
  if (auto api_url = GetEnvStr("API_URL"); !api_url.empty()) {
    cfg.api_url = api_url;
    cfg.bearer_token = GetEnvStr("BEARER_TOKEN");
  } else if (std::ifstream in(config_path); in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    std::string err;
    auto parsed = ParseCliConfigJson(oss.str(), &err);
    if (parsed) {
      cfg = std::move(*parsed);
    } else {
      if (warn) *warn = "Error loading config from " + config_path + ": " + err;
      cfg = DefaultCliConfig();
    }
  } else {
    cfg = DefaultCliConfig();
  }

  if (cfg.bearer_token.empty()) cfg.bearer_token = GetEnvStr("BEARER_TOKEN");
  return cfg;
}

}  // namespace cli
}  // namespace gateway
