#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gateway {
namespace cli {

struct CliAgent {
  std::string id;
  std::string name;
  std::string description;
};

struct CliConfig {
  std::string api_url = "http://localhost:8080";
  std::vector<CliAgent> agents;
  std::string bearer_token;
};

CliConfig DefaultCliConfig();

// {"api_url": ..., "agents": [{"id", "name", "description"}], "bearer_token": ...}
std::optional<CliConfig> ParseCliConfigJson(const std::string& text, std::string* err);

// Precedence: API_URL from the environment, then the JSON file at
// config_path, then the defaults. BEARER_TOKEN fills in a missing token in
// every case. Problems with the file are reported through warn.
CliConfig LoadCliConfig(const std::string& config_path, std::string* warn);

}  // namespace cli
}  // namespace gateway
