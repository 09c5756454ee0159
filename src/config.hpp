#pragma once

#include <string>

namespace gateway {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct GatewayConfig {
  HttpListenConfig listen;
  std::string mode;
  std::string provider = "openai";
  std::string model = "dolphin3.0-llama3.1-8b";
  float temperature = 0.5f;
  HttpEndpoint openai;
  std::string openai_api_key;
  HttpEndpoint ollama;
  int max_steps = 25;
  int run_timeout_s = 0;
  std::string user_info = "Operator";
  std::string prompt_file;
  bool stream_tokens = true;
  std::string env_file = "./.env";

  bool IsDev() const { return mode == "dev"; }
};

// Loads GATEWAY_ENV_FILE (default ./.env) into the environment, then reads
// the configuration from environment variables.
GatewayConfig LoadConfigFromEnv();

// Sets KEY=VALUE lines of a dotenv file as environment variables. Existing
// variables are kept unless override_existing. Returns the number of
// variables set, or -1 when the file cannot be read.
int LoadDotEnvFile(const std::string& path, bool override_existing);

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::string EndpointUrl(const HttpEndpoint& ep);
std::string GetEnvStr(const char* name);
bool TryParseBool(const std::string& s, bool* out);

}  // namespace gateway
