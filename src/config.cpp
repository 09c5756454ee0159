#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace gateway {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string FirstEnv(const char* primary, const char* fallback) {
  auto v = GetEnvStr(primary);
  if (v.empty()) v = GetEnvStr(fallback);
  return v;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = Trim(url);
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(Trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

int LoadDotEnvFile(const std::string& path, bool override_existing) {
  std::ifstream in(path);
  if (!in) return -1;
  int count = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (StartsWith(line, "export ")) line = Trim(line.substr(7));
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    auto key = Trim(line.substr(0, eq));
    auto value = Trim(line.substr(eq + 1));
    if (key.empty()) continue;
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    } else if (auto hash = value.find(" #"); hash != std::string::npos) {
      value = Trim(value.substr(0, hash));
    }
    if (!override_existing && std::getenv(key.c_str())) continue;
    if (::setenv(key.c_str(), value.c_str(), 1) == 0) count++;
  }
  return count;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto f = GetEnvStr("GATEWAY_ENV_FILE"); !f.empty()) cfg.env_file = f;
  {
    // MODE may itself come from the file; dev mode lets the file win.
    bool override_existing = GetEnvStr("MODE") == "dev";
    int n = LoadDotEnvFile(cfg.env_file, override_existing);
    if (n >= 0) std::cout << "[gateway] env_file=" << cfg.env_file << " vars=" << n << "\n";
  }

  cfg.mode = ToLower(GetEnvStr("MODE"));

  if (auto host = FirstEnv("GATEWAY_LISTEN_HOST", "HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = FirstEnv("GATEWAY_LISTEN_PORT", "PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  if (auto p = GetEnvStr("GATEWAY_PROVIDER"); !p.empty()) cfg.provider = ToLower(p);
  if (auto m = GetEnvStr("GATEWAY_MODEL"); !m.empty()) cfg.model = m;
  if (auto t = GetEnvStr("GATEWAY_TEMPERATURE"); !t.empty()) cfg.temperature = std::strtof(t.c_str(), nullptr);

  cfg.openai = ParseHttpEndpoint("http://localhost:1234/v1", 1234);
  if (auto base = GetEnvStr("OPENAI_BASE_URL"); !base.empty()) cfg.openai = ParseHttpEndpoint(base, 80);
  cfg.openai_api_key = GetEnvStr("OPENAI_API_KEY");

  cfg.ollama = ParseHttpEndpoint("http://127.0.0.1:11434", 11434);
  if (auto ollama = GetEnvStr("OLLAMA_HOST"); !ollama.empty()) cfg.ollama = ParseHttpEndpoint(ollama, 11434);

  if (auto steps = GetEnvStr("GATEWAY_MAX_STEPS"); !steps.empty()) {
    cfg.max_steps = std::atoi(steps.c_str());
    if (cfg.max_steps <= 0) cfg.max_steps = 1;
  }
  if (auto timeout = GetEnvStr("GATEWAY_RUN_TIMEOUT_S"); !timeout.empty()) cfg.run_timeout_s = std::atoi(timeout.c_str());
  if (auto info = GetEnvStr("GATEWAY_USER_INFO"); !info.empty()) cfg.user_info = info;
  if (auto prompt = GetEnvStr("GATEWAY_PROMPT_FILE"); !prompt.empty()) cfg.prompt_file = prompt;
  if (auto st = GetEnvStr("GATEWAY_STREAM_TOKENS"); !st.empty()) {
    bool b = true;
    if (TryParseBool(st, &b)) cfg.stream_tokens = b;
  }

  return cfg;
}

}  // namespace gateway
