#pragma once

#include "agent_runtime.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

struct AgentInfo {
  std::string key;
  std::string description;
};

// Agents by path id. Built once in main and handed to the router; read-only
// while serving.
class AgentRegistry {
 public:
  void Register(std::string key, std::string description, std::unique_ptr<IAgentRuntime> agent) {
    if (!agent) return;
    agents_[key] = Entry{std::move(description), std::move(agent)};
  }

  IAgentRuntime* Find(const std::string& key) const {
    auto it = agents_.find(key);
    if (it == agents_.end()) return nullptr;
    return it->second.agent.get();
  }

  std::vector<AgentInfo> List() const {
    std::vector<AgentInfo> out;
    out.reserve(agents_.size());
    for (const auto& [key, entry] : agents_) out.push_back(AgentInfo{key, entry.description});
    return out;
  }

  bool empty() const { return agents_.empty(); }

 private:
  struct Entry {
    std::string description;
    std::unique_ptr<IAgentRuntime> agent;
  };
  std::map<std::string, Entry> agents_;
};

}  // namespace gateway
