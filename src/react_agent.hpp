#pragma once

#include "agent_runtime.hpp"
#include "providers/provider.hpp"
#include "tooling.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct ReactAgentOptions {
  std::string model;
  std::optional<float> temperature;
  int max_steps = 25;
  // Empty selects DefaultPromptTemplate().
  std::string prompt_template;
  size_t max_history_entries = 10;
};

// Reason + act loop: ask the model, run the tools it asks for, feed the
// results back, stop when it answers without tool calls.
class ReactAgent : public IAgentRuntime {
 public:
  ReactAgent(std::string name, IProvider* provider, const ToolRegistry* tools, ReactAgentOptions options);

  std::string Name() const override;
  std::optional<RunEvent> Invoke(const RunInput& input, const RunConfig& config, std::string* err) override;
  bool Stream(const RunInput& input,
              const RunConfig& config,
              const std::function<bool(const RunEvent&)>& on_event,
              std::string* err) override;

 private:
  ChatRequest BuildRequest(const RunInput& input,
                           const std::vector<AgentMessage>& messages,
                           const std::vector<ToolSchema>& tools) const;

  std::string name_;
  IProvider* provider_;
  const ToolRegistry* tools_;
  ReactAgentOptions options_;
};

}  // namespace gateway
