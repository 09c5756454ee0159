#pragma once

#include "providers/provider.hpp"

namespace gateway {

// Deterministic offline model. Arithmetic on two integers calls the matching
// arithmetic tool, "weather in <city>" calls get_weather, an explicit
// {"tool_calls": [...]} message calls those tools, and tool results are
// summarised into a final answer. Only tools offered in the request are
// called.
class ScriptedProvider : public IProvider {
 public:
  std::string Name() const override;
  std::vector<ModelInfo> ListModels(std::string* err) override;

  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;
  bool ChatStream(const ChatRequest& req,
                  const DeltaCallback& on_delta,
                  const DoneCallback& on_done,
                  std::string* err) override;
};

}  // namespace gateway
