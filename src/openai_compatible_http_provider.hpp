#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <string>

namespace gateway {

// Any server speaking the OpenAI chat completions API (LM Studio, vLLM,
// llama.cpp server, ...). endpoint.base_path usually ends in /v1.
class OpenAiCompatibleHttpProvider : public IProvider {
 public:
  OpenAiCompatibleHttpProvider(std::string name, HttpEndpoint endpoint, std::string api_key);

  std::string Name() const override;
  std::vector<ModelInfo> ListModels(std::string* err) override;
  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;
  bool ChatStream(const ChatRequest& req,
                  const DeltaCallback& on_delta,
                  const DoneCallback& on_done,
                  std::string* err) override;

 private:
  std::string name_;
  HttpEndpoint endpoint_;
  std::string api_key_;
};

}  // namespace gateway
