#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

namespace gateway {

class OllamaProvider : public IProvider {
 public:
  explicit OllamaProvider(HttpEndpoint endpoint);

  std::string Name() const override;
  std::vector<ModelInfo> ListModels(std::string* err) override;

  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override;
  bool ChatStream(const ChatRequest& req,
                  const DeltaCallback& on_delta,
                  const DoneCallback& on_done,
                  std::string* err) override;

 private:
  HttpEndpoint endpoint_;
};

}  // namespace gateway
