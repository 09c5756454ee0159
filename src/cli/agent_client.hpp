#pragma once

#include "config.hpp"
#include "sse.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace gateway {
namespace cli {

struct InvokeReply {
  std::string content;
  std::string thread_id;
  std::string run_id;
};

struct StreamReply {
  int status = 0;
  // From stream_end, or the x-thread-id header when the stream never ended.
  std::string thread_id;
  // Raw body of a non-200 reply.
  std::string error_body;
};

// HTTP client for the gateway API.
class AgentClient {
 public:
  AgentClient(const std::string& api_url, std::string bearer_token);

  std::optional<nlohmann::json> Health(std::string* err);
  std::optional<nlohmann::json> ListAgents(std::string* err);
  std::optional<InvokeReply> Invoke(const std::string& agent_id,
                                    const std::string& message,
                                    const std::string& thread_id,
                                    std::string* err);
  // Frames are delivered as they arrive. Returning false from on_frame
  // closes the connection.
  std::optional<StreamReply> Stream(const std::string& agent_id,
                                    const std::string& message,
                                    const std::string& thread_id,
                                    const std::function<bool(const SseFrame&)>& on_frame,
                                    std::string* err);

  const HttpEndpoint& endpoint() const { return endpoint_; }

 private:
  nlohmann::json MakeBody(const std::string& message, const std::string& thread_id) const;
  std::optional<nlohmann::json> GetJson(const std::string& path, std::string* err);

  HttpEndpoint endpoint_;
  std::string bearer_token_;
};

// "{error}: {message}" from a gateway error body, or the raw body.
std::string DescribeErrorBody(const std::string& body);

}  // namespace cli
}  // namespace gateway
