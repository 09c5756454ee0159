#pragma once

#include "cancel_token.hpp"
#include "run_events.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct RunInput {
  std::string run_id;
  std::string thread_id;
  std::string message;
  std::string user_info;
  std::string today_date;
};

struct RunConfig {
  const CancelToken* cancel = nullptr;
  // Emit token chunks on the messages channel while the model generates.
  bool stream_tokens = true;
  std::vector<std::string> tags;
};

// An agent run as seen from the gateway. Implementations are shared by all
// requests and must be re-entrant.
class IAgentRuntime {
 public:
  virtual ~IAgentRuntime() = default;

  virtual std::string Name() const = 0;

  // Runs to completion and returns the final event (ValuesEvent or
  // InterruptEvent). Throws RunCancelled when cancellation is observed.
  virtual std::optional<RunEvent> Invoke(const RunInput& input, const RunConfig& config, std::string* err) = 0;

  // Delivers events in production order. Returning false from on_event stops
  // the run. Throws RunCancelled when cancellation is observed.
  virtual bool Stream(const RunInput& input,
                      const RunConfig& config,
                      const std::function<bool(const RunEvent&)>& on_event,
                      std::string* err) = 0;
};

}  // namespace gateway
