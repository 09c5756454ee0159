#pragma once

#include "agent_runtime.hpp"
#include "cancel_token.hpp"
#include "event_translator.hpp"
#include "stream_state.hpp"
#include "tool_call_tracker.hpp"

#include <functional>
#include <string>

namespace gateway {

enum class DriverState { kInit, kStreaming, kClosed, kClosedOnError, kCancelled };

const char* DriverStateName(DriverState state);

// Writes encoded frames to the client; false means the client is gone.
using FrameWriter = std::function<bool(const std::string&)>;

// Runs one agent stream and writes its SSE frame sequence. Owns the per-run
// tracker and stream state. Single use.
class StreamDriver {
 public:
  StreamDriver(IAgentRuntime* agent, RunInput input, RunConfig config);

  DriverState Run(const FrameWriter& write);

  DriverState state() const { return state_; }
  const StreamState& stream_state() const { return stream_state_; }
  const ToolCallTracker& tracker() const { return tracker_; }

 private:
  bool WriteFrame(const SseFrame& frame, const FrameWriter& write);
  bool Cancelled() const;
  void Finish(DriverState terminal, const FrameWriter& write);

  IAgentRuntime* agent_;
  RunInput input_;
  RunConfig config_;
  ToolCallTracker tracker_;
  StreamState stream_state_;
  EventTranslator translator_;
  DriverState state_ = DriverState::kInit;
  bool client_gone_ = false;
};

}  // namespace gateway
