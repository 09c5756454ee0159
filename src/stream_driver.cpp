#include "stream_driver.hpp"

#include "errors.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace gateway {

const char* DriverStateName(DriverState state) {
  switch (state) {
    case DriverState::kInit:
      return "init";
    case DriverState::kStreaming:
      return "streaming";
    case DriverState::kClosed:
      return "closed";
    case DriverState::kClosedOnError:
      return "closed_on_error";
    case DriverState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

StreamDriver::StreamDriver(IAgentRuntime* agent, RunInput input, RunConfig config)
    : agent_(agent),
      input_(std::move(input)),
      config_(std::move(config)),
      translator_(input_.message, &tracker_, &stream_state_, TranslatorOptions{config_.stream_tokens}) {}

bool StreamDriver::Cancelled() const {
  return client_gone_ || (config_.cancel && config_.cancel->IsCancelled());
}

bool StreamDriver::WriteFrame(const SseFrame& frame, const FrameWriter& write) {
  if (client_gone_) return false;
  if (!write(EncodeSseFrame(frame))) {
    client_gone_ = true;
    std::cout << "[stream] client disconnected run_id=" << input_.run_id << "\n";
    return false;
  }
  return true;
}

DriverState StreamDriver::Run(const FrameWriter& write) {
  if (state_ != DriverState::kInit) return state_;
  state_ = DriverState::kStreaming;
  std::cout << "[stream] start run_id=" << input_.run_id << " thread_id=" << input_.thread_id
            << " agent=" << agent_->Name() << "\n";

  DriverState terminal = DriverState::kClosed;
  bool stopped = false;
  try {
    std::string err;
    const bool ok = agent_->Stream(
        input_, config_,
        [&](const RunEvent& event) -> bool {
          if (Cancelled()) {
            stopped = true;
            return false;
          }
          for (const auto& frame : translator_.Translate(event)) {
            if (!WriteFrame(frame, write)) {
              stopped = true;
              return false;
            }
          }
          return true;
        },
        &err);
    if (stopped || Cancelled()) {
      terminal = DriverState::kCancelled;
    } else if (!ok) {
      std::cout << "[stream] agent failed run_id=" << input_.run_id << " error=" << err << "\n";
      terminal = DriverState::kClosedOnError;
    }
  } catch (const RunCancelled&) {
    terminal = DriverState::kCancelled;
  } catch (const std::exception& e) {
    std::cout << "[stream] unhandled error run_id=" << input_.run_id << " error=" << e.what() << "\n";
    terminal = DriverState::kClosedOnError;
  }

  Finish(terminal, write);
  return state_;
}

void StreamDriver::Finish(DriverState terminal, const FrameWriter& write) {
  if (terminal == DriverState::kClosedOnError) {
    if (stream_state_.MarkOpened()) WriteFrame(StreamStartFrame(), write);
    WriteFrame(ErrorFrame("An unexpected error occurred"), write);
  }
  if (stream_state_.opened()) WriteFrame(StreamEndFrame(input_.thread_id), write);
  state_ = terminal;

  std::cout << "[stream] end run_id=" << input_.run_id << " state=" << DriverStateName(state_)
            << " opened=" << (stream_state_.opened() ? 1 : 0) << " text_chars=" << stream_state_.text().size()
            << " pending_tools=" << tracker_.PendingCount() << "\n";
  for (const auto& id : tracker_.PendingIds()) {
    std::cout << "[stream-anomaly] unresolved tool call run_id=" << input_.run_id << " tool_call_id=" << id << "\n";
  }
}

}  // namespace gateway
