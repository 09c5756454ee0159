#pragma once

#include <stdexcept>
#include <string>

namespace gateway {

// Errors surfaced to HTTP clients as {error: kind, message, path}.
class AgentError : public std::runtime_error {
 public:
  explicit AgentError(const std::string& message, int status = 400)
      : std::runtime_error(message), status_(status) {}

  int status() const { return status_; }
  virtual const char* kind() const { return "AgentError"; }

 private:
  int status_;
};

class AgentExecutionError : public AgentError {
 public:
  explicit AgentExecutionError(const std::string& message) : AgentError(message, 400) {}
  const char* kind() const override { return "AgentExecutionError"; }
};

class AgentNotFoundError : public AgentError {
 public:
  explicit AgentNotFoundError(const std::string& agent_id) : AgentError("agent not found: " + agent_id, 404) {}
  const char* kind() const override { return "AgentNotFoundError"; }
};

// Thrown by an agent runtime when it observes cancellation. Not an error.
class RunCancelled : public std::runtime_error {
 public:
  RunCancelled() : std::runtime_error("run cancelled") {}
};

// A single runtime message could not be translated into frames.
class TranslationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace gateway
