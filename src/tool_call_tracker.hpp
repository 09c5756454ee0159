#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gateway {

struct PendingToolCall {
  std::string name;
  nlohmann::json args;
};

// Tool calls announced by the model and not yet answered by a tool result.
// Owned by one run; not thread-safe.
class ToolCallTracker {
 public:
  // A repeated call_id replaces the earlier entry.
  void RecordStart(const std::string& call_id, std::string name, nlohmann::json args);

  // Removes and returns the entry, or nullopt when no start was recorded.
  std::optional<PendingToolCall> Resolve(const std::string& call_id);

  bool IsPending(const std::string& call_id) const;
  size_t PendingCount() const { return pending_.size(); }
  std::vector<std::string> PendingIds() const;

 private:
  std::unordered_map<std::string, PendingToolCall> pending_;
};

}  // namespace gateway
