#include "tool_call_tracker.hpp"

#include <algorithm>
#include <utility>

namespace gateway {

void ToolCallTracker::RecordStart(const std::string& call_id, std::string name, nlohmann::json args) {
  pending_[call_id] = PendingToolCall{std::move(name), std::move(args)};
}

std::optional<PendingToolCall> ToolCallTracker::Resolve(const std::string& call_id) {
  auto it = pending_.find(call_id);
  if (it == pending_.end()) return std::nullopt;
  PendingToolCall out = std::move(it->second);
  pending_.erase(it);
  return out;
}

bool ToolCallTracker::IsPending(const std::string& call_id) const {
  return pending_.find(call_id) != pending_.end();
}

std::vector<std::string> ToolCallTracker::PendingIds() const {
  std::vector<std::string> out;
  out.reserve(pending_.size());
  for (const auto& [id, _] : pending_) out.push_back(id);
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace gateway
