#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

struct HistoryEntry {
  std::string role;
  std::string content;
};

// Placeholders: {user_info}, {today_date}, {conversation_history}.
const std::string& DefaultPromptTemplate();

std::optional<std::string> LoadPromptTemplate(const std::string& path, std::string* err);

std::string RenderPrompt(const std::string& tmpl,
                         const std::string& user_info,
                         const std::string& today_date,
                         const std::vector<HistoryEntry>& history);

// "Role: content" lines, or a fixed sentence when empty.
std::string FormatConversationHistory(const std::vector<HistoryEntry>& history);

// UTC, e.g. "Monday, October 19, 2026 02:05 PM".
std::string FormatToday(std::chrono::system_clock::time_point now);

}  // namespace gateway
