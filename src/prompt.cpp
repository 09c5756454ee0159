#include "prompt.hpp"

#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>

namespace gateway {
namespace {

static void ReplaceAll(std::string* s, const std::string& from, const std::string& to) {
  if (!s || from.empty()) return;
  size_t pos = 0;
  while ((pos = s->find(from, pos)) != std::string::npos) {
    s->replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

const std::string& DefaultPromptTemplate() {
  static const std::string kTemplate =
      "You are a helpful assistant working for {user_info}.\n"
      "Today is {today_date}.\n"
      "\n"
      "You can use these tools:\n"
      "- Add, Sous, Multiple, Divide: integer arithmetic on `first` and `second`.\n"
      "- get_weather: current weather for a city given as `ville`.\n"
      "Always use a tool for arithmetic instead of computing the result yourself.\n"
      "Answer in the language of the user, briefly.\n"
      "\n"
      "Conversation so far:\n"
      "{conversation_history}\n";
  return kTemplate;
}

std::optional<std::string> LoadPromptTemplate(const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "prompt file not found: " + path;
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

std::string RenderPrompt(const std::string& tmpl,
                         const std::string& user_info,
                         const std::string& today_date,
                         const std::vector<HistoryEntry>& history) {
  std::string out = tmpl;
  ReplaceAll(&out, "{user_info}", user_info);
  ReplaceAll(&out, "{today_date}", today_date);
  ReplaceAll(&out, "{conversation_history}", FormatConversationHistory(history));
  return out;
}

std::string FormatConversationHistory(const std::vector<HistoryEntry>& history) {
  if (history.empty()) return "No conversation history available.";
  std::string out;
  for (const auto& entry : history) {
    std::string role = entry.role.empty() ? std::string("unknown") : entry.role;
    role[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(role[0])));
    if (!out.empty()) out += "\n";
    out += role + ": " + entry.content;
  }
  return out;
}

std::string FormatToday(std::chrono::system_clock::time_point now) {
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[96];
  if (std::strftime(buf, sizeof(buf), "%A, %B %d, %Y %I:%M %p", &tm) == 0) return {};
  return buf;
}

}  // namespace gateway
