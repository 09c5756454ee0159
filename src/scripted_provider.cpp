#include "scripted_provider.hpp"

#include "ids.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace {

constexpr const char* kHelpText =
    "Hello! I can add, subtract, multiply or divide two integers (try \"2+2\") "
    "and look up the weather (try \"weather in Paris\").";

static bool Offered(const ChatRequest& req, const std::string& tool) {
  return std::any_of(req.tools.begin(), req.tools.end(), [&](const ToolSchema& t) { return t.name == tool; });
}

static std::string ToolForOperator(const std::string& op) {
  if (op == "+" || op == "plus") return "Add";
  if (op == "-" || op == "minus") return "Sous";
  if (op == "*" || op == "x" || op == "times") return "Multiple";
  if (op == "/" || op == "divided by") return "Divide";
  return {};
}

static const char* SymbolForTool(const std::string& tool) {
  if (tool == "Add") return "+";
  if (tool == "Sous") return "-";
  if (tool == "Multiple") return "*";
  if (tool == "Divide") return "/";
  return nullptr;
}

// Digits that do not fit in long long are passed on as text for the tool to reject.
static nlohmann::json Operand(const std::string& digits) {
  try {
    return std::stoll(digits);
  } catch (const std::out_of_range&) {
    return digits;
  }
}

static std::optional<ToolCall> PlanArithmetic(const std::string& text) {
  static const std::regex kExpr(R"((-?\d+)\s*(\+|-|\*|/|x|plus|minus|times|divided by)\s*(-?\d+))",
                                std::regex::icase);
  std::smatch m;
  if (!std::regex_search(text, m, kExpr)) return std::nullopt;
  std::string op = m[2].str();
  for (auto& ch : op) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  auto tool = ToolForOperator(op);
  if (tool.empty()) return std::nullopt;
  ToolCall c;
  c.id = NewId("call");
  c.name = tool;
  c.arguments_json = nlohmann::json{{"first", Operand(m[1].str())}, {"second", Operand(m[3].str())}}.dump();
  return c;
}

static std::optional<ToolCall> PlanWeather(const std::string& text) {
  static const std::regex kWeather(R"(weather\s+(?:in|for|at)\s+([^?.!,;\n]+))", std::regex::icase);
  std::smatch m;
  if (!std::regex_search(text, m, kWeather)) return std::nullopt;
  std::string city = m[1].str();
  while (!city.empty() && std::isspace(static_cast<unsigned char>(city.back()))) city.pop_back();
  if (city.empty()) return std::nullopt;
  ToolCall c;
  c.id = NewId("call");
  c.name = "get_weather";
  c.arguments_json = nlohmann::json{{"ville", city}}.dump();
  return c;
}

static std::string SummarizeToolResult(const ChatMessage& result, const ToolCall* call) {
  const std::string& text = result.content;
  if (text.rfind("error: ", 0) == 0) return "The " + result.name + " tool failed: " + text.substr(7) + ".";

  if (result.name == "get_weather") {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("description") && j["description"].is_string()) {
      return j["description"].get<std::string>();
    }
    return text;
  }
  if (const char* sym = SymbolForTool(result.name); sym && call) {
    auto args = nlohmann::json::parse(call->arguments_json, nullptr, false);
    if (!args.is_discarded() && args.contains("first") && args.contains("second")) {
      return args["first"].dump() + " " + sym + " " + args["second"].dump() + " = " + text;
    }
  }
  return result.name + " returned " + text;
}

static ChatResponse Summarize(const std::vector<ChatMessage>& messages) {
  // Tool results since the last assistant turn, answered in order.
  size_t first = messages.size();
  while (first > 0 && messages[first - 1].role == "tool") first--;
  const ChatMessage* assistant = first > 0 && messages[first - 1].role == "assistant" ? &messages[first - 1] : nullptr;

  std::string answer;
  for (size_t i = first; i < messages.size(); i++) {
    const ToolCall* call = nullptr;
    if (assistant) {
      for (const auto& c : assistant->tool_calls) {
        if (c.id == messages[i].tool_call_id) call = &c;
      }
    }
    if (!answer.empty()) answer += "\n";
    answer += SummarizeToolResult(messages[i], call);
  }
  ChatResponse out;
  out.content = answer;
  return out;
}

}  // namespace

std::string ScriptedProvider::Name() const {
  return "scripted";
}

std::vector<ModelInfo> ScriptedProvider::ListModels(std::string*) {
  return {ModelInfo{"scripted", "scripted"}};
}

std::optional<ChatResponse> ScriptedProvider::ChatOnce(const ChatRequest& req, std::string* err) {
  if (req.messages.empty()) {
    if (err) *err = "scripted: no messages";
    return std::nullopt;
  }

  ChatResponse out;
  const auto& last = req.messages.back();
  if (last.role == "tool") {
    out = Summarize(req.messages);
  } else if (last.role == "user") {
    std::vector<ToolCall> calls;
    if (auto explicit_calls = ParseToolCallsFromAssistantText(last.content)) {
      for (auto& c : *explicit_calls) {
        if (Offered(req, c.name)) calls.push_back(std::move(c));
      }
    } else if (auto w = PlanWeather(last.content); w && Offered(req, w->name)) {
      calls.push_back(std::move(*w));
    } else if (auto a = PlanArithmetic(last.content); a && Offered(req, a->name)) {
      calls.push_back(std::move(*a));
    }
    if (calls.empty()) {
      out.content = kHelpText;
    } else {
      out.tool_calls = std::move(calls);
      out.finish_reason = "tool_calls";
    }
  }
  out.model = req.model.empty() ? std::string("scripted") : req.model;
  return out;
}

bool ScriptedProvider::ChatStream(const ChatRequest& req,
                                  const DeltaCallback& on_delta,
                                  const DoneCallback& on_done,
                                  std::string* err) {
  auto once = ChatOnce(req, err);
  if (!once) return false;
  return StreamChunked(*once, on_delta, on_done, err);
}

}  // namespace gateway
