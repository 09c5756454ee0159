#include "tooling.hpp"

#include "ids.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <functional>
#include <limits>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::optional<std::string> ExtractFirstJsonObject(const std::string& text) {
  auto pos = text.find('{');
  if (pos == std::string::npos) return std::nullopt;
  int depth = 0;
  bool in_string = false;
  bool escape = false;
  for (size_t i = pos; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      continue;
    }
    if (c == '{') depth++;
    if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(pos, i - pos + 1);
    }
  }
  return std::nullopt;
}

static std::optional<ToolCall> MakeToolCall(const nlohmann::json& item) {
  if (!item.is_object()) return std::nullopt;
  ToolCall c;
  c.id = NewId("call");
  if (item.contains("id") && item["id"].is_string() && !item["id"].get<std::string>().empty()) {
    c.id = item["id"].get<std::string>();
  }

  const nlohmann::json* fn = nullptr;
  if (item.contains("function") && item["function"].is_object()) fn = &item["function"];
  if (item.contains("name") && item["name"].is_string()) c.name = item["name"].get<std::string>();
  if (c.name.empty() && item.contains("tool") && item["tool"].is_string()) c.name = item["tool"].get<std::string>();
  if (c.name.empty() && fn && fn->contains("name") && (*fn)["name"].is_string()) c.name = (*fn)["name"].get<std::string>();
  if (c.name.empty()) return std::nullopt;

  const nlohmann::json* args = nullptr;
  for (const auto& key : {"arguments", "args", "parameters", "input"}) {
    if (item.contains(key)) {
      args = &item[key];
      break;
    }
  }
  if (!args && fn && fn->contains("arguments")) args = &(*fn)["arguments"];

  if (!args || args->is_null()) {
    c.arguments_json = "{}";
  } else if (args->is_string()) {
    const auto s = args->get<std::string>();
    c.arguments_json = ParseJsonLoose(s) ? s : nlohmann::json(s).dump();
  } else {
    c.arguments_json = args->dump();
  }
  return c;
}

static std::optional<std::vector<ToolCall>> ExtractToolCallsFromJson(const nlohmann::json& root) {
  if (!root.is_object()) return std::nullopt;

  for (const auto& key : {"tool_call", "toolCall"}) {
    if (root.contains(key) && root[key].is_object()) {
      if (auto c = MakeToolCall(root[key])) return std::vector<ToolCall>{*c};
    }
  }

  for (const auto& key : {"tool_calls", "toolCalls"}) {
    if (!root.contains(key) || !root[key].is_array()) continue;
    std::vector<ToolCall> calls;
    for (const auto& item : root[key]) {
      if (auto c = MakeToolCall(item)) calls.push_back(std::move(*c));
    }
    if (calls.empty()) return std::nullopt;
    return calls;
  }

  // A bare {"name": ..., "arguments": ...} object.
  if (root.contains("name") && (root.contains("arguments") || root.contains("parameters"))) {
    if (auto c = MakeToolCall(root)) return std::vector<ToolCall>{*c};
  }
  return std::nullopt;
}

// <tool_call>{"name": ..., "arguments": ...}</tool_call> blocks, as emitted by
// Hermes-style chat templates. The name may also be given as an attribute:
// <tool_call name="X">{...}</tool_call>.
static std::optional<std::vector<ToolCall>> ExtractToolCallsFromTaggedText(const std::string& assistant_text) {
  const std::string lower = ToLower(assistant_text);
  const std::string open_tag = "<tool_call";
  const std::string close_tag = "</tool_call>";

  std::vector<ToolCall> calls;
  size_t pos = 0;
  while (pos < lower.size()) {
    size_t start = lower.find(open_tag, pos);
    if (start == std::string::npos) break;
    size_t tag_close = lower.find('>', start);
    if (tag_close == std::string::npos) break;

    size_t body_start = tag_close + 1;
    size_t body_end = lower.find(close_tag, body_start);
    if (body_end == std::string::npos) body_end = assistant_text.size();
    pos = body_end == assistant_text.size() ? body_end : body_end + close_tag.size();

    std::string attr_name;
    const std::string tag_text = assistant_text.substr(start, tag_close - start);
    if (auto p = ToLower(tag_text).find("name="); p != std::string::npos) {
      p += 5;
      if (p < tag_text.size() && (tag_text[p] == '"' || tag_text[p] == '\'')) {
        const char q = tag_text[p++];
        auto qend = tag_text.find(q, p);
        if (qend != std::string::npos) attr_name = Trim(tag_text.substr(p, qend - p));
      }
    }

    auto body = Trim(assistant_text.substr(body_start, body_end - body_start));
    std::optional<nlohmann::json> j;
    if (auto obj = ExtractFirstJsonObject(body)) j = ParseJsonLoose(*obj);

    if (!attr_name.empty()) {
      ToolCall c;
      c.id = NewId("call");
      c.name = attr_name;
      c.arguments_json = j ? j->dump() : "{}";
      calls.push_back(std::move(c));
      continue;
    }
    if (!j) continue;
    if (auto c = MakeToolCall(*j)) calls.push_back(std::move(*c));
  }

  if (calls.empty()) return std::nullopt;
  return calls;
}

// Sets *overflow when the value is an integer that does not fit in long long.
static std::optional<long long> IntArg(const nlohmann::json& args, const char* key, bool* overflow) {
  if (!args.is_object() || !args.contains(key)) return std::nullopt;
  const auto& v = args[key];
  if (v.is_number_unsigned()) {
    const auto u = v.get<unsigned long long>();
    if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
      *overflow = true;
      return std::nullopt;
    }
    return static_cast<long long>(u);
  }
  if (v.is_number_integer()) return v.get<long long>();
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
    // 2^63 is exact as a double; anything at or past it does not fit.
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
      *overflow = true;
      return std::nullopt;
    }
    return static_cast<long long>(d);
  }
  if (v.is_string()) {
    const auto s = Trim(v.get<std::string>());
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(s.c_str(), &end, 10);
    if (!end || *end != '\0') return std::nullopt;
    if (errno == ERANGE) {
      *overflow = true;
      return std::nullopt;
    }
    return n;
  }
  return std::nullopt;
}

static ToolResult Failed(const std::string& tool_call_id, const std::string& name, const std::string& error) {
  ToolResult r;
  r.tool_call_id = tool_call_id;
  r.name = name;
  r.ok = false;
  r.error = error;
  r.result = {{"ok", false}, {"error", error}};
  return r;
}

static nlohmann::json IntPairParameters() {
  return {{"type", "object"},
          {"properties",
           {{"first", {{"type", "integer"}, {"description", "First integer"}}},
            {"second", {{"type", "integer"}, {"description", "Second integer"}}}}},
          {"required", {"first", "second"}}};
}

using IntOp = std::function<std::optional<nlohmann::json>(long long, long long, std::string*)>;

// Wraps an operation that reports overflow the way __builtin_*_overflow does.
static IntOp Checked(bool (*op)(long long, long long, long long*)) {
  return [op](long long a, long long b, std::string* err) -> std::optional<nlohmann::json> {
    long long out = 0;
    if (op(a, b, &out)) {
      if (err) *err = "integer overflow";
      return std::nullopt;
    }
    return out;
  };
}

static void RegisterArithmeticTool(ToolRegistry* reg, const std::string& name, const std::string& description, IntOp op) {
  ToolSchema schema;
  schema.name = name;
  schema.description = description;
  schema.parameters = IntPairParameters();
  reg->RegisterTool(schema, [name, op = std::move(op)](const std::string& tool_call_id, const nlohmann::json& arguments) {
    bool overflow = false;
    auto first = IntArg(arguments, "first", &overflow);
    auto second = IntArg(arguments, "second", &overflow);
    if (overflow) return Failed(tool_call_id, name, "integer overflow");
    if (!first || !second) return Failed(tool_call_id, name, "first and second must be integers");
    std::string err;
    auto value = op(*first, *second, &err);
    if (!value) return Failed(tool_call_id, name, err);
    ToolResult r;
    r.tool_call_id = tool_call_id;
    r.name = name;
    r.result = *value;
    return r;
  });
}

}  // namespace

ToolRegistry::ToolRegistry(ToolRegistry&& other) noexcept {
  std::unique_lock<std::shared_mutex> lock(other.mu_);
  schemas_ = std::move(other.schemas_);
  handlers_ = std::move(other.handlers_);
}

ToolRegistry& ToolRegistry::operator=(ToolRegistry&& other) noexcept {
  if (this == &other) return *this;
  std::unique_lock<std::shared_mutex> lock_other(other.mu_);
  std::unique_lock<std::shared_mutex> lock_this(mu_);
  schemas_ = std::move(other.schemas_);
  handlers_ = std::move(other.handlers_);
  return *this;
}

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.find(name) != schemas_.end() && handlers_.find(name) != handlers_.end();
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolSchema> out;
  out.reserve(schemas_.size());
  for (const auto& [_, schema] : schemas_) out.push_back(schema);
  std::sort(out.begin(), out.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
  return out;
}

ToolRegistry BuildDefaultToolRegistry() {
  ToolRegistry reg;

  RegisterArithmeticTool(&reg, "Add", "Add two integers and return first + second.",
                         Checked([](long long a, long long b, long long* out) {
                           return __builtin_add_overflow(a, b, out);
                         }));
  RegisterArithmeticTool(&reg, "Sous", "Subtract two integers and return first - second.",
                         Checked([](long long a, long long b, long long* out) {
                           return __builtin_sub_overflow(a, b, out);
                         }));
  RegisterArithmeticTool(&reg, "Multiple", "Multiply two integers and return first * second.",
                         Checked([](long long a, long long b, long long* out) {
                           return __builtin_mul_overflow(a, b, out);
                         }));
  RegisterArithmeticTool(&reg, "Divide", "Divide two integers and return first / second.",
                         [](long long a, long long b, std::string* err) -> std::optional<nlohmann::json> {
                           if (b == 0) {
                             if (err) *err = "division by zero";
                             return std::nullopt;
                           }
                           return static_cast<double>(a) / static_cast<double>(b);
                         });

  {
    ToolSchema schema;
    schema.name = "get_weather";
    schema.description = "Get the current weather for a city.";
    schema.parameters = {{"type", "object"},
                         {"properties", {{"ville", {{"type", "string"}, {"description", "Name of the city"}}}}},
                         {"required", {"ville"}}};
    reg.RegisterTool(schema, [](const std::string& tool_call_id, const nlohmann::json& arguments) {
      if (!arguments.is_object() || !arguments.contains("ville") || !arguments["ville"].is_string() ||
          Trim(arguments["ville"].get<std::string>()).empty()) {
        return Failed(tool_call_id, "get_weather", "missing required field: ville");
      }
      const auto city = Trim(arguments["ville"].get<std::string>());
      ToolResult r;
      r.tool_call_id = tool_call_id;
      r.name = "get_weather";
      r.result = {{"ville", city},
                  {"conditions", "Sunny"},
                  {"temperature", "25°C"},
                  {"description", "The weather in " + city + " is beautiful! The sun is shining and it is a perfect 25°C."}};
      return r;
    });
  }

  return reg;
}

ToolResult ExecuteToolCall(const ToolRegistry& registry, const ToolCall& call) {
  auto handler = registry.GetHandler(call.name);
  if (!handler) return Failed(call.id, call.name, "tool not found");

  auto args = call.arguments_json.empty() ? std::optional<nlohmann::json>(nlohmann::json::object())
                                          : ParseJsonLoose(call.arguments_json);
  if (!args || !args->is_object()) return Failed(call.id, call.name, "invalid tool arguments json");

  try {
    auto r = (*handler)(call.id, *args);
    if (r.tool_call_id.empty()) r.tool_call_id = call.id;
    if (r.name.empty()) r.name = call.name;
    return r;
  } catch (const std::exception& e) {
    return Failed(call.id, call.name, e.what());
  }
}

std::string ToolResultText(const ToolResult& result) {
  if (!result.ok) return "error: " + (result.error.empty() ? std::string("tool failed") : result.error);
  if (result.result.is_string()) return result.result.get<std::string>();
  if (result.result.is_null()) return {};
  return result.result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text) {
  auto trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;
  if (auto j = nlohmann::json::parse(trimmed, nullptr, false); !j.is_discarded()) return j;
  if (auto obj = ExtractFirstJsonObject(trimmed)) {
    auto j = nlohmann::json::parse(*obj, nullptr, false);
    if (!j.is_discarded()) return j;
  }
  return std::nullopt;
}

std::optional<std::vector<ToolCall>> ParseToolCallsFromAssistantText(const std::string& assistant_text) {
  if (auto tagged = ExtractToolCallsFromTaggedText(assistant_text)) return tagged;
  auto jopt = ParseJsonLoose(assistant_text);
  if (!jopt) return std::nullopt;
  return ExtractToolCallsFromJson(*jopt);
}

std::optional<std::string> ExtractFinalFromAssistantText(const std::string& assistant_text) {
  auto jopt = ParseJsonLoose(assistant_text);
  if (!jopt || !jopt->is_object() || !jopt->contains("final")) return std::nullopt;
  const auto& f = (*jopt)["final"];
  if (f.is_string()) return f.get<std::string>();
  return f.dump();
}

}  // namespace gateway
