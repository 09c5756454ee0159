#include "react_agent.hpp"

#include "errors.hpp"
#include "ids.hpp"
#include "log_util.hpp"
#include "prompt.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace {

static void ThrowIfCancelled(const RunConfig& config) {
  if (config.cancel && config.cancel->IsCancelled()) throw RunCancelled();
}

static std::vector<ToolCallRequest> ToRequests(const std::vector<ToolCall>& calls) {
  std::vector<ToolCallRequest> out;
  out.reserve(calls.size());
  for (const auto& c : calls) {
    ToolCallRequest r;
    r.id = c.id.empty() ? NewId("call") : c.id;
    r.name = c.name;
    auto args = ParseJsonLoose(c.arguments_json);
    r.args = (args && args->is_object()) ? *args : nlohmann::json::object();
    out.push_back(std::move(r));
  }
  return out;
}

// Consumer asked to stop; not an agent failure.
struct Stopped {};

}  // namespace

ReactAgent::ReactAgent(std::string name, IProvider* provider, const ToolRegistry* tools, ReactAgentOptions options)
    : name_(std::move(name)), provider_(provider), tools_(tools), options_(std::move(options)) {
  if (options_.max_steps <= 0) options_.max_steps = 1;
  if (options_.prompt_template.empty()) options_.prompt_template = DefaultPromptTemplate();
}

std::string ReactAgent::Name() const {
  return name_;
}

ChatRequest ReactAgent::BuildRequest(const RunInput& input,
                                     const std::vector<AgentMessage>& messages,
                                     const std::vector<ToolSchema>& tools) const {
  std::vector<HistoryEntry> history;
  for (size_t i = 0; i + 1 < messages.size(); i++) {
    const auto& m = messages[i];
    if (m.role == MessageRole::kHuman) history.push_back({"user", ContentToString(m.content)});
    if (m.role == MessageRole::kAi) history.push_back({"assistant", ContentToString(m.content)});
  }
  if (history.size() > options_.max_history_entries) {
    history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(options_.max_history_entries));
  }

  ChatRequest req;
  req.model = options_.model;
  req.temperature = options_.temperature;
  req.tools = tools;
  req.messages.push_back({"system", RenderPrompt(options_.prompt_template, input.user_info, input.today_date, history)});
  for (const auto& m : messages) {
    ChatMessage cm;
    cm.content = ContentToString(RemoveToolCallParts(m.content));
    switch (m.role) {
      case MessageRole::kHuman:
        cm.role = "user";
        break;
      case MessageRole::kAi:
        cm.role = "assistant";
        for (const auto& c : m.tool_calls) cm.tool_calls.push_back(ToolCall{c.id, c.name, c.args.dump()});
        break;
      case MessageRole::kTool:
        cm.role = "tool";
        cm.tool_call_id = m.tool_call_id;
        cm.name = m.name;
        break;
      case MessageRole::kSystem:
        cm.role = "system";
        break;
    }
    req.messages.push_back(std::move(cm));
  }
  return req;
}

bool ReactAgent::Stream(const RunInput& input,
                        const RunConfig& config,
                        const std::function<bool(const RunEvent&)>& on_event,
                        std::string* err) {
  auto emit = [&](const RunEvent& ev) {
    if (!on_event(ev)) throw Stopped{};
  };

  try {
    std::vector<AgentMessage> messages;
    messages.push_back(HumanMessage(input.message));
    emit(UpdateEvent{"__start__", {messages.back()}});

    const auto schemas = tools_ ? tools_->ListSchemas() : std::vector<ToolSchema>{};
    for (int step = 0; step < options_.max_steps; step++) {
      ThrowIfCancelled(config);
      auto req = BuildRequest(input, messages, schemas);
      std::cout << "[agent] run_id=" << input.run_id << " step=" << (step + 1) << " provider=" << provider_->Name()
                << " messages=" << req.messages.size() << "\n";

      // Text from the first '{' or '<' on may be a tool call written as text;
      // it is held until the reply is complete.
      std::string sent;
      std::string held;
      bool holding = false;
      bool stopped = false;
      auto forward = [&](const std::string& text) -> bool {
        if (text.empty()) return true;
        if (!on_event(MessageChunkEvent{AiMessage(text), config.tags, "agent"})) {
          stopped = true;
          return false;
        }
        sent += text;
        return true;
      };

      ChatResponse resp;
      std::string perr;
      if (config.stream_tokens) {
        bool done = false;
        const bool ok = provider_->ChatStream(
            req,
            [&](const std::string& delta) -> bool {
              if (config.cancel && config.cancel->IsCancelled()) return false;
              if (holding) {
                held += delta;
                return true;
              }
              const auto mark = delta.find_first_of("{<");
              if (mark == std::string::npos) return forward(delta);
              holding = true;
              held = delta.substr(mark);
              return forward(delta.substr(0, mark));
            },
            [&](const ChatResponse& r) {
              resp = r;
              done = true;
            },
            &perr);
        if (stopped) throw Stopped{};
        ThrowIfCancelled(config);
        if (!ok || !done) {
          if (err) *err = perr.empty() ? std::string("model call failed") : perr;
          return false;
        }
      } else {
        auto r = provider_->ChatOnce(req, &perr);
        ThrowIfCancelled(config);
        if (!r) {
          if (err) *err = perr.empty() ? std::string("model call failed") : perr;
          return false;
        }
        resp = std::move(*r);
      }

      std::string content = resp.content;
      auto calls = resp.tool_calls;
      if (calls.empty()) {
        if (auto parsed = ParseToolCallsFromAssistantText(content)) {
          calls = std::move(*parsed);
          content = sent;
          held.clear();
        } else if (auto final = ExtractFinalFromAssistantText(content)) {
          content = sent + *final;
          held = *final;
        }
      }
      if (config.stream_tokens && !forward(held)) throw Stopped{};

      messages.push_back(AiMessage(content, ToRequests(calls)));
      const AgentMessage ai = messages.back();
      emit(UpdateEvent{"agent", {ai}});

      if (ai.tool_calls.empty()) {
        std::cout << "[agent] run_id=" << input.run_id << " done steps=" << (step + 1)
                  << " answer=" << TruncateForLog(content, 200) << "\n";
        emit(ValuesEvent{messages});
        return true;
      }

      std::vector<AgentMessage> results;
      for (const auto& c : ai.tool_calls) {
        ThrowIfCancelled(config);
        ToolCall call{c.id, c.name, c.args.dump()};
        std::cout << "[tool-call] run_id=" << input.run_id << " id=" << call.id << " name=" << call.name
                  << " arguments=" << TruncateForLog(call.arguments_json, 2000) << "\n";
        ToolResult r = tools_ ? ExecuteToolCall(*tools_, call) : ToolResult{call.id, call.name, nullptr, false, "tool not found", {}, std::nullopt};
        std::cout << "[tool-result] run_id=" << input.run_id << " id=" << r.tool_call_id << " name=" << r.name
                  << " ok=" << (r.ok ? 1 : 0) << " error=" << (r.error.empty() ? "-" : r.error)
                  << " result=" << TruncateForLog(r.result.dump(), 2000) << "\n";

        for (const auto& ev : r.events) emit(CustomEvent{ev.type, ev.data, ev.error, ev.is_error});

        if (r.interrupt) {
          if (!results.empty()) emit(UpdateEvent{"tools", results});
          std::cout << "[agent] run_id=" << input.run_id << " interrupted tool=" << c.name << "\n";
          emit(InterruptEvent{{Interrupt{*r.interrupt, NewId("interrupt")}}});
          return true;
        }
        results.push_back(ToolMessage(c.id, c.name, ToolResultText(r), r.ok));
      }
      for (const auto& m : results) messages.push_back(m);
      emit(UpdateEvent{"tools", results});
    }

    if (err) *err = "agent exceeded max steps (" + std::to_string(options_.max_steps) + ")";
    std::cout << "[agent] run_id=" << input.run_id << " step limit reached\n";
    return false;
  } catch (const Stopped&) {
    if (err) *err = "run stopped by consumer";
    return false;
  }
}

std::optional<RunEvent> ReactAgent::Invoke(const RunInput& input, const RunConfig& config, std::string* err) {
  std::optional<RunEvent> final;
  RunConfig once = config;
  once.stream_tokens = false;
  const bool ok = Stream(
      input, once,
      [&](const RunEvent& ev) {
        if (std::holds_alternative<ValuesEvent>(ev) || std::holds_alternative<InterruptEvent>(ev)) final = ev;
        return true;
      },
      err);
  if (!ok) return std::nullopt;
  if (!final) {
    if (err) *err = "run ended without a final state";
    return std::nullopt;
  }
  return final;
}

}  // namespace gateway
