#include <gtest/gtest.h>
#include "errors.hpp"
#include "fake_agent.hpp"
#include "react_agent.hpp"
#include "scripted_provider.hpp"
#include "stream_driver.hpp"

#include <deque>

using namespace gateway;
using json = nlohmann::json;

namespace {

// Replies from a fixed queue and records every request.
class QueueProvider : public IProvider {
 public:
  std::deque<ChatResponse> replies;
  std::vector<ChatRequest> requests;

  std::string Name() const override { return "queue"; }
  std::vector<ModelInfo> ListModels(std::string*) override { return {ModelInfo{"queue", "test"}}; }

  std::optional<ChatResponse> ChatOnce(const ChatRequest& req, std::string* err) override {
    requests.push_back(req);
    if (replies.empty()) {
      if (err) *err = "queue exhausted";
      return std::nullopt;
    }
    auto r = replies.front();
    replies.pop_front();
    return r;
  }

  bool ChatStream(const ChatRequest& req,
                  const DeltaCallback& on_delta,
                  const DoneCallback& on_done,
                  std::string* err) override {
    auto once = ChatOnce(req, err);
    if (!once) return false;
    return StreamChunked(*once, on_delta, on_done, err);
  }
};

ChatResponse Text(const std::string& content) {
  ChatResponse r;
  r.content = content;
  return r;
}

ChatResponse Calls(std::vector<ToolCall> calls) {
  ChatResponse r;
  r.tool_calls = std::move(calls);
  r.finish_reason = "tool_calls";
  return r;
}

RunInput Input(const std::string& message) {
  RunInput input;
  input.run_id = "run-1";
  input.thread_id = "thread-1";
  input.message = message;
  input.user_info = "Tester";
  input.today_date = "Monday, October 19, 2026 02:05 PM";
  return input;
}

}  // namespace

class ReactAgentTest : public ::testing::Test {
protected:
  ToolRegistry tools = BuildDefaultToolRegistry();
  ScriptedProvider scripted;
  QueueProvider queue;

  std::vector<RunEvent> Collect(IAgentRuntime* agent, const std::string& message, const RunConfig& config,
                                bool* ok, std::string* err) {
    std::vector<RunEvent> events;
    *ok = agent->Stream(Input(message), config, [&](const RunEvent& ev) {
      events.push_back(ev);
      return true;
    }, err);
    return events;
  }
};

TEST_F(ReactAgentTest, InvokeArithmetic) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  std::string err;
  auto final = agent.Invoke(Input("2+2"), RunConfig{}, &err);
  ASSERT_TRUE(final.has_value()) << err;
  const auto* values = std::get_if<ValuesEvent>(&*final);
  ASSERT_NE(values, nullptr);
  ASSERT_FALSE(values->messages.empty());
  EXPECT_EQ(ContentToString(values->messages.back().content), "2 + 2 = 4");
  // human, ai(tool call), tool, ai(answer)
  EXPECT_EQ(values->messages.size(), 4u);
}

TEST_F(ReactAgentTest, StreamWeatherEventOrder) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  bool ok = false;
  std::string err;
  auto events = Collect(&agent, "weather in Paris", RunConfig{}, &ok, &err);
  ASSERT_TRUE(ok) << err;

  ASSERT_GE(events.size(), 6u);
  const auto* start = std::get_if<UpdateEvent>(&events[0]);
  ASSERT_NE(start, nullptr);
  EXPECT_EQ(start->node, "__start__");

  const auto* call = std::get_if<UpdateEvent>(&events[1]);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->messages.size(), 1u);
  ASSERT_EQ(call->messages[0].tool_calls.size(), 1u);
  EXPECT_EQ(call->messages[0].tool_calls[0].name, "get_weather");
  EXPECT_EQ(call->messages[0].tool_calls[0].args["ville"], "Paris");

  const auto* result = std::get_if<UpdateEvent>(&events[2]);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->node, "tools");
  EXPECT_EQ(result->messages[0].tool_call_id, call->messages[0].tool_calls[0].id);

  std::string streamed;
  size_t i = 3;
  for (; i < events.size() && std::holds_alternative<MessageChunkEvent>(events[i]); i++) {
    streamed += ContentToString(std::get<MessageChunkEvent>(events[i]).chunk.content);
  }
  EXPECT_EQ(streamed, "The weather in Paris is beautiful! The sun is shining and it is a perfect 25°C.");
  ASSERT_EQ(i + 2, events.size());
  EXPECT_TRUE(std::holds_alternative<UpdateEvent>(events[i]));
  EXPECT_TRUE(std::holds_alternative<ValuesEvent>(events[i + 1]));
}

TEST_F(ReactAgentTest, WeatherThroughStreamDriver) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  FrameSink sink;
  StreamDriver driver(&agent, Input("weather in Paris"), RunConfig{});
  EXPECT_EQ(driver.Run([&](const std::string& bytes) { return sink.Write(bytes); }), DriverState::kClosed);

  auto types = sink.Types();
  ASSERT_GE(types.size(), 5u);
  EXPECT_EQ(types[0], "stream_start");
  EXPECT_EQ(types[1], "tool_execution_start");
  EXPECT_EQ(types[2], "tool_execution_complete");
  EXPECT_EQ(types.back(), "stream_end");
  EXPECT_EQ(sink.frames[1].content["params"]["ville"], "Paris");
  EXPECT_EQ(sink.frames[2].content["params"]["ville"], "Paris");

  std::string tokens;
  for (size_t i = 3; i + 1 < sink.frames.size(); i++) {
    EXPECT_EQ(sink.frames[i].type, "stream_token");
    tokens += sink.frames[i].content["token"].get<std::string>();
  }
  EXPECT_EQ(tokens, "The weather in Paris is beautiful! The sun is shining and it is a perfect 25°C.");
  EXPECT_EQ(sink.frames.back().content["thread_id"], "thread-1");
}

TEST_F(ReactAgentTest, DivideByZeroThroughStreamDriver) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  FrameSink sink;
  StreamDriver driver(&agent, Input("1 / 0"), RunConfig{});
  EXPECT_EQ(driver.Run([&](const std::string& bytes) { return sink.Write(bytes); }), DriverState::kClosed);

  auto types = sink.Types();
  ASSERT_GE(types.size(), 4u);
  EXPECT_EQ(types[1], "tool_execution_start");
  EXPECT_EQ(types[2], "tool_execution_error");
  EXPECT_EQ(sink.frames[2].content["name"], "Divide");
  EXPECT_EQ(sink.frames[2].content["error"], "error: division by zero");
  EXPECT_EQ(sink.frames[3].content["token"], "The Divide tool failed: division by zero.");
}

TEST_F(ReactAgentTest, TextToolCallIsNotStreamed) {
  queue.replies.push_back(Text(R"({"tool_calls": [{"name": "Add", "arguments": {"first": 1, "second": 2}}]})"));
  queue.replies.push_back(Text("1 + 2 = 3"));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  bool ok = false;
  std::string err;
  auto events = Collect(&agent, "1+2", RunConfig{}, &ok, &err);
  ASSERT_TRUE(ok) << err;

  std::string streamed;
  for (const auto& ev : events) {
    if (const auto* chunk = std::get_if<MessageChunkEvent>(&ev)) streamed += ContentToString(chunk->chunk.content);
  }
  EXPECT_EQ(streamed, "1 + 2 = 3");

  const auto* call = std::get_if<UpdateEvent>(&events[1]);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->messages[0].tool_calls.size(), 1u);
  EXPECT_EQ(call->messages[0].tool_calls[0].name, "Add");
  EXPECT_EQ(ContentToString(call->messages[0].content), "");
}

TEST_F(ReactAgentTest, FinalAnswerUnwrapped) {
  queue.replies.push_back(Text(R"({"final": "All done."})"));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  bool ok = false;
  std::string err;
  auto events = Collect(&agent, "hi", RunConfig{}, &ok, &err);
  ASSERT_TRUE(ok) << err;
  ASSERT_EQ(events.size(), 4u);
  const auto* chunk = std::get_if<MessageChunkEvent>(&events[1]);
  ASSERT_NE(chunk, nullptr);
  EXPECT_EQ(ContentToString(chunk->chunk.content), "All done.");
  EXPECT_EQ(ContentToString(std::get<UpdateEvent>(events[2]).messages[0].content), "All done.");
}

TEST_F(ReactAgentTest, TagsCarriedOnChunks) {
  queue.replies.push_back(Text("hidden"));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  RunConfig config;
  config.tags = {kSkipStreamTag};
  bool ok = false;
  std::string err;
  auto events = Collect(&agent, "hi", config, &ok, &err);
  ASSERT_TRUE(ok) << err;
  const auto* chunk = std::get_if<MessageChunkEvent>(&events[1]);
  ASSERT_NE(chunk, nullptr);
  EXPECT_EQ(chunk->tags, (std::vector<std::string>{kSkipStreamTag}));
}

TEST_F(ReactAgentTest, SystemPromptAndHistory) {
  queue.replies.push_back(Text("ok"));
  ReactAgentOptions options;
  options.prompt_template = "User {user_info} at {today_date}. History: {conversation_history}";
  options.model = "m1";
  ReactAgent agent("Agent-AI", &queue, &tools, options);
  std::string err;
  ASSERT_TRUE(agent.Invoke(Input("hello"), RunConfig{}, &err).has_value()) << err;

  ASSERT_EQ(queue.requests.size(), 1u);
  const auto& req = queue.requests[0];
  EXPECT_EQ(req.model, "m1");
  ASSERT_EQ(req.messages.size(), 2u);
  EXPECT_EQ(req.messages[0].role, "system");
  EXPECT_EQ(req.messages[0].content,
            "User Tester at Monday, October 19, 2026 02:05 PM. History: No conversation history available.");
  EXPECT_EQ(req.messages[1].role, "user");
  EXPECT_EQ(req.messages[1].content, "hello");
  EXPECT_EQ(req.tools.size(), 5u);
}

TEST_F(ReactAgentTest, StepLimit) {
  for (int i = 0; i < 3; i++) {
    queue.replies.push_back(Calls({ToolCall{"c" + std::to_string(i), "Add", R"({"first":1,"second":1})"}}));
  }
  ReactAgentOptions options;
  options.max_steps = 2;
  ReactAgent agent("Agent-AI", &queue, &tools, options);
  std::string err;
  EXPECT_FALSE(agent.Invoke(Input("loop"), RunConfig{}, &err).has_value());
  EXPECT_EQ(err, "agent exceeded max steps (2)");
}

TEST_F(ReactAgentTest, ProviderFailure) {
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  std::string err;
  EXPECT_FALSE(agent.Invoke(Input("hi"), RunConfig{}, &err).has_value());
  EXPECT_EQ(err, "queue exhausted");
}

TEST_F(ReactAgentTest, CancelledRunThrows) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  CancelToken cancel;
  cancel.Cancel();
  RunConfig config;
  config.cancel = &cancel;
  std::string err;
  EXPECT_THROW(agent.Invoke(Input("2+2"), config, &err), RunCancelled);
}

TEST_F(ReactAgentTest, ConsumerStop) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  std::string err;
  EXPECT_FALSE(agent.Stream(Input("2+2"), RunConfig{}, [](const RunEvent&) { return false; }, &err));
  EXPECT_EQ(err, "run stopped by consumer");
}

TEST_F(ReactAgentTest, ToolEventsAndInterrupt) {
  tools.RegisterTool(ToolSchema{"approve", "asks a human", json::object()},
                     [](const std::string& id, const json&) {
                       ToolResult r;
                       r.tool_call_id = id;
                       r.name = "approve";
                       r.events.push_back(ToolEvent{"progress", {{"pct", 50}}, false, ""});
                       r.interrupt = json("Approve the transfer?");
                       return r;
                     });
  queue.replies.push_back(Calls({ToolCall{"c1", "Add", R"({"first":1,"second":1})"},
                                 ToolCall{"c2", "approve", "{}"}}));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});

  FrameSink sink;
  StreamDriver driver(&agent, Input("transfer"), RunConfig{});
  EXPECT_EQ(driver.Run([&](const std::string& bytes) { return sink.Write(bytes); }), DriverState::kClosed);
  EXPECT_EQ(sink.Types(), (std::vector<std::string>{"stream_start", "tool_execution_start", "tool_execution_start",
                                                    "progress", "tool_execution_complete", "stream_token",
                                                    "stream_end"}));
  EXPECT_EQ(sink.frames[5].content["token"], "Approve the transfer?");
  EXPECT_EQ(driver.tracker().PendingIds(), (std::vector<std::string>{"c2"}));

  std::string err;
  queue.replies.push_back(Calls({ToolCall{"c3", "approve", "{}"}}));
  auto final = agent.Invoke(Input("transfer"), RunConfig{}, &err);
  ASSERT_TRUE(final.has_value()) << err;
  const auto* interrupt = std::get_if<InterruptEvent>(&*final);
  ASSERT_NE(interrupt, nullptr);
  EXPECT_EQ(interrupt->interrupts[0].value, "Approve the transfer?");
}

TEST_F(ReactAgentTest, ProseBeforeTaggedToolCallStreamsOnlyProse) {
  queue.replies.push_back(
      Text(R"(Sure, let me check. <tool_call>{"name": "get_weather", "arguments": {"ville": "Paris"}}</tool_call>)"));
  queue.replies.push_back(Text("Sunny in Paris."));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});

  FrameSink sink;
  StreamDriver driver(&agent, Input("weather?"), RunConfig{});
  EXPECT_EQ(driver.Run([&](const std::string& bytes) { return sink.Write(bytes); }), DriverState::kClosed);
  EXPECT_EQ(sink.Types(), (std::vector<std::string>{"stream_start", "stream_token", "tool_execution_start",
                                                    "tool_execution_complete", "stream_token", "stream_end"}));
  EXPECT_EQ(sink.frames[1].content["token"], "Sure, let me check. ");
  EXPECT_EQ(sink.frames[2].content["name"], "get_weather");
  EXPECT_EQ(sink.frames[4].content["token"], "Sunny in Paris.");
  EXPECT_EQ(sink.raw.find("<tool_call"), std::string::npos);
}

TEST_F(ReactAgentTest, PlainTextWithBraceStreamsWhole) {
  queue.replies.push_back(Text("Use a set {1, 2} here."));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  bool ok = false;
  std::string err;
  auto events = Collect(&agent, "hi", RunConfig{}, &ok, &err);
  ASSERT_TRUE(ok) << err;
  std::string streamed;
  for (const auto& ev : events) {
    if (const auto* chunk = std::get_if<MessageChunkEvent>(&ev)) streamed += ContentToString(chunk->chunk.content);
  }
  EXPECT_EQ(streamed, "Use a set {1, 2} here.");
}

TEST_F(ReactAgentTest, ConsumerStopDuringTokens) {
  queue.replies.push_back(Text(std::string(200, 'x')));
  ReactAgent agent("Agent-AI", &queue, &tools, ReactAgentOptions{});
  int chunks = 0;
  std::string err;
  EXPECT_FALSE(agent.Stream(Input("hi"), RunConfig{}, [&](const RunEvent& ev) {
    if (!std::holds_alternative<MessageChunkEvent>(ev)) return true;
    ++chunks;
    return false;
  }, &err));
  EXPECT_EQ(chunks, 1);
  EXPECT_EQ(err, "run stopped by consumer");
}

TEST_F(ReactAgentTest, OversizedOperandEndsInToolFailure) {
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  std::string err;
  auto final = agent.Invoke(Input("99999999999999999999+1"), RunConfig{}, &err);
  ASSERT_TRUE(final.has_value()) << err;
  const auto* values = std::get_if<ValuesEvent>(&*final);
  ASSERT_NE(values, nullptr);
  EXPECT_EQ(ContentToString(values->messages.back().content), "The Add tool failed: integer overflow.");
}

TEST_F(ReactAgentTest, MultiByteCharacterSurvivesChunking) {
  // Puts the two bytes of the degree sign on either side of a 64-byte cut.
  const std::string city(56, 'x');
  ReactAgent agent("Agent-AI", &scripted, &tools, ReactAgentOptions{});
  FrameSink sink;
  StreamDriver driver(&agent, Input("weather in " + city), RunConfig{});
  EXPECT_EQ(driver.Run([&](const std::string& bytes) { return sink.Write(bytes); }), DriverState::kClosed);

  std::string tokens;
  for (const auto& f : sink.frames) {
    if (f.type == "stream_token") tokens += f.content["token"].get<std::string>();
  }
  EXPECT_EQ(tokens, "The weather in " + city + " is beautiful! The sun is shining and it is a perfect 25°C.");
  EXPECT_EQ(sink.raw.find("\xEF\xBF\xBD"), std::string::npos);
}
