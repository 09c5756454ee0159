#include "gateway_server.hpp"

#include "ids.hpp"

using namespace gateway;
using json = nlohmann::json;

namespace {

std::vector<SseFrame> ParseBody(const std::string& body) {
  SseParser parser;
  auto frames = parser.Feed(body);
  for (auto& f : parser.Finish()) frames.push_back(std::move(f));
  return frames;
}

std::vector<std::string> Types(const std::vector<SseFrame>& frames) {
  std::vector<std::string> out;
  for (const auto& f : frames) out.push_back(f.type);
  return out;
}

}  // namespace

class AgentRouterTest : public GatewayServerTest {};

TEST_F(AgentRouterTest, Health) {
  auto cli = Client();
  auto res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto j = json::parse(res->body);
  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["version"], kApiVersion);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(AgentRouterTest, ListAgents) {
  auto cli = Client();
  auto res = cli.Get("/agents");
  ASSERT_TRUE(res);
  auto j = json::parse(res->body);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["key"], "Agent-AI");
  EXPECT_EQ(j[1]["key"], "fake");
}

TEST_F(AgentRouterTest, InvokeArithmetic) {
  auto cli = Client();
  auto res = cli.Post("/Agent-AI/invoke", R"({"message": "2+2"})", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  auto j = json::parse(res->body);
  EXPECT_NE(j["content"].get<std::string>().find("4"), std::string::npos);
  EXPECT_TRUE(LooksLikeUuid(j["thread_id"].get<std::string>()));
  EXPECT_TRUE(LooksLikeUuid(j["run_id"].get<std::string>()));
  EXPECT_NE(j["thread_id"], j["run_id"]);
}

TEST_F(AgentRouterTest, InvokeKeepsThreadId) {
  auto cli = Client();
  auto res = cli.Post("/Agent-AI/invoke", R"({"message": "3*4", "thread_id": "my-thread"})", "application/json");
  ASSERT_TRUE(res);
  auto j = json::parse(res->body);
  EXPECT_EQ(j["thread_id"], "my-thread");
  EXPECT_EQ(j["content"], "3 * 4 = 12");
}

TEST_F(AgentRouterTest, InvokeUnknownAgent) {
  auto cli = Client();
  auto res = cli.Post("/nope/invoke", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  auto j = json::parse(res->body);
  EXPECT_EQ(j["error"], "AgentNotFoundError");
  EXPECT_EQ(j["message"], "agent not found: nope");
  EXPECT_EQ(j["path"], "/nope/invoke");
}

TEST_F(AgentRouterTest, InvalidBodies) {
  auto cli = Client();
  for (const char* body : {"not json", "[]", "{}", R"({"message": 5})", R"({"message": "hi", "thread_id": 7})"}) {
    auto res = cli.Post("/Agent-AI/invoke", body, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 422) << body;
    EXPECT_EQ(json::parse(res->body)["error"], "RequestValidationError") << body;
  }
}

TEST_F(AgentRouterTest, InvokeAgentFailure) {
  fake_->fail = true;
  fake_->fail_error = "model unavailable";
  auto cli = Client();
  auto res = cli.Post("/fake/invoke", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  auto j = json::parse(res->body);
  EXPECT_EQ(j["error"], "AgentExecutionError");
  EXPECT_EQ(j["message"], "model unavailable");
}

TEST_F(AgentRouterTest, InvokeCancelledReturnsStoppedContent) {
  fake_->cancel_invoke = true;
  auto cli = Client();
  auto res = cli.Post("/fake/invoke", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(json::parse(res->body)["content"], kStoppedContent);
}

TEST_F(AgentRouterTest, InvokeInterruptReturnsInterruptText) {
  fake_->events = {InterruptEvent{{Interrupt{"Approve?", "int-1"}}}};
  auto cli = Client();
  auto res = cli.Post("/fake/invoke", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(json::parse(res->body)["content"], "Approve?");
}

TEST_F(AgentRouterTest, StreamWeather) {
  auto cli = Client();
  auto res = cli.Post("/Agent-AI/stream", R"({"message": "weather in Paris"})", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "text/event-stream");

  auto frames = ParseBody(res->body);
  auto types = Types(frames);
  ASSERT_GE(types.size(), 5u);
  EXPECT_EQ(types[0], "stream_start");
  EXPECT_EQ(types[1], "tool_execution_start");
  EXPECT_EQ(frames[1].content["name"], "get_weather");
  EXPECT_EQ(types[2], "tool_execution_complete");
  EXPECT_EQ(types.back(), "stream_end");

  std::string text;
  for (size_t i = 3; i + 1 < frames.size(); i++) {
    ASSERT_EQ(types[i], "stream_token");
    text += frames[i].content["token"].get<std::string>();
  }
  EXPECT_NE(text.find("Paris"), std::string::npos);

  const auto thread_id = frames.back().content["thread_id"].get<std::string>();
  EXPECT_TRUE(LooksLikeUuid(thread_id));
  EXPECT_EQ(res->get_header_value("x-thread-id"), thread_id);
  EXPECT_TRUE(LooksLikeUuid(res->get_header_value("x-run-id")));
}

TEST_F(AgentRouterTest, StreamUnknownAgentIsJson) {
  auto cli = Client();
  auto res = cli.Post("/nope/stream", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body)["error"], "AgentNotFoundError");
}

TEST_F(AgentRouterTest, StreamInvalidBody) {
  auto cli = Client();
  auto res = cli.Post("/Agent-AI/stream", "{}", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 422);
}

TEST_F(AgentRouterTest, StreamFailureClosesWithError) {
  fake_->events = {MessageChunkEvent{AiMessage("partial"), {}, "agent"}, ValuesEvent{}};
  fake_->throw_at = 1;
  auto cli = Client();
  auto res = cli.Post("/fake/stream", R"({"message": "hi", "thread_id": "t-9"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto frames = ParseBody(res->body);
  EXPECT_EQ(Types(frames), (std::vector<std::string>{"stream_start", "stream_token", "error", "stream_end"}));
  EXPECT_EQ(frames[2].content, "An unexpected error occurred");
  EXPECT_EQ(frames[3].content["thread_id"], "t-9");
}

TEST_F(AgentRouterTest, StreamWithoutContentIsEmpty) {
  fake_->events = {UpdateEvent{"__start__", {HumanMessage("hi")}}, ValuesEvent{{HumanMessage("hi")}}};
  auto cli = Client();
  auto res = cli.Post("/fake/stream", R"({"message": "hi"})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_TRUE(res->body.empty());
}

TEST_F(AgentRouterTest, UnknownRouteAndPreflight) {
  auto cli = Client();
  auto res = cli.Get("/nowhere");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body)["error"], "NotFound");

  auto opt = cli.Options("/Agent-AI/stream");
  ASSERT_TRUE(opt);
  EXPECT_EQ(opt->status, 204);
  EXPECT_EQ(opt->get_header_value("Access-Control-Allow-Origin"), "*");
}
