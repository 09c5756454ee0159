#pragma once

#include <gtest/gtest.h>
#include <httplib.h>

#include "agent_registry.hpp"
#include "agent_router.hpp"
#include "fake_agent.hpp"
#include "react_agent.hpp"
#include "scripted_provider.hpp"

#include <chrono>
#include <memory>
#include <thread>

namespace gateway {

// Serves the router on a loopback port with the scripted Agent-AI agent and
// a FakeAgent registered as "fake".
class GatewayServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    tools_ = BuildDefaultToolRegistry();
    agents_.Register("Agent-AI", "ReAct agent with arithmetic and weather tools.",
                     std::make_unique<ReactAgent>("Agent-AI", &provider_, &tools_, ReactAgentOptions{}));
    auto fake = std::make_unique<FakeAgent>();
    fake_ = fake.get();
    agents_.Register("fake", "Replays canned events.", std::move(fake));

    router_ = std::make_unique<AgentRouter>(&agents_, RouterOptions{});
    router_->Register(&server_);
    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 500 && !server_.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ASSERT_TRUE(server_.is_running());
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

  httplib::Client Client() const {
    httplib::Client cli("127.0.0.1", port_);
    cli.set_read_timeout(30);
    return cli;
  }

  ScriptedProvider provider_;
  ToolRegistry tools_;
  AgentRegistry agents_;
  FakeAgent* fake_ = nullptr;
  std::unique_ptr<AgentRouter> router_;
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
};

}  // namespace gateway
