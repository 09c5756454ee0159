#include <gtest/gtest.h>
#include "cli/cli_config.hpp"
#include "scoped_env.hpp"

using namespace gateway::cli;

class CliConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    env.Unset("API_URL");
    env.Unset("BEARER_TOKEN");
  }

  ScopedEnv env;
};

TEST_F(CliConfigTest, EnvironmentWins) {
  env.Set("API_URL", "http://test-url");
  env.Set("BEARER_TOKEN", "test-token");
  const auto path = WriteTempFile("cli_env_wins.json", R"({"api_url": "http://from-file"})");
  std::string warn;
  auto cfg = LoadCliConfig(path, &warn);
  EXPECT_EQ(cfg.api_url, "http://test-url");
  EXPECT_EQ(cfg.bearer_token, "test-token");
  EXPECT_TRUE(cfg.agents.empty());
  EXPECT_TRUE(warn.empty());
}

TEST_F(CliConfigTest, EnvironmentWithoutToken) {
  env.Set("API_URL", "http://test-url");
  auto cfg = LoadCliConfig(::testing::TempDir() + "cli_missing.json", nullptr);
  EXPECT_EQ(cfg.api_url, "http://test-url");
  EXPECT_TRUE(cfg.bearer_token.empty());
}

TEST_F(CliConfigTest, FileUsedWithoutEnvironment) {
  const auto path = WriteTempFile("cli_file.json", R"({
    "api_url": "http://file-url",
    "bearer_token": "file-token",
    "agents": [{"id": "Agent-AI", "name": "Agent AI", "description": "tools"}]
  })");
  auto cfg = LoadCliConfig(path, nullptr);
  EXPECT_EQ(cfg.api_url, "http://file-url");
  EXPECT_EQ(cfg.bearer_token, "file-token");
  ASSERT_EQ(cfg.agents.size(), 1u);
  EXPECT_EQ(cfg.agents[0].name, "Agent AI");
}

TEST_F(CliConfigTest, EnvironmentTokenFillsMissingFileToken) {
  env.Set("BEARER_TOKEN", "env-token");
  const auto path = WriteTempFile("cli_no_token.json", R"({"api_url": "http://file-url", "agents": []})");
  auto cfg = LoadCliConfig(path, nullptr);
  EXPECT_EQ(cfg.bearer_token, "env-token");
}

TEST_F(CliConfigTest, BrokenFileFallsBackToDefaults) {
  const auto path = WriteTempFile("cli_broken.json", "{not json");
  std::string warn;
  auto cfg = LoadCliConfig(path, &warn);
  EXPECT_EQ(cfg.api_url, "http://localhost:8080");
  ASSERT_EQ(cfg.agents.size(), 1u);
  EXPECT_EQ(cfg.agents[0].id, "Agent-AI");
  EXPECT_NE(warn.find("Error loading config from"), std::string::npos);
}

TEST_F(CliConfigTest, MissingFileUsesDefaults) {
  auto cfg = LoadCliConfig(::testing::TempDir() + "cli_missing.json", nullptr);
  EXPECT_EQ(cfg.api_url, "http://localhost:8080");
  EXPECT_EQ(cfg.agents.size(), 1u);
}

TEST(ParseCliConfigJsonTest, RejectsBadShapes) {
  std::string err;
  EXPECT_FALSE(ParseCliConfigJson(R"({"agents": {}})", &err).has_value());
  EXPECT_EQ(err, "agents must be a list");
  EXPECT_FALSE(ParseCliConfigJson(R"({"agents": [{"id": "x"}]})", &err).has_value());
  EXPECT_FALSE(ParseCliConfigJson(R"({"api_url": 3})", &err).has_value());
  EXPECT_TRUE(ParseCliConfigJson("{}", &err).has_value());
}
