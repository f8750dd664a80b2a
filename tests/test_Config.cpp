#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>

#include "core/ConfigManager.h"
#include "sandbox/SandboxGateway.h"
#include "TestSupport.h"

namespace {
  Config::EnvLookup envFrom(const std::map<std::string, std::string>& vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
      auto it = vars.find(name);
      if (it == vars.end()) return std::nullopt;
      return it->second;
    };
  }
}

TEST(Config, DefaultsMatchDocumentedValues) {
  Config cfg;
  ASSERT_TRUE(cfg.sandbox.allowedDirectories.has_value());
  EXPECT_EQ(*cfg.sandbox.allowedDirectories, "~/Desktop");
  EXPECT_EQ(cfg.sandbox.maxFileSize, 104857600u);
  EXPECT_EQ(cfg.sandbox.maxWriteSize, 10485760u);
  EXPECT_EQ(cfg.sandbox.rateLimit, 60);
  EXPECT_EQ(cfg.sandbox.rateWindowSeconds, 60);
  EXPECT_EQ(cfg.logging.level, "info");
}

TEST(Config, LoadsJsonFile) {
  TempDir tmp("config_file");
  fs::path file = tmp.write("bastion.json", R"({
    "allowed_directories": ["/srv/a", "/srv/b"],
    "max_file_size": 2048,
    "max_write_size": 1024,
    "rate_limit": 5,
    "rate_window_seconds": 10,
    "log_level": "debug"
  })");

  Config cfg = Config::load(file.string());
  ASSERT_TRUE(cfg.sandbox.allowedDirectories.has_value());
  EXPECT_EQ(nlohmann::json::parse(*cfg.sandbox.allowedDirectories),
            nlohmann::json::array({"/srv/a", "/srv/b"}));
  EXPECT_EQ(cfg.sandbox.maxFileSize, 2048u);
  EXPECT_EQ(cfg.sandbox.maxWriteSize, 1024u);
  EXPECT_EQ(cfg.sandbox.rateLimit, 5);
  EXPECT_EQ(cfg.sandbox.rateWindowSeconds, 10);
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(Config, MissingOrBrokenFileThrows) {
  TempDir tmp("config_broken");
  EXPECT_THROW(Config::load((tmp.path() / "absent.json").string()), std::runtime_error);

  fs::path broken = tmp.write("broken.json", "{ not json");
  EXPECT_THROW(Config::load(broken.string()), std::runtime_error);
}

TEST(Config, RejectsBadValues) {
  EXPECT_THROW(Config::fromJson(nlohmann::json::array()), std::runtime_error);
  EXPECT_THROW(Config::fromJson({{"max_file_size", -1}}), std::runtime_error);
  EXPECT_THROW(Config::fromJson({{"rate_limit", "many"}}), std::runtime_error);
  EXPECT_THROW(Config::fromJson({{"rate_window_seconds", 0}}), std::runtime_error);
  EXPECT_THROW(Config::fromJson({{"allowed_directories", 42}}), std::runtime_error);
}

TEST(Config, EnvironmentOverridesFile) {
  Config cfg = Config::fromJson({{"rate_limit", 5}, {"max_write_size", 100}});
  cfg.applyEnvironment(envFrom({
    {"ALLOWED_DIRS", "/one,/two"},
    {"RATE_LIMIT", "7"},
    {"MAX_FILE_SIZE", "4096"},
    {"LOG_LEVEL", "warn"}
  }));

  EXPECT_EQ(*cfg.sandbox.allowedDirectories, "/one,/two");
  EXPECT_EQ(cfg.sandbox.rateLimit, 7);
  EXPECT_EQ(cfg.sandbox.maxFileSize, 4096u);
  EXPECT_EQ(cfg.sandbox.maxWriteSize, 100u);
  EXPECT_EQ(cfg.logging.level, "warn");
}

TEST(Config, MaxMbAppliesOnlyWithoutMaxFileSize) {
  Config a;
  a.applyEnvironment(envFrom({{"MAX_MB", "3"}}));
  EXPECT_EQ(a.sandbox.maxFileSize, 3u * 1024 * 1024);

  Config b;
  b.applyEnvironment(envFrom({{"MAX_MB", "0"}}));
  EXPECT_EQ(b.sandbox.maxFileSize, 1u * 1024 * 1024);

  Config c;
  c.applyEnvironment(envFrom({{"MAX_MB", "3"}, {"MAX_FILE_SIZE", "10"}}));
  EXPECT_EQ(c.sandbox.maxFileSize, 10u);
}

TEST(Config, MalformedEnvironmentNumbersThrow) {
  Config cfg;
  EXPECT_THROW(cfg.applyEnvironment(envFrom({{"RATE_LIMIT", "-1"}})), std::runtime_error);
  EXPECT_THROW(cfg.applyEnvironment(envFrom({{"MAX_WRITE_SIZE", "12abc"}})), std::runtime_error);
  EXPECT_THROW(cfg.applyEnvironment(envFrom({{"RATE_WINDOW_SECONDS", "0"}})), std::runtime_error);
}

TEST(Config, GatewayLimitsFollowConfig) {
  Config cfg = Config::fromJson({{"max_file_size", 10}, {"max_write_size", 5}, {"rate_limit", 3},
                                 {"rate_window_seconds", 30}});
  GatewayLimits limits = GatewayLimits::fromConfig(cfg);
  EXPECT_EQ(limits.maxReadBytes, 10u);
  EXPECT_EQ(limits.maxWriteBytes, 5u);
  EXPECT_EQ(limits.rateLimit, 3);
  EXPECT_EQ(limits.rateWindow, std::chrono::milliseconds(30000));
}
