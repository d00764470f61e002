/**
 * @file test_log_config.cpp
 * @brief Atlas日志配置与日志管理器测试
 */

#include "atlas/common/spdlog/atlas_log_manager.h"
#include <gtest/gtest.h>
#include <algorithm>

using namespace atlas::common::spdlog;

class LogConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        AtlasLogManager::Instance().Shutdown();
        AtlasLogConfig::Instance().Reset();
        log_dir_ = ::testing::TempDir() + "atlas_log_test";
    }

    void TearDown() override {
        AtlasLogManager::Instance().Shutdown();
        AtlasLogConfig::Instance().Reset();
    }

    std::string log_dir_;
};

/**
 * @brief 解析全局设置和日志器配置
 */
TEST_F(LogConfigTest, ParsesLoggerConfigs) {
    const std::string json = R"({
        "global": { "log_level": "debug", "log_dir": "custom_logs" },
        "loggers": [
            { "name": "lifecycle", "rotation_type": "hourly", "console_output": true },
            { "name": "audit", "level": "error", "filename_pattern": "audit_trail.log", "rotation_type": "none" }
        ]
    })";

    auto& config = AtlasLogConfig::Instance();
    ASSERT_TRUE(config.LoadFromString(json));

    EXPECT_EQ(config.GetGlobalLogLevel(), LogLevel::DEBUG);
    EXPECT_EQ(config.GetGlobalLogDir(), "custom_logs");
    ASSERT_EQ(config.GetLoggerConfigs().size(), 2u);

    const LoggerConfig* lifecycle = config.GetLoggerConfig("lifecycle");
    ASSERT_NE(lifecycle, nullptr);
    EXPECT_EQ(lifecycle->level, LogLevel::DEBUG);
    EXPECT_EQ(lifecycle->rotation_type, RotationType::HOURLY);
    EXPECT_EQ(lifecycle->log_dir, "custom_logs");
    EXPECT_EQ(lifecycle->filename_pattern, "lifecycle.log");
    EXPECT_TRUE(lifecycle->console_output);

    const LoggerConfig* audit = config.GetLoggerConfig("audit");
    ASSERT_NE(audit, nullptr);
    EXPECT_EQ(audit->level, LogLevel::ERROR);
    EXPECT_EQ(audit->rotation_type, RotationType::NONE);
    EXPECT_EQ(audit->filename_pattern, "audit_trail.log");
    EXPECT_FALSE(audit->console_output);

    EXPECT_EQ(config.GetLoggerConfig("missing"), nullptr);
}

TEST_F(LogConfigTest, RejectsInvalidConfig) {
    auto& config = AtlasLogConfig::Instance();
    EXPECT_FALSE(config.LoadFromString("not json"));
    EXPECT_FALSE(config.LoadFromString(R"({"loggers": [ { "level": "info" } ]})"));
    EXPECT_FALSE(config.LoadFromString("[]"));
}

TEST_F(LogConfigTest, ParsesLevelAndRotationNames) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::INFO);

    EXPECT_EQ(ParseRotationType("hourly"), RotationType::HOURLY);
    EXPECT_EQ(ParseRotationType("none"), RotationType::NONE);
    EXPECT_EQ(ParseRotationType("weekly"), RotationType::DAILY);

    EXPECT_EQ(ToSpdlogLevel(LogLevel::ERROR), ::spdlog::level::err);
    EXPECT_EQ(FromSpdlogLevel(::spdlog::level::critical), LogLevel::CRITICAL);
}

/**
 * @brief 按配置创建日志器
 */
TEST_F(LogConfigTest, ManagerCreatesConfiguredLoggers) {
    nlohmann::json json = {
        {"global", {{"log_level", "warn"}, {"log_dir", log_dir_}}},
        {"loggers", nlohmann::json::array({
            {{"name", "lifecycle"}, {"rotation_type", "none"}},
            {{"name", "file_logger"}, {"rotation_type", "daily"}, {"level", "debug"}}
        })}
    };

    auto& manager = AtlasLogManager::Instance();
    ASSERT_TRUE(manager.InitializeFromJson(json));
    EXPECT_TRUE(manager.IsInitialized());

    EXPECT_TRUE(manager.HasLogger("lifecycle"));
    EXPECT_TRUE(manager.HasLogger("file_logger"));

    auto lifecycle = manager.GetLogger("lifecycle");
    ASSERT_TRUE(lifecycle);
    EXPECT_EQ(lifecycle->level(), ::spdlog::level::warn);
    EXPECT_TRUE(lifecycle->sinks().empty());

    auto file_logger = manager.GetLogger("file_logger");
    ASSERT_TRUE(file_logger);
    EXPECT_EQ(file_logger->level(), ::spdlog::level::debug);
    EXPECT_EQ(file_logger->sinks().size(), 1u);

    ATLAS_LOG_DEBUG("file_logger", "debug message {}", 1);
    ATLAS_LOG_WARN("lifecycle", "warn message {}", 2);

    auto names = manager.GetLoggerNames();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"file_logger", "lifecycle"}));
}

/**
 * @brief 未配置的名称使用全局设置创建默认日志器
 */
TEST_F(LogConfigTest, UnknownLoggerCreatedOnDemand) {
    auto& manager = AtlasLogManager::Instance();
    ASSERT_TRUE(manager.InitializeFromString(R"({"global": {"log_level": "error", "log_dir": ")" + log_dir_ + R"("}})"));

    EXPECT_FALSE(manager.HasLogger("on_demand"));
    auto logger = manager.GetLogger("on_demand");
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger->level(), ::spdlog::level::err);
    EXPECT_TRUE(manager.HasLogger("on_demand"));

    manager.SetGlobalLogLevel(LogLevel::TRACE);
    EXPECT_EQ(logger->level(), ::spdlog::level::trace);
}

TEST_F(LogConfigTest, ShutdownAllowsReinitialization) {
    auto& manager = AtlasLogManager::Instance();
    const std::string json = R"({"loggers": [ { "name": "lifecycle", "rotation_type": "none" } ]})";

    ASSERT_TRUE(manager.InitializeFromString(json));
    manager.Shutdown();
    EXPECT_FALSE(manager.IsInitialized());
    EXPECT_FALSE(manager.HasLogger("lifecycle"));

    ASSERT_TRUE(manager.InitializeFromString(json));
    EXPECT_TRUE(manager.HasLogger("lifecycle"));
}
