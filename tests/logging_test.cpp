#include <gtest/gtest.h>
#include "logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <vector>

using core::logging::LoggingOptions;
using core::logging::level_from_string;

TEST(LoggingTest, LevelNamesAreCaseInsensitive) {
    EXPECT_EQ(level_from_string("TRACE"), spdlog::level::trace);
    EXPECT_EQ(level_from_string("Warning"), spdlog::level::warn);
    EXPECT_EQ(level_from_string("err"), spdlog::level::err);
    EXPECT_EQ(level_from_string("crit"), spdlog::level::critical);
    EXPECT_EQ(level_from_string("off"), spdlog::level::off);
    EXPECT_FALSE(level_from_string("verbose").has_value());
}

TEST(LoggingTest, OptionsFromJson) {
    LoggingOptions defaults = LoggingOptions::fromJson(nlohmann::json::object());
    EXPECT_EQ(defaults.directory, "logs");
    EXPECT_EQ(defaults.console_level, spdlog::level::info);
    EXPECT_TRUE(defaults.write_file);

    LoggingOptions options = LoggingOptions::fromJson(nlohmann::json::parse(
        R"({"directory": "/tmp/rules", "filePrefix": "svc", "consoleLevel": "debug", "fileLevel": "trace", "writeFile": false})"));
    EXPECT_EQ(options.directory, "/tmp/rules");
    EXPECT_EQ(options.file_prefix, "svc");
    EXPECT_EQ(options.console_level, spdlog::level::debug);
    EXPECT_EQ(options.file_level, spdlog::level::trace);
    EXPECT_FALSE(options.write_file);
}

TEST(LoggingTest, OptionsRejectWrongTypes) {
    EXPECT_THROW(LoggingOptions::fromJson(nlohmann::json::parse(R"({"consoleLevel": "loud"})")), std::invalid_argument);
    EXPECT_THROW(LoggingOptions::fromJson(nlohmann::json::parse(R"({"fileLevel": 3})")), std::invalid_argument);
    EXPECT_THROW(LoggingOptions::fromJson(nlohmann::json::parse(R"({"writeFile": "yes"})")), std::invalid_argument);
    EXPECT_THROW(LoggingOptions::fromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST(LoggingTest, InitializeWritesIntoConfiguredDirectory) {
    const std::filesystem::path directory = std::filesystem::path(::testing::TempDir()) / "endpoint_rules_logs";
    std::filesystem::remove_all(directory);

    LoggingOptions options;
    options.directory = directory.string();
    options.console_level = spdlog::level::off;
    core::logging::initialize(options);

    auto& logger = core::logging::getLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "EndpointRules");
    if (std::getenv("SPDLOG_LEVEL") == nullptr) {
        EXPECT_EQ(logger->sinks().size(), 2u);
    }
    EXPECT_FALSE(std::filesystem::is_empty(directory));

    // Back to a quiet console-only logger for the remaining tests
    options.write_file = false;
    options.console_level = spdlog::level::warn;
    core::logging::initialize(options);
    EXPECT_EQ(core::logging::getLogger()->sinks().size(), 1u);
}

TEST(LoggingTest, ConcurrentCallersShareOneLogger) {
    std::vector<spdlog::logger*> seen(8, nullptr);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        workers.emplace_back([&seen, i] {
            for (int call = 0; call < 100; ++call) {
                seen[i] = core::logging::getLogger().get();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    ASSERT_NE(seen[0], nullptr);
    for (auto* logger : seen) {
        EXPECT_EQ(logger, seen[0]);
    }
    EXPECT_EQ(seen[0], core::logging::getLogger().get());
}
