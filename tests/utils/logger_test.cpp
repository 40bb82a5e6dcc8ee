/**
 * @file logger_test.cpp
 * @brief Tests for level filtering, formatting and the log sinks
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace swarmnet {
namespace tests {

using utils::LogCategory;
using utils::LogEntry;
using utils::LogLevel;
using utils::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setConsoleEnabled(false);
        Logger::setLevel(LogLevel::TRACE);
        Logger::clearStatistics();
        log_path_ = std::filesystem::temp_directory_path() / "swarmnet_logger_test.log";
        std::filesystem::remove(log_path_);
    }

    void TearDown() override {
        Logger::setLogFile("");
        Logger::setFormatter(std::make_unique<utils::DefaultFormatter>());
        Logger::setCategoryEnabled(LogCategory::TOPOLOGY, true);
        Logger::setLevel(LogLevel::INFO);
        Logger::setConsoleEnabled(true);
        std::filesystem::remove(log_path_);
    }

    size_t linesContaining(const std::string& needle) const {
        std::ifstream in(log_path_);
        std::string line;
        size_t count = 0;
        while (std::getline(in, line)) {
            if (line.find(needle) != std::string::npos) {
                count++;
            }
        }
        return count;
    }

    static LogEntry sampleEntry() {
        LogEntry entry;
        entry.level = LogLevel::WARNING;
        entry.category = LogCategory::TOPOLOGY;
        entry.message = "seed \"agent_0\" unreachable";
        entry.file = "topology_manager.cpp";
        entry.line = 42;
        entry.function = "registerAgent";
        entry.thread_id = "1";
        entry.timestamp = std::chrono::system_clock::now();
        entry.context = {{"peer", "agent_0"}};
        return entry;
    }

    std::filesystem::path log_path_;
};

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("Warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLevel("loud", LogLevel::ERROR), LogLevel::ERROR);

    EXPECT_EQ(Logger::getLevelName(LogLevel::WARNING), "WARN");
    EXPECT_EQ(Logger::getCategoryName(LogCategory::NETWORKING), "NET");
    EXPECT_EQ(Logger::getCategoryName(LogCategory::TOPOLOGY), "TOPOLOGY");
}

TEST_F(LoggerTest, DropsEntriesBelowLevel) {
    Logger::setLevel(LogLevel::WARNING);
    EXPECT_EQ(Logger::getLevel(), LogLevel::WARNING);

    SWARMNET_LOG_INFO(TOPOLOGY, "metrics collected");
    SWARMNET_LOG_ERROR(TOPOLOGY, "health check failed");

    auto stats = Logger::getStatistics();
    EXPECT_EQ(stats.count("INFO_TOPOLOGY"), 0u);
    EXPECT_EQ(stats["ERROR_TOPOLOGY"], 1u);
}

TEST_F(LoggerTest, DropsDisabledCategories) {
    Logger::setCategoryEnabled(LogCategory::TOPOLOGY, false);

    SWARMNET_LOG_ERROR(TOPOLOGY, "suppressed");
    SWARMNET_LOG_ERROR(TRANSPORT, "kept");

    auto stats = Logger::getStatistics();
    EXPECT_EQ(stats.count("ERROR_TOPOLOGY"), 0u);
    EXPECT_EQ(stats["ERROR_TRANSPORT"], 1u);
}

TEST_F(LoggerTest, RecentEntriesCarrySourceLocation) {
    SWARMNET_LOG_WARNING(AGENT, "peer agent_3 declined task");
    Logger::log(LogLevel::DEBUG, LogCategory::TRANSPORT, "heartbeat sent", "", 0, "", {{"peer", "agent_1"}});

    auto recent = Logger::getRecentEntries(2);
    ASSERT_EQ(recent.size(), 2u);

    EXPECT_EQ(recent[0].message, "peer agent_3 declined task");
    EXPECT_EQ(recent[0].category, LogCategory::AGENT);
    EXPECT_NE(recent[0].file.find("logger_test.cpp"), std::string::npos);
    EXPECT_GT(recent[0].line, 0);
    EXPECT_FALSE(recent[0].thread_id.empty());

    EXPECT_EQ(recent[1].message, "heartbeat sent");
    EXPECT_EQ(recent[1].context.at("peer"), "agent_1");
}

TEST_F(LoggerTest, DefaultFormatterAppendsContext) {
    utils::DefaultFormatter formatter;
    std::string line = formatter.format(sampleEntry());

    EXPECT_NE(line.find("[WARN] [TOPOLOGY] [1] seed \"agent_0\" unreachable"), std::string::npos);
    EXPECT_NE(line.find("[peer=agent_0]"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatterEmitsParsableObject) {
    utils::JsonFormatter formatter;
    auto object = nlohmann::json::parse(formatter.format(sampleEntry()));

    EXPECT_EQ(object["level"], "WARN");
    EXPECT_EQ(object["category"], "TOPOLOGY");
    EXPECT_EQ(object["message"], "seed \"agent_0\" unreachable");
    EXPECT_EQ(object["line"], 42);
    EXPECT_EQ(object["function"], "registerAgent");
    EXPECT_EQ(object["context"]["peer"], "agent_0");
}

TEST_F(LoggerTest, JsonFormatterEscapesControlCharacters) {
    utils::JsonFormatter formatter;
    LogEntry entry = sampleEntry();
    entry.message = std::string("No handler for evil\r\x01\b\f\x1f" "type");
    entry.context = {{"type", "line\r\nbreak"}};

    std::string line = formatter.format(entry);
    EXPECT_EQ(line.find('\r'), std::string::npos);
    EXPECT_EQ(line.find('\x01'), std::string::npos);

    auto object = nlohmann::json::parse(line, nullptr, false);
    ASSERT_FALSE(object.is_discarded()) << line;
    EXPECT_EQ(object["message"], entry.message);
    EXPECT_EQ(object["context"]["type"], "line\r\nbreak");
}

TEST_F(LoggerTest, JsonFormatterReplacesInvalidUtf8) {
    utils::JsonFormatter formatter;
    LogEntry entry = sampleEntry();
    entry.message = std::string("payload type \xff\xfe from agent_9");

    auto object = nlohmann::json::parse(formatter.format(entry), nullptr, false);
    ASSERT_FALSE(object.is_discarded());
    EXPECT_NE(object["message"].get<std::string>().find("from agent_9"), std::string::npos);
}

TEST_F(LoggerTest, WritesToLogFile) {
    Logger::setLogFile(log_path_.string());
    Logger::setFormatter(std::make_unique<utils::JsonFormatter>());

    SWARMNET_LOG_INFO(CLI, "swarm of 5 agents ready");
    Logger::flush();

    EXPECT_EQ(linesContaining("\"message\":\"swarm of 5 agents ready\""), 1u);

    Logger::setLogFile("");
    SWARMNET_LOG_INFO(CLI, "not written");
    Logger::flush();
    EXPECT_EQ(linesContaining("not written"), 0u);
}

TEST_F(LoggerTest, ShutdownDrainsAsyncQueue) {
    Logger::initialize(LogLevel::TRACE, log_path_.string(), true);

    for (int i = 0; i < 50; ++i) {
        SWARMNET_LOG_DEBUG(EVENTS, "queued entry " + std::to_string(i));
    }
    Logger::shutdown();

    EXPECT_EQ(linesContaining("queued entry"), 50u);
}

} // namespace tests
} // namespace swarmnet
