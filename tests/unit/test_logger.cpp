#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "common/logging.h"

using namespace Shield::Common;

// Base test class with a unique log directory per run
class LoggerTestBase : public ::testing::Test {
protected:
    LoggerTestBase() : test_dir_(), test_log_file_() {}

    void SetUp() override {
        const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        test_dir_ = "logs/test_logger_" + std::to_string(stamp);
        std::filesystem::create_directories(test_dir_);
        test_log_file_ = test_dir_ + "/logger_test.log";

        shutdownLogging();
        initLogging(test_log_file_.c_str(), LogLevel::DEBUG);
    }

    void TearDown() override {
        shutdownLogging();
    }

    static auto readLogFile(const std::string& filename) -> std::string {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return "";
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    static auto countLines(const std::string& content) -> size_t {
        return static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    }

    std::string test_dir_;
    std::string test_log_file_;
};

TEST_F(LoggerTestBase, WritesFormattedRecords) {
    LOG_INFO("unit %s scanned with %d findings", "src/app.py", 3);
    LOG_WARN("skipping %s", "blob.bin");
    shutdownLogging();

    const std::string content = readLogFile(test_log_file_);
    EXPECT_NE(std::string::npos, content.find("[INFO ]"));
    EXPECT_NE(std::string::npos, content.find("] unit src/app.py scanned with 3 findings\n"));
    EXPECT_NE(std::string::npos, content.find("[WARN ]"));
    EXPECT_NE(std::string::npos, content.find("] skipping blob.bin\n"));
    EXPECT_EQ(2u, countLines(content));
}

TEST_F(LoggerTestBase, RecordFormat) {
    LOG_ERROR("catalog rejected");
    shutdownLogging();

    const std::string content = readLogFile(test_log_file_);
    ASSERT_FALSE(content.empty());
    // [seconds.nanoseconds][LEVEL][Tthread] message
    EXPECT_EQ('[', content[0]);
    const size_t dot = content.find('.');
    const size_t close = content.find(']');
    ASSERT_NE(std::string::npos, dot);
    ASSERT_NE(std::string::npos, close);
    EXPECT_EQ(9u, close - dot - 1);
    EXPECT_EQ(close, content.find("][ERROR][T"));
    EXPECT_NE(std::string::npos, content.find("] catalog rejected\n"));
}

TEST_F(LoggerTestBase, LevelThresholdFilters) {
    shutdownLogging();
    initLogging(test_log_file_.c_str(), LogLevel::WARN);

    EXPECT_FALSE(isLoggingEnabled(LogLevel::DEBUG));
    EXPECT_FALSE(isLoggingEnabled(LogLevel::INFO));
    EXPECT_TRUE(isLoggingEnabled(LogLevel::WARN));
    EXPECT_TRUE(isLoggingEnabled(LogLevel::FATAL));

    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_ERROR("visible error");
    shutdownLogging();

    const std::string content = readLogFile(test_log_file_);
    EXPECT_EQ(std::string::npos, content.find("hidden"));
    EXPECT_NE(std::string::npos, content.find("visible error"));
}

TEST_F(LoggerTestBase, DisabledAfterShutdown) {
    shutdownLogging();
    EXPECT_FALSE(isLoggingEnabled(LogLevel::FATAL));
    LOG_FATAL("nobody listening");

    const LogStats stats = getLogStats();
    EXPECT_EQ(0u, stats.messages_written);
    EXPECT_EQ(0u, stats.messages_dropped);
}

TEST_F(LoggerTestBase, ReinitialiseAppends) {
    LOG_INFO("first run");
    shutdownLogging();
    initLogging(test_log_file_.c_str(), LogLevel::INFO);
    LOG_INFO("second run");
    shutdownLogging();

    const std::string content = readLogFile(test_log_file_);
    EXPECT_LT(content.find("first run"), content.find("second run"));
    EXPECT_EQ(2u, countLines(content));
}

TEST_F(LoggerTestBase, LongMessagesTruncated) {
    const std::string long_path(1000, 'a');
    LOG_INFO("path %s end", long_path.c_str());
    shutdownLogging();

    const std::string content = readLogFile(test_log_file_);
    EXPECT_EQ(1u, countLines(content));
    EXPECT_EQ(std::string::npos, content.find(" end"));
    EXPECT_LT(content.size(), 400u);
}

TEST_F(LoggerTestBase, ConcurrentProducers) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 500;

    std::vector<std::thread> producers;
    producers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        producers.emplace_back([t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                LOG_DEBUG("worker %d unit %d", t, i);
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }

    // Stats are owned by the live logger, so read them before shutdown
    // after giving the writer time to drain
    constexpr uint64_t EXPECTED = THREADS * PER_THREAD;
    LogStats stats{};
    for (int attempt = 0; attempt < 200; ++attempt) {
        stats = getLogStats();
        if (stats.messages_written + stats.messages_dropped == EXPECTED) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(EXPECTED, stats.messages_written + stats.messages_dropped);
    EXPECT_GT(stats.bytes_written, 0u);

    shutdownLogging();
    const std::string content = readLogFile(test_log_file_);
    EXPECT_EQ(stats.messages_written, countLines(content));
}

TEST(LogLevelTest, ParseNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", &level));
    EXPECT_EQ(LogLevel::DEBUG, level);
    EXPECT_TRUE(parseLogLevel("WARNING", &level));
    EXPECT_EQ(LogLevel::WARN, level);
    EXPECT_TRUE(parseLogLevel("Error", &level));
    EXPECT_EQ(LogLevel::ERROR, level);

    EXPECT_FALSE(parseLogLevel("verbose", &level));
    EXPECT_FALSE(parseLogLevel(nullptr, &level));
    EXPECT_EQ(LogLevel::ERROR, level);
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ("DEBUG", logLevelName(LogLevel::DEBUG));
    EXPECT_STREQ("INFO", logLevelName(LogLevel::INFO));
    EXPECT_STREQ("WARN", logLevelName(LogLevel::WARN));
    EXPECT_STREQ("FATAL", logLevelName(LogLevel::FATAL));
}
