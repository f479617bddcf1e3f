#include <gtest/gtest.h>
#include "common/logging.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace Common;

// =============================================================================
// LOGGER TEST BASE
// =============================================================================

class LoggerTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        test_log_dir_ = "logs/test_logger_" + std::to_string(timestamp);
        std::filesystem::create_directories(test_log_dir_);
        previous_level_ = Logger::minLevel();
    }

    void TearDown() override {
        Logger::setMinLevel(previous_level_);
        shutdownLogging();
    }

    std::string createTempLogFile() {
        static int counter = 0;
        return test_log_dir_ + "/logger_" + std::to_string(++counter) + ".log";
    }

    static std::string readLogFile(const std::string& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string test_log_dir_;
    Logger::Level previous_level_ = Logger::INFO;
};

// =============================================================================
// 1. FUNCTIONAL CORRECTNESS
// =============================================================================

TEST_F(LoggerTestBase, InitializationAndShutdownContract) {
    // === GIVEN ===
    std::string log_path = createTempLogFile();

    // === WHEN ===
    initLogging(log_path.c_str());
    LOG_INFO("Test initialization message");
    shutdownLogging();

    // === THEN ===
    ASSERT_TRUE(std::filesystem::exists(log_path)) << "Log file must be created during initialization";
    std::string content = readLogFile(log_path);
    EXPECT_NE(content.find("[LOGGER_CONFIG]"), std::string::npos) << "Header line must be written";
    EXPECT_NE(content.find("Test initialization message"), std::string::npos);

    // Reinitialising appends to the same file
    initLogging(log_path.c_str());
    LOG_WARN("Test reinitialization message");
    shutdownLogging();

    content = readLogFile(log_path);
    EXPECT_NE(content.find("Test initialization message"), std::string::npos) << "Earlier records preserved";
    EXPECT_NE(content.find("Test reinitialization message"), std::string::npos);
}

TEST_F(LoggerTestBase, LogLevelsAndFormatContract) {
    // === GIVEN ===
    std::string log_path = createTempLogFile();
    Logger::setMinLevel(Logger::DEBUG);
    initLogging(log_path.c_str());

    // === WHEN ===
    LOG_DEBUG("Debug message with value %d", 42);
    LOG_INFO("Info message for station %s", "DL-ANAND-VIHAR");
    LOG_WARN("Warning: exceedance %.1f%%", 12.5);
    LOG_ERROR("Error: connection failed, retrying");
    LOG_FATAL("Fatal: ledger write failed");
    shutdownLogging();

    // === THEN ===
    std::string content = readLogFile(log_path);
    EXPECT_NE(content.find("][DEBUG][T"), std::string::npos);
    EXPECT_NE(content.find("][INFO ][T"), std::string::npos);
    EXPECT_NE(content.find("][WARN ][T"), std::string::npos);
    EXPECT_NE(content.find("][ERROR][T"), std::string::npos);
    EXPECT_NE(content.find("][FATAL][T"), std::string::npos);

    EXPECT_NE(content.find("Debug message with value 42"), std::string::npos);
    EXPECT_NE(content.find("Info message for station DL-ANAND-VIHAR"), std::string::npos);
    EXPECT_NE(content.find("Warning: exceedance 12.5%"), std::string::npos);

    // Every record line starts with [seconds.nanoseconds]
    std::istringstream stream(content);
    std::string line;
    int records = 0;
    while (std::getline(stream, line)) {
        if (line.rfind("[LOGGER_CONFIG]", 0) == 0) continue;
        ++records;
        ASSERT_EQ(line[0], '[');
        size_t close = line.find(']');
        ASSERT_NE(close, std::string::npos);
        EXPECT_NE(line.substr(1, close - 1).find('.'), std::string::npos) << "Timestamp should carry nanoseconds";
    }
    EXPECT_EQ(records, 5);
}

TEST_F(LoggerTestBase, MinimumLevelFiltersContract) {
    std::string log_path = createTempLogFile();
    Logger::setMinLevel(Logger::WARN);
    initLogging(log_path.c_str());

    LOG_DEBUG("filtered debug");
    LOG_INFO("filtered info");
    LOG_WARN("kept warning");
    shutdownLogging();

    std::string content = readLogFile(log_path);
    EXPECT_EQ(content.find("filtered debug"), std::string::npos);
    EXPECT_EQ(content.find("filtered info"), std::string::npos);
    EXPECT_NE(content.find("kept warning"), std::string::npos);
}

TEST_F(LoggerTestBase, ParseLevelContract) {
    Logger::Level level = Logger::INFO;
    ASSERT_TRUE(Logger::parseLevel("debug", &level));
    EXPECT_EQ(level, Logger::DEBUG);
    ASSERT_TRUE(Logger::parseLevel("WARN", &level));
    EXPECT_EQ(level, Logger::WARN);
    ASSERT_TRUE(Logger::parseLevel("Error", &level));
    EXPECT_EQ(level, Logger::ERROR);

    level = Logger::FATAL;
    EXPECT_FALSE(Logger::parseLevel("verbose", &level));
    EXPECT_EQ(level, Logger::FATAL) << "Output untouched on unknown names";
}

TEST_F(LoggerTestBase, LongMessagesAreTruncatedContract) {
    std::string log_path = createTempLogFile();
    initLogging(log_path.c_str());

    std::string long_text(1000, 'x');
    LOG_INFO("%s", long_text.c_str());
    LOG_INFO("after long message");
    shutdownLogging();

    std::string content = readLogFile(log_path);
    EXPECT_EQ(content.find(long_text), std::string::npos) << "Message longer than the record must be cut";
    EXPECT_NE(content.find(std::string(Logger::MAX_MSG_SIZE - 1, 'x')), std::string::npos);
    EXPECT_NE(content.find("after long message"), std::string::npos);
}

// =============================================================================
// 2. CONCURRENCY
// =============================================================================

TEST_F(LoggerTestBase, ConcurrentWritersStatsContract) {
    // === GIVEN ===
    std::string log_path = createTempLogFile();
    initLogging(log_path.c_str());

    const int NUM_THREADS = 4;
    const int MESSAGES_PER_THREAD = 500;

    // === WHEN ===
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                LOG_INFO("writer=%d seq=%d", t, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Give the writer thread time to drain before sampling stats
    Logger::Stats stats{};
    for (int attempt = 0; attempt < 100; ++attempt) {
        stats = Logger::getStats();
        if (stats.messages_written + stats.messages_dropped >= NUM_THREADS * MESSAGES_PER_THREAD) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    // === THEN ===
    EXPECT_EQ(stats.messages_written + stats.messages_dropped,
              static_cast<uint64_t>(NUM_THREADS * MESSAGES_PER_THREAD));
    EXPECT_GT(stats.bytes_written, 0u);
    shutdownLogging();

    std::string content = readLogFile(log_path);
    EXPECT_NE(content.find("writer=0 seq=0"), std::string::npos);
    EXPECT_NE(content.find("writer=3 seq=0"), std::string::npos);
    EXPECT_EQ(Logger::getStats().messages_written, 0u) << "No stats without an active logger";
}
