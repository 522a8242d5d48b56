// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the asynchronous Logger.
 *
 * Each test owns its Logger instance, so the tests run in-process and in any order.
 */
#include "sfx_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace fs = std::filesystem;
using namespace scenefix::utils;
using namespace scenefix::tests::helper;
using ::testing::HasSubstr;
using ::testing::Not;

/**
 * @class LoggerTest
 * @brief Test fixture for Logger tests.
 *
 * Manages the creation of unique log file paths for each test and ensures
 * they are cleaned up afterwards.
 */
class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec); // best-effort cleanup
        }
    }

    /// Generates a unique temporary path for a log file and registers it for cleanup.
    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = fs::temp_directory_path() /
                 fmt::format("scenefix_test_{}_{}.log", test_name, scenefix::platform::get_pid());
        paths_to_clean_.push_back(p);
        std::error_code ec;
        fs::remove(p, ec);
        return p;
    }

    static std::string ReadLog(const fs::path &p)
    {
        std::string contents;
        read_file_contents(p.string(), contents);
        return contents;
    }
};

TEST_F(LoggerTest, BasicLogging)
{
    auto log_path = GetUniqueLogPath("basic_logging");
    Logger logger;
    ASSERT_TRUE(logger.set_logfile(log_path.string()));

    SFX_LOG_INFO(logger, "hello from {}", "BasicLogging");
    SFX_LOG_ERROR(logger, "error number {}", 42);
    logger.flush();

    const std::string contents = ReadLog(log_path);
    EXPECT_THAT(contents, HasSubstr("hello from BasicLogging"));
    EXPECT_THAT(contents, HasSubstr("error number 42"));
    EXPECT_THAT(contents, HasSubstr("[SFX] [INFO  ]"));
    EXPECT_THAT(contents, HasSubstr("[SFX] [ERROR ]"));
    EXPECT_THAT(contents, HasSubstr(fmt::format("PID:{:5}", scenefix::platform::get_pid())));
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    auto log_path = GetUniqueLogPath("level_filtering");
    Logger logger;
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    logger.set_level(Logger::Level::L_WARNING);
    EXPECT_EQ(logger.level(), Logger::Level::L_WARNING);
    EXPECT_FALSE(logger.should_log(Logger::Level::L_INFO));
    EXPECT_TRUE(logger.should_log(Logger::Level::L_ERROR));

    SFX_LOG_DEBUG(logger, "debug-should-not-appear");
    SFX_LOG_INFO(logger, "info-should-not-appear");
    SFX_LOG_WARN(logger, "warning-should-appear");
    SFX_LOG_ERROR(logger, "error-should-appear");
    logger.flush();

    const std::string contents = ReadLog(log_path);
    EXPECT_THAT(contents, Not(HasSubstr("debug-should-not-appear")));
    EXPECT_THAT(contents, Not(HasSubstr("info-should-not-appear")));
    EXPECT_THAT(contents, HasSubstr("warning-should-appear"));
    EXPECT_THAT(contents, HasSubstr("error-should-appear"));
}

TEST_F(LoggerTest, SinkSwitchMessageCanBeDisabled)
{
    auto first = GetUniqueLogPath("switch_first");
    auto second = GetUniqueLogPath("switch_second");
    Logger logger;
    ASSERT_TRUE(logger.set_logfile(first.string()));
    ASSERT_TRUE(logger.set_logfile(second.string()));
    logger.flush();
    EXPECT_THAT(ReadLog(first), HasSubstr("Switching log sink to:"));

    auto third = GetUniqueLogPath("switch_third");
    logger.set_log_sink_messages_enabled(false);
    ASSERT_TRUE(logger.set_logfile(third.string()));
    SFX_LOG_INFO(logger, "after switch");
    logger.flush();
    EXPECT_THAT(ReadLog(second), Not(HasSubstr("Switching log sink to:")));
    EXPECT_THAT(ReadLog(third), HasSubstr("after switch"));
}

TEST_F(LoggerTest, BadLogFileKeepsPreviousSinkAndReportsError)
{
    auto good = GetUniqueLogPath("bad_file_good");
    Logger logger;
    ASSERT_TRUE(logger.set_logfile(good.string()));

    std::mutex mtx;
    std::condition_variable cv;
    std::string reported;
    logger.set_write_error_callback(
        [&](const std::string &msg)
        {
            std::lock_guard<std::mutex> lock(mtx);
            reported = msg;
            cv.notify_all();
        });

    const fs::path bad = fs::temp_directory_path() / "scenefix_no_such_dir" / "x" / "log.txt";
    EXPECT_FALSE(logger.set_logfile(bad.string()));

    {
        std::unique_lock<std::mutex> lock(mtx);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return !reported.empty(); }));
    }
    EXPECT_THAT(reported, HasSubstr("FileSink"));

    SFX_LOG_INFO(logger, "still going to the good file");
    logger.flush();
    EXPECT_THAT(ReadLog(good), HasSubstr("still going to the good file"));
}

TEST_F(LoggerTest, ShutdownIsIdempotentAndDropsLaterMessages)
{
    auto log_path = GetUniqueLogPath("shutdown");
    Logger logger;
    ASSERT_TRUE(logger.set_logfile(log_path.string()));
    SFX_LOG_INFO(logger, "before shutdown");
    logger.shutdown();
    logger.shutdown();
    SFX_LOG_INFO(logger, "after shutdown");
    logger.flush();

    const std::string contents = ReadLog(log_path);
    EXPECT_THAT(contents, HasSubstr("before shutdown"));
    EXPECT_THAT(contents, HasSubstr("Logger is shutting down."));
    EXPECT_THAT(contents, Not(HasSubstr("after shutdown")));
}

TEST_F(LoggerTest, ConcurrentWritersLoseNothingBelowQueueLimit)
{
    auto log_path = GetUniqueLogPath("concurrent");
    const int threads = 4;
    const int per_thread = scaled_value(500, 50);

    Logger logger;
    logger.set_max_queue_size(static_cast<size_t>(threads * per_thread) * 2);
    ASSERT_TRUE(logger.set_logfile(log_path.string()));

    ThreadRacer racer(threads);
    ASSERT_TRUE(racer.race(
        [&](int id)
        {
            for (int i = 0; i < per_thread; ++i)
            {
                SFX_LOG_INFO(logger, "concurrent-msg thread={} seq={}", id, i);
            }
        }));
    logger.flush();

    EXPECT_EQ(logger.get_total_dropped_since_sink_switch(), 0u);
    EXPECT_EQ(count_lines(ReadLog(log_path), "concurrent-msg"),
              static_cast<size_t>(threads * per_thread));
}

TEST(LoggerLevelNames, RoundTripAndAliases)
{
    EXPECT_EQ(level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(level_from_string("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(level_from_string("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(level_from_string("verbose").has_value());
    EXPECT_STREQ(level_to_string(Logger::Level::L_ERROR), "ERROR");
}
