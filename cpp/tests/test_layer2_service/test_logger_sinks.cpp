/**
 * @file test_logger_sinks.cpp
 * @brief In-process tests for the synchronous Logger: file sink, level
 *        filtering, line format, and format-error handling.
 */
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "tsp_service.hpp"

namespace fs = std::filesystem;
using treespec::utils::Logger;

/**
 * @class LoggerTest
 * @brief Points the singleton logger at a per-test file and puts the console
 *        sink and the previous level back afterwards.
 */
class LoggerTest : public ::testing::Test
{
  protected:
    fs::path log_path_;
    Logger::Level saved_level_{Logger::Level::L_INFO};

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        log_path_ = fs::temp_directory_path() / (std::string("treespec_test_") + info->name() + ".log");
        std::error_code ec;
        fs::remove(log_path_, ec);
        saved_level_ = Logger::instance().level();
        Logger::instance().set_logfile(log_path_.string());
    }

    void TearDown() override
    {
        Logger::instance().set_console();
        Logger::instance().set_level(saved_level_);
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    std::vector<std::string> read_lines()
    {
        Logger::instance().flush();
        std::ifstream in(log_path_);
        std::vector<std::string> lines;
        for (std::string line; std::getline(in, line);)
        {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(LoggerTest, WritesFormattedLineToFile)
{
    Logger::instance().set_level(Logger::Level::L_INFO);
    LOGGER_INFO("registered {} tests in '{}'", 3, "StackSpec");

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 1u);
    const std::regex pattern(
        R"(\[TSP\] \[INFO  \] \[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6}\] \[TID:\d+\] registered 3 tests in 'StackSpec')");
    EXPECT_TRUE(std::regex_match(lines[0], pattern)) << lines[0];
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    Logger::instance().set_level(Logger::Level::L_WARNING);
    LOGGER_DEBUG("debug {}", 1);
    LOGGER_INFO("info {}", 2);
    LOGGER_WARN("warn {}", 3);
    LOGGER_ERROR("error {}", 4);

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("warn 3"), std::string::npos);
    EXPECT_NE(lines[1].find("error 4"), std::string::npos);
}

TEST_F(LoggerTest, BadRuntimeFormatIsLoggedNotThrown)
{
    Logger::instance().set_level(Logger::Level::L_INFO);
    EXPECT_NO_THROW(LOGGER_INFO_RT("{} and {}", 1));

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[FORMAT ERROR]"), std::string::npos);
}

TEST_F(LoggerTest, SinkDescriptionNamesTheFile)
{
    EXPECT_NE(Logger::instance().sink_description().find(log_path_.string()), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileKeepsPreviousSink)
{
    const std::string before = Logger::instance().sink_description();
    EXPECT_THROW(Logger::instance().set_logfile("/nonexistent-dir/treespec/x.log"), std::runtime_error);
    EXPECT_EQ(Logger::instance().sink_description(), before);
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines)
{
    Logger::instance().set_level(Logger::Level::L_INFO);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    LOGGER_INFO("writer {} line {}", t, i);
                }
            });
    }
    for (auto &th : threads)
    {
        th.join();
    }

    const auto lines = read_lines();
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    for (const auto &line : lines)
    {
        EXPECT_EQ(line.rfind("[TSP] ", 0), 0u) << line;
    }
}

TEST(LoggerLevelTest, LevelFromStringIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("DEBUG").value(), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("warn").value(), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("Warning").value(), Logger::Level::L_WARNING);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}

TEST_F(LoggerTest, ErrorCallbackThatLogsIsNotReentered)
{
    if (!fs::exists("/dev/full"))
    {
        GTEST_SKIP() << "/dev/full is not available";
    }
    Logger::instance().set_level(Logger::Level::L_INFO);
    Logger::instance().set_logfile("/dev/full");

    // Longer than the stdio buffer, so fwrite reaches the device and fails.
    const std::string long_body(64 * 1024, 'x');
    int calls = 0;
    std::string first_error;
    Logger::instance().set_write_error_callback(
        [&](const std::string &what)
        {
            ++calls;
            first_error = what;
            LOGGER_ERROR("write failed again: {}", long_body);
        });

    LOGGER_ERROR("{}", long_body);

    Logger::instance().set_write_error_callback(nullptr);
    EXPECT_EQ(calls, 1);
    EXPECT_NE(first_error.find("/dev/full"), std::string::npos) << first_error;
}
