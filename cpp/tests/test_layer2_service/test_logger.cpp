// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger utility.
 *
 * The Logger is a process-wide singleton; every test installs its own sink and
 * the fixture restores the console sink and the runner's level afterwards.
 */
#include "plx_service.hpp"
#include "test_patterns.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using plexus::utils::LogMessage;
using plexus::utils::Logger;
using plexus::utils::Sink;
using ::testing::HasSubstr;

namespace
{
/// Collects formatted lines in memory.
class CaptureSink : public Sink
{
  public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : m_lines(std::move(lines))
    {
    }
    void write(const LogMessage &msg) override { m_lines->push_back(format_logmsg(msg)); }
    void flush() override {}
    std::string description() const override { return "Capture"; }

  private:
    std::shared_ptr<std::vector<std::string>> m_lines;
};

class FailingSink : public Sink
{
  public:
    void write(const LogMessage &) override { throw std::runtime_error("disk full"); }
    void flush() override {}
    std::string description() const override { return "Failing"; }
};
} // namespace

class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;
    std::shared_ptr<std::vector<std::string>> lines_ = std::make_shared<std::vector<std::string>>();
    Logger::Level saved_level_{Logger::Level::L_INFO};
    size_t saved_max_line_{0};

    void SetUp() override
    {
        saved_level_ = Logger::instance().level();
        saved_max_line_ = Logger::instance().max_log_line_length();
    }

    void TearDown() override
    {
        Logger::instance().set_write_error_callback(nullptr);
        Logger::instance().set_console();
        Logger::instance().set_level(saved_level_);
        Logger::instance().set_max_log_line_length(saved_max_line_);
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    void CaptureOutput() { Logger::instance().set_sink(std::make_unique<CaptureSink>(lines_)); }

    /// Generates a unique temporary path for a log file and registers it for cleanup.
    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = fs::temp_directory_path() / ("plexus_test_" + test_name + ".log");
        paths_to_clean_.push_back(p);
        std::error_code ec;
        fs::remove(p, ec);
        return p;
    }
};

// ============================================================================
// Formatting
// ============================================================================

TEST_F(LoggerTest, LineCarriesPrefixLevelAndBody)
{
    CaptureOutput();
    Logger::instance().set_level(Logger::Level::L_TRACE);

    LOGGER_INFO("bound to '{}' after {} attempt(s)", "tcp://127.0.0.1:5555", 2);

    ASSERT_EQ(lines_->size(), 1u);
    const auto &line = lines_->front();
    EXPECT_THAT(line, HasSubstr("[PLEXUS]"));
    EXPECT_THAT(line, HasSubstr("[INFO  ]"));
    EXPECT_THAT(line, HasSubstr("PID:"));
    EXPECT_THAT(line, HasSubstr("bound to 'tcp://127.0.0.1:5555' after 2 attempt(s)"));
    EXPECT_EQ(line.back(), '\n');
}

TEST_F(LoggerTest, LevelFiltering)
{
    CaptureOutput();
    Logger::instance().set_level(Logger::Level::L_WARNING);

    LOGGER_TRACE("trace");
    LOGGER_DEBUG("debug");
    LOGGER_INFO("info");
    LOGGER_WARN("warn");
    LOGGER_ERROR("error");

    ASSERT_EQ(lines_->size(), 2u);
    EXPECT_THAT((*lines_)[0], HasSubstr("[WARN  ] "));
    EXPECT_THAT((*lines_)[1], HasSubstr("[ERROR ] "));
    EXPECT_FALSE(Logger::instance().should_log(Logger::Level::L_INFO));
    EXPECT_TRUE(Logger::instance().should_log(Logger::Level::L_ERROR));
}

TEST_F(LoggerTest, LongLinesAreTruncated)
{
    CaptureOutput();
    Logger::instance().set_level(Logger::Level::L_TRACE);
    Logger::instance().set_max_log_line_length(32);

    LOGGER_INFO("{}", std::string(200, 'x'));

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_THAT(lines_->front(), HasSubstr("...[TRUNCATED]"));
    EXPECT_EQ(lines_->front().find(std::string(33, 'x')), std::string::npos);
}

// ============================================================================
// Sinks
// ============================================================================

TEST_F(LoggerTest, FileSinkAppendsLines)
{
    auto log_path = GetUniqueLogPath("file_sink");
    ASSERT_TRUE(Logger::instance().set_logfile(log_path.string()));
    Logger::instance().set_level(Logger::Level::L_TRACE);

    LOGGER_INFO("first line");
    LOGGER_ERROR("second line {}", 2);
    Logger::instance().set_console(); // flushes and closes the file

    std::ifstream in(log_path);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_THAT(contents.str(), HasSubstr("first line"));
    EXPECT_THAT(contents.str(), HasSubstr("second line 2"));
}

TEST_F(LoggerTest, SetLogfileFailureKeepsPreviousSink)
{
    CaptureOutput();
    Logger::instance().set_level(Logger::Level::L_INFO);

    EXPECT_FALSE(Logger::instance().set_logfile("/nonexistent-dir/plexus/test.log"));
    LOGGER_INFO("still captured");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_THAT(lines_->front(), HasSubstr("still captured"));
}

TEST_F(LoggerTest, ShutdownDiscardsMessages)
{
    Logger::instance().shutdown();
    LOGGER_ERROR("dropped");
    CaptureOutput();
    LOGGER_ERROR("kept");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_THAT(lines_->front(), HasSubstr("kept"));
}

TEST_F(LoggerTest, WriteFailureIsCountedAndReported)
{
    std::vector<std::string> reported;
    Logger::instance().set_sink(std::make_unique<FailingSink>());
    Logger::instance().set_write_error_callback(
        [&reported](const std::string &err) { reported.push_back(err); });

    const int before = Logger::instance().write_failure_count();
    LOGGER_ERROR("this write fails");

    EXPECT_EQ(Logger::instance().write_failure_count(), before + 1);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_THAT(reported.front(), HasSubstr("Failing"));
    EXPECT_THAT(reported.front(), HasSubstr("disk full"));
}
