/**
 * @file test_format_tools.cpp
 * @brief Tests for the log-formatting helpers.
 */
#include "plx_base.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <string>

using namespace plexus::tests;
using plexus::format_tools::formatted_time;
using plexus::format_tools::printable_bytes;

class FormatToolsTest : public PureApiTest
{
};

TEST_F(FormatToolsTest, FormattedTimeHasMicrosecondPrecision)
{
    const std::string text = formatted_time(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(text, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})")))
        << text;
}

TEST_F(FormatToolsTest, PrintableBytesKeepsAscii)
{
    EXPECT_EQ(printable_bytes("sensors/temp"), "sensors/temp");
}

TEST_F(FormatToolsTest, PrintableBytesEscapesControlAndHighBytes)
{
    const std::string raw("a\x01\xff", 3);
    EXPECT_EQ(printable_bytes(raw), "a\\x01\\xff");
}

TEST_F(FormatToolsTest, PrintableBytesTruncates)
{
    const std::string raw(100, 'x');
    EXPECT_EQ(printable_bytes(raw, 4), "xxxx...");
}
