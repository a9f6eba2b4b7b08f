/**
 * @file test_format_tools.cpp
 * @brief Tests for the name-building and formatting helpers.
 */
#include <chrono>
#include <regex>

#include "gtest/gtest.h"
#include "tsp_base.hpp"

namespace ft = treespec::format_tools;

TEST(FormatToolsTest, TrimRemovesOuterWhitespaceOnly)
{
    EXPECT_EQ(ft::trim("  a b \t\n"), "a b");
    EXPECT_EQ(ft::trim(""), "");
    EXPECT_EQ(ft::trim("   "), "");
}

TEST(FormatToolsTest, JoinTrimmedSkipsEmptyFragments)
{
    EXPECT_EQ(ft::join_trimmed("", "pops"), "pops");
    EXPECT_EQ(ft::join_trimmed("A Stack", "pops"), "A Stack pops");
    EXPECT_EQ(ft::join_trimmed("A Stack", ""), "A Stack");
    EXPECT_EQ(ft::join_trimmed(" A Stack ", " pops "), "A Stack   pops");
}

TEST(FormatToolsTest, FilenameOnlyStripsDirectories)
{
    static_assert(ft::filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(ft::filename_only("c.cpp"), "c.cpp");
    EXPECT_EQ(ft::filename_only("C:\\x\\y.cpp"), "y.cpp");
}

TEST(FormatToolsTest, FormattedTimeHasMicroseconds)
{
    const std::string s = ft::formatted_time(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(s, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{6})"))) << s;
}
