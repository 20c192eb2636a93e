// File: tests/splitter_test.cpp
// Purpose: Statement splitting keeps source line numbers and drops noise.

#include <gtest/gtest.h>

#include "valyxo/splitter.hpp"

using namespace vx;

TEST(Splitter, KeepsSourceLineNumbers)
{
    auto lines = split("set x = 1\n\n# comment\n   print x   \n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].line, 1);
    EXPECT_EQ(lines[0].text, "set x = 1");
    EXPECT_EQ(lines[1].line, 4);
    EXPECT_EQ(lines[1].text, "print x");
}

TEST(Splitter, ToleratesCrlfAndBom)
{
    auto lines = split("\xEF\xBB\xBFset a = 1\r\nprint a\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "set a = 1");
    EXPECT_EQ(lines[1].text, "print a");
    EXPECT_EQ(lines[1].line, 2);
}

TEST(Splitter, DropsShebangAndIndentedComments)
{
    auto lines = split("#!/usr/bin/env valyxo\n    # indented comment\nprint 1");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].line, 3);
}

TEST(Splitter, EmptySourceYieldsNothing)
{
    EXPECT_TRUE(split("").empty());
    EXPECT_TRUE(split("\n\n   \n").empty());
}
