#include <gtest/gtest.h>
#include "common/text_utils.h"

using namespace paw;

TEST(TextUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  wlan0 \t\n"), "wlan0");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TextUtilsTest, SplitWhitespaceCollapsesRuns) {
    auto tokens = splitWhitespace("  capture   start\twlan0mon  ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "capture");
    EXPECT_EQ(tokens[1], "start");
    EXPECT_EQ(tokens[2], "wlan0mon");
}

TEST(TextUtilsTest, SplitLinesStripsCarriageReturns) {
    auto lines = splitLines("one\r\ntwo\nthree");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[2], "three");
}

TEST(TextUtilsTest, TailLinesSkipsBlankLines) {
    EXPECT_EQ(tailLines("a\n\nb\n  \nc\n", 2), "b\nc");
    EXPECT_EQ(tailLines("only", 5), "only");
    EXPECT_EQ(tailLines("", 3), "");
}

TEST(TextUtilsTest, CaseHelpers) {
    EXPECT_EQ(toLower("WLAN0Mon"), "wlan0mon");
    EXPECT_EQ(toUpper("aa:bb"), "AA:BB");
    EXPECT_TRUE(containsIgnoreCase("Monitor Mode Enabled", "mode enabled"));
    EXPECT_FALSE(containsIgnoreCase("station", "monitor"));
    EXPECT_TRUE(startsWith("wlan0mon", "wlan"));
    EXPECT_TRUE(endsWith("wlan0mon", "mon"));
    EXPECT_FALSE(endsWith("on", "mon"));
}

TEST(TextUtilsTest, JoinArgs) {
    EXPECT_EQ(joinArgs({"airmon-ng", "start", "wlan0"}), "airmon-ng start wlan0");
    EXPECT_EQ(joinArgs({}), "");
}
