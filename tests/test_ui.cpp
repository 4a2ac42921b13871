#include <gtest/gtest.h>
#include "../src/ui.hpp"

TEST(UiTest, DisplayWidthCountsAsciiOnce) {
    EXPECT_EQ(display_width(""), 0u);
    EXPECT_EQ(display_width("Git.Git"), 7u);
}

TEST(UiTest, DisplayWidthCountsWideCharactersTwice) {
    EXPECT_EQ(display_width("名前"), 4u);
    EXPECT_EQ(display_width("バージョン"), 10u);
    EXPECT_EQ(display_width("Zoom 会議"), 9u);
}

TEST(UiTest, DisplayWidthNarrowNonAscii) {
    EXPECT_EQ(display_width("Café"), 4u);
}
