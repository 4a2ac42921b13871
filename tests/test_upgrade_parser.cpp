#include <gtest/gtest.h>
#include "../src/upgrade_parser.hpp"
#include "test_support.hpp"

TEST(UpgradeParserTest, MapsIdToAvailableVersion) {
    auto upgrades = parse_upgrade_list(make_listing({"Git Git.Git 2.40.0 2.42.0 winget"}));
    ASSERT_EQ(upgrades.size(), 1u);
    EXPECT_EQ(upgrades.at("Git.Git"), "2.42.0");
}

TEST(UpgradeParserTest, ParsesSingleRow) {
    auto entry = parse_upgrade_row("Mozilla Firefox (x64 en-US)  Mozilla.Firefox  120.0.1  121.0  winget");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->first, "Mozilla.Firefox");
    EXPECT_EQ(entry->second, "121.0");
}

TEST(UpgradeParserTest, NeedsTwoVersionTokens) {
    EXPECT_FALSE(parse_upgrade_row("Git Git.Git 2.40.0 winget").has_value());
    EXPECT_FALSE(parse_upgrade_row("Git Git.Git Unknown 2.42.0").has_value());
}

TEST(UpgradeParserTest, VersionInFirstColumnIsDropped) {
    EXPECT_FALSE(parse_upgrade_row("2.40.0 2.42.0 winget").has_value());
}

TEST(UpgradeParserTest, BannerLinesAreIgnored) {
    EXPECT_TRUE(is_upgrade_banner("2 upgrades available."));
    EXPECT_TRUE(is_upgrade_banner("2 Upgrades Available"));
    EXPECT_TRUE(is_upgrade_banner("2 アップグレードを利用できます。"));
    EXPECT_FALSE(is_upgrade_banner("Git Git.Git 2.40.0 2.42.0 winget"));

    auto upgrades = parse_upgrade_list(make_listing({
        "Git Git.Git 2.40.0 2.42.0 winget",
        "1.2 upgrades 3.4 5.6",
        "2 upgrades available.",
    }));
    ASSERT_EQ(upgrades.size(), 1u);
    EXPECT_EQ(upgrades.count("Git.Git"), 1u);
}

TEST(UpgradeParserTest, LastRowWinsForRepeatedId) {
    auto upgrades = parse_upgrade_list(make_listing({
        "Tool Vendor.Tool 1.0 1.1 winget",
        "Tool Vendor.Tool 1.0 1.2 msstore",
    }));
    ASSERT_EQ(upgrades.size(), 1u);
    EXPECT_EQ(upgrades.at("Vendor.Tool"), "1.2");
}

TEST(UpgradeParserTest, NoHeaderMeansNoUpgrades) {
    EXPECT_TRUE(parse_upgrade_list("No installed package found matching input criteria.").empty());
}
