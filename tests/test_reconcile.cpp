#include <gtest/gtest.h>
#include "../src/inventory_parser.hpp"
#include "../src/reconcile.hpp"
#include "../src/upgrade_parser.hpp"
#include "test_support.hpp"

class ReconcileTest : public ::testing::Test {
protected:
    void SetUp() override {
        records = {
            PackageRecord{"Alpha", "A", "1.0", std::nullopt, "winget"},
            PackageRecord{"Beta", "B", "2.0", std::nullopt, "winget"},
        };
    }

    RecordList records;
};

TEST_F(ReconcileTest, MatchedRecordGetsUpdateOthersBecomeCurrent) {
    size_t count = reconcile(records, UpgradeMap{{"A", "1.1"}});

    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(records[0].has_update());
    EXPECT_EQ(records[0].available_version, "1.1");
    EXPECT_FALSE(records[1].has_update());
    EXPECT_EQ(records[1].available_version, "2.0");
}

TEST_F(ReconcileTest, RunningTwiceChangesNothing) {
    const UpgradeMap upgrades{{"A", "1.1"}};
    reconcile(records, upgrades);
    const RecordList once = records;

    reconcile(records, upgrades);
    EXPECT_EQ(records, once);
}

TEST_F(ReconcileTest, ResolvedRecordsAreNotResetByLaterPasses) {
    reconcile(records, UpgradeMap{{"A", "1.1"}});
    const RecordList first = records;

    size_t count = reconcile(records, UpgradeMap{});
    EXPECT_EQ(records, first);
    EXPECT_EQ(count, 1u);
}

TEST_F(ReconcileTest, FallsBackToDisplayName) {
    reconcile(records, UpgradeMap{{"Beta", "2.5"}});
    EXPECT_EQ(records[1].available_version, "2.5");
    EXPECT_TRUE(records[1].has_update());
}

TEST_F(ReconcileTest, IdTakesPriorityOverName) {
    reconcile(records, UpgradeMap{{"Alpha", "9.9"}, {"A", "1.1"}});
    EXPECT_EQ(records[0].available_version, "1.1");
}

TEST_F(ReconcileTest, LaterMatchReplacesEarlierVersion) {
    reconcile(records, UpgradeMap{{"A", "1.1"}});
    reconcile(records, UpgradeMap{{"A", "1.2"}});
    EXPECT_EQ(records[0].available_version, "1.2");
}

TEST(ReconcileEndToEndTest, ListingsProduceExpectedUpdateState) {
    auto records = parse_installed_list(make_listing({
        "Alpha A 1.0",
        "Beta B 2.0",
    }), "winget");
    auto upgrades = parse_upgrade_list(make_listing({"Alpha A 1.0 1.1 winget"}));

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(reconcile(records, upgrades), 1u);

    EXPECT_EQ(records[0].id, "A");
    EXPECT_TRUE(records[0].has_update());
    EXPECT_EQ(records[0].available_version, "1.1");

    EXPECT_EQ(records[1].id, "B");
    EXPECT_FALSE(records[1].has_update());
    EXPECT_EQ(records[1].available_version, "2.0");
}
