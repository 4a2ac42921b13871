#include <gtest/gtest.h>
#include "../src/record.hpp"

namespace {

PackageRecord make_record(const std::string& name, const std::string& id, const std::string& installed,
                          std::optional<std::string> available = std::nullopt) {
    return PackageRecord{name, id, installed, std::move(available), "winget"};
}

} // namespace

TEST(RecordTest, UpdateStateFollowsVersions) {
    auto record = make_record("Git", "Git.Git", "2.40.0");
    EXPECT_FALSE(record.has_update());
    EXPECT_EQ(record.status(), UpdateStatus::Unknown);

    record.available_version = "2.40.0";
    EXPECT_FALSE(record.has_update());
    EXPECT_EQ(record.status(), UpdateStatus::UpToDate);

    record.available_version = "2.42.0";
    EXPECT_TRUE(record.has_update());
    EXPECT_EQ(record.status(), UpdateStatus::Updatable);

    // Versions are compared as text only
    record.installed_version = "2.42.0";
    EXPECT_FALSE(record.has_update());
}

TEST(RecordTest, CountsAndIdsOfUpdatableRecords) {
    RecordList records = {
        make_record("A", "A.A", "1.0", "1.1"),
        make_record("B", "B.B", "2.0", "2.0"),
        make_record("C", "C.C", "3.0"),
        make_record("D", "D.D", "4.0", "5.0"),
    };
    EXPECT_EQ(count_updatable(records), 2u);
    EXPECT_EQ(updatable_ids(records), (std::vector<std::string>{"A.A", "D.D"}));
}

TEST(RecordTest, FilterBySearchAndStatus) {
    RecordList records = {
        make_record("Git", "Git.Git", "2.40.0", "2.42.0"),
        make_record("7-Zip", "7-Zip.7zip", "23.01", "23.01"),
        make_record("GitHub CLI", "GitHub.cli", "2.0.0"),
    };

    auto git = filter_records(records, "GIT", RecordFilter::All);
    ASSERT_EQ(git.size(), 2u);

    auto updates = filter_records(records, "", RecordFilter::Updates);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].id, "Git.Git");

    // Unknown records count as "no update"
    auto current = filter_records(records, "", RecordFilter::UpToDate);
    ASSERT_EQ(current.size(), 2u);
    EXPECT_EQ(current[1].id, "GitHub.cli");

    EXPECT_TRUE(filter_records(records, "7zip", RecordFilter::Updates).empty());
}

TEST(RecordTest, ParsesFilterNames) {
    EXPECT_EQ(parse_record_filter("all"), RecordFilter::All);
    EXPECT_EQ(parse_record_filter("updates"), RecordFilter::Updates);
    EXPECT_EQ(parse_record_filter("uptodate"), RecordFilter::UpToDate);
    EXPECT_FALSE(parse_record_filter("latest").has_value());
}

TEST(RecordTest, FindsRecordById) {
    RecordList records = {make_record("Git", "Git.Git", "2.40.0")};
    ASSERT_NE(find_record(records, "Git.Git"), nullptr);
    EXPECT_EQ(find_record(records, "Git"), nullptr);
}
