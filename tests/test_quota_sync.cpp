#include <gtest/gtest.h>
#include "LedgerTestUtils.hpp"
#include "QuotaSync.hpp"

using namespace std;

class QuotaSyncTest : public LedgerDbTest {
protected:
    int64_t sync(const string &resource, const string &project) {
        map<string, QuotaResource> resources;
        string err;
        EXPECT_EQ(all_resources(*db_, resources, err), DbStatus::Ok) << err;
        int64_t usage = -1;
        EXPECT_EQ(sync_usage(*db_, cfg_, resources.at(resource), project, usage, err),
                  DbStatus::Ok)
            << err;
        return usage;
    }
};

TEST_F(QuotaSyncTest, CountsLiveRowsOfProject) {
    add_volume("v1", "p1", 10);
    add_volume("v2", "p1", 5);
    add_volume("v3", "p2", 100);
    add_row("volumes", {{"id", sql_text("v4")}, {"project_id", sql_text("p1")},
                        {"size", sql_int(40)}, {"deleted", sql_int(1)}});
    add_row("volumes", {{"id", sql_text("v5")}, {"project_id", sql_text("p1")},
                        {"size", sql_int(40)}, {"use_quota", sql_int(0)}});
    add_snapshot("s1", "p1", "v1", 10);
    add_backup("b1", "p1", 7);
    add_backup("b2", "p1", 3);
    add_group("g1", "p1");

    EXPECT_EQ(sync("volumes", "p1"), 2);
    EXPECT_EQ(sync("gigabytes", "p1"), 25);
    EXPECT_EQ(sync("snapshots", "p1"), 1);
    EXPECT_EQ(sync("backups", "p1"), 2);
    EXPECT_EQ(sync("backup_gigabytes", "p1"), 10);
    EXPECT_EQ(sync("groups", "p1"), 1);
    EXPECT_EQ(sync("volumes", "p3"), 0);
    EXPECT_EQ(sync("gigabytes", "p3"), 0);
}

TEST_F(QuotaSyncTest, SnapshotGigabytesCanBeExcluded) {
    add_volume("v1", "p1", 10);
    add_snapshot("s1", "p1", "v1", 10);

    EXPECT_EQ(sync("gigabytes", "p1"), 20);
    cfg_.no_snapshot_gb_quota = true;
    EXPECT_EQ(sync("gigabytes", "p1"), 10);
}

TEST_F(QuotaSyncTest, PerVolumeTypeResources) {
    add_volume_type("t1", "ssd");
    add_volume_type("t2", "hdd");
    add_volume("v1", "p1", 10, "t1");
    add_volume("v2", "p1", 30, "t2");
    add_snapshot("s1", "p1", "v1", 10);

    EXPECT_EQ(sync("volumes_ssd", "p1"), 1);
    EXPECT_EQ(sync("gigabytes_ssd", "p1"), 20);
    EXPECT_EQ(sync("snapshots_ssd", "p1"), 1);
    EXPECT_EQ(sync("snapshots_hdd", "p1"), 0);
    EXPECT_EQ(sync("gigabytes_hdd", "p1"), 30);
}

TEST_F(QuotaSyncTest, Registry) {
    EXPECT_NE(find_sync_function("sync_volumes"), nullptr);
    EXPECT_EQ(find_sync_function("sync_instances"), nullptr);

    auto std_res = standard_resources();
    EXPECT_EQ(std_res.size(), 6u);
    EXPECT_EQ(std_res.at("backup_gigabytes").sync, "sync_backup_gigabytes");

    auto typed = volume_type_resources("t9", "gold");
    ASSERT_EQ(typed.size(), 3u);
    EXPECT_EQ(typed.at("snapshots_gold").volume_type_id, "t9");

    QuotaResource bogus{"bogus", "sync_bogus", "", ""};
    int64_t usage = 0;
    string err;
    EXPECT_THROW(sync_usage(*db_, cfg_, bogus, "p1", usage, err), DbProgrammingError);
}
