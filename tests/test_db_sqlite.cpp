#include <gtest/gtest.h>
#include "DbTransaction.hpp"
#include "LedgerTestUtils.hpp"

using namespace std;

class DbSqliteTest : public LedgerDbTest {};

TEST_F(DbSqliteTest, LockedReadNeedsWriteTransaction) {
    map<string, QuotaUsageRecord> usages;
    string err;
    EXPECT_THROW(db_->lock_usages("p1", {"volumes"}, usages, err), DbProgrammingError);

    DbTransaction read_tx(*db_, TxMode::Read);
    ASSERT_EQ(read_tx.begin(err), DbStatus::Ok) << err;
    vector<ReservationRecord> rows;
    EXPECT_THROW(db_->lock_reservations({"x"}, rows, err), DbProgrammingError);
    read_tx.rollback();

    DbTransaction write_tx(*db_, TxMode::Write);
    ASSERT_EQ(write_tx.begin(err), DbStatus::Ok) << err;
    EXPECT_EQ(db_->lock_usages("p1", {"volumes"}, usages, err), DbStatus::Ok);
    EXPECT_TRUE(usages.empty());
    // nested begin is a caller bug
    EXPECT_THROW(db_->begin(TxMode::Write, err), DbProgrammingError);
}

TEST_F(DbSqliteTest, UsageRowsAreUniquePerProjectResource) {
    QuotaUsageRecord rec;
    rec.project_id = "p1";
    rec.resource = "volumes";
    rec.in_use = 2;
    rec.until_refresh = 4;
    rec.updated_at = utils::now();

    string err;
    ASSERT_EQ(db_->insert_usage(rec, err), DbStatus::Ok) << err;
    EXPECT_GT(rec.id, 0);

    QuotaUsageRecord dup = rec;
    EXPECT_EQ(db_->insert_usage(dup, err), DbStatus::Duplicate);

    QuotaUsageRecord loaded;
    ASSERT_EQ(db_->get_usage("p1", "volumes", loaded, err), DbStatus::Ok);
    EXPECT_EQ(loaded.in_use, 2);
    ASSERT_TRUE(loaded.until_refresh.has_value());
    EXPECT_EQ(*loaded.until_refresh, 4);
    ASSERT_TRUE(loaded.updated_at.has_value());
    EXPECT_EQ(*loaded.updated_at, *rec.updated_at);

    loaded.id = 999;
    EXPECT_EQ(db_->save_usage(loaded, err), DbStatus::NotFound);
    EXPECT_EQ(db_->get_usage("p1", "gigabytes", loaded, err), DbStatus::NotFound);
}

TEST_F(DbSqliteTest, BusyWriterReportsDeadlock) {
    DbSqlite impatient(cfg_.db_path, 0);
    string err;

    DbTransaction held(*db_, TxMode::Write);
    ASSERT_EQ(held.begin(err), DbStatus::Ok) << err;

    EXPECT_EQ(impatient.begin(TxMode::Write, err), DbStatus::Deadlock);
    EXPECT_TRUE(is_transient(DbStatus::Deadlock));
    EXPECT_FALSE(impatient.in_write_transaction());
}

TEST_F(DbSqliteTest, TransactionRollsBackOnScopeExit) {
    string err;
    {
        DbTransaction tx(*db_, TxMode::Write);
        ASSERT_EQ(tx.begin(err), DbStatus::Ok);
        QuotaRecord rec;
        ASSERT_EQ(db_->create_quota("p1", "volumes", 5, rec, err), DbStatus::Ok);
    }
    QuotaRecord rec;
    EXPECT_EQ(db_->get_quota("p1", "volumes", rec, err), DbStatus::NotFound);

    DbStatus st = with_transaction(*db_, TxMode::Write, err, [&]() {
        QuotaRecord created;
        return db_->create_quota("p1", "volumes", 5, created, err);
    });
    ASSERT_EQ(st, DbStatus::Ok) << err;
    EXPECT_EQ(db_->get_quota("p1", "volumes", rec, err), DbStatus::Ok);
    EXPECT_FALSE(db_->in_write_transaction());
}

TEST_F(DbSqliteTest, ExpiredReservationsAreFoundByTime) {
    QuotaUsageRecord usage;
    usage.project_id = "p1";
    usage.resource = "volumes";
    string err;
    ASSERT_EQ(db_->insert_usage(usage, err), DbStatus::Ok);

    Timestamp now = utils::now();
    for (int i = 0; i < 3; ++i) {
        ReservationRecord r;
        r.uuid = utils::generate_uuid();
        r.usage_id = usage.id;
        r.project_id = "p1";
        r.resource = "volumes";
        r.delta = 1;
        r.expire = now + chrono::seconds(i - 1);   // -1s, now, +1s
        ASSERT_EQ(db_->insert_reservation(r, err), DbStatus::Ok) << err;
    }

    set<int64_t> ids;
    ASSERT_EQ(db_->get_expired_usage_ids(now, ids, err), DbStatus::Ok);
    EXPECT_EQ(ids, set<int64_t>{usage.id});

    DbTransaction tx(*db_, TxMode::Write);
    ASSERT_EQ(tx.begin(err), DbStatus::Ok);
    vector<ReservationRecord> rows;
    ASSERT_EQ(db_->lock_expired_reservations(now, rows, err), DbStatus::Ok);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].expire, now - chrono::seconds(1));
}

TEST_F(DbSqliteTest, GenericRowAccessChecksRegistry) {
    add_volume("v1", "p1", 3);

    Row row;
    string err;
    ASSERT_EQ(db_->get_by_id("volumes", sql_text("v1"), row, err), DbStatus::Ok);
    int64_t size = 0;
    EXPECT_TRUE(row_get_int(row, "size", size));
    EXPECT_EQ(size, 3);
    EXPECT_EQ(db_->get_by_id("volumes", sql_text("nope"), row, err), DbStatus::NotFound);

    int64_t rowid = 0;
    EXPECT_THROW(db_->insert_row("volumes", {{"colour", sql_text("red")}}, rowid, err),
                 DbProgrammingError);
    EXPECT_THROW(db_->get_by_id("instances", sql_text("i1"), row, err), DbProgrammingError);
}
