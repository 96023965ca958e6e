#include <gtest/gtest.h>
#include <thread>
#include "ConditionalUpdate.hpp"
#include "LedgerTestUtils.hpp"

using namespace std;

namespace {
string text_of(const Row &row, const string &col) {
    string v;
    row_get_text(row, col, v);
    return v;
}
} // namespace

TEST(ConditionalUpdateSql, FieldReferencesBeforeLiterals) {
    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("status", sql_text("retyping"))
       .set("previous_status", UpdateValue::field_ref("status"))
       .where("id", "=", sql_text("v1"))
       .expect("status", sql_text("available"));

    SqlStatement stmt = build_conditional_update(req);
    EXPECT_EQ(stmt.sql,
              "UPDATE volumes SET previous_status = status, status = ? "
              "WHERE id = ? AND status = ? AND deleted = 0;");
    ASSERT_EQ(stmt.params.size(), 3u);
    EXPECT_EQ(get<string>(stmt.params[0]), "retyping");
    EXPECT_EQ(get<string>(stmt.params[1]), "v1");
    EXPECT_EQ(get<string>(stmt.params[2]), "available");
}

TEST(ConditionalUpdateSql, ExplicitOrderComesFirst) {
    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("host", sql_text("node2"))
       .set("previous_status", UpdateValue::field_ref("status"))
       .set("status", UpdateValue::case_of({CaseWhen{Filter{"size", ">", sql_int(10)},
                                                      UpdateValue::of(sql_text("big"))}},
                                            UpdateValue::of(sql_text("small"))));
    req.order = {"host"};

    SqlStatement stmt = build_conditional_update(req);
    EXPECT_EQ(stmt.sql,
              "UPDATE volumes SET host = ?, previous_status = status, "
              "status = CASE WHEN size > ? THEN ? ELSE ? END WHERE deleted = 0;");
    EXPECT_EQ(stmt.params.size(), 4u);
}

TEST(ConditionalUpdateSql, FieldOffsetAndIncludeDeleted) {
    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("size", UpdateValue::field_ref("size", 5));
    req.include_deleted = true;

    SqlStatement stmt = build_conditional_update(req);
    EXPECT_EQ(stmt.sql, "UPDATE volumes SET size = (size + ?);");
    ASSERT_EQ(stmt.params.size(), 1u);
    EXPECT_EQ(get<int64_t>(stmt.params[0]), 5);
}

TEST(ConditionalUpdateSql, NullAwareConditions) {
    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("status", sql_text("deleting"))
       .expect("host", Condition::equal(sql_null()))
       .expect("status", Condition::none_of({sql_text("in-use"), sql_text("attaching")}))
       .expect("previous_status", Condition::not_equal(sql_text("error"), false))
       .expect("volume_type_id", Condition::any_of({sql_text("t1"), sql_null()}))
       .expect("project_id", Condition::any_of({}));

    SqlStatement stmt = build_conditional_update(req);
    EXPECT_EQ(stmt.sql,
              "UPDATE volumes SET status = ? WHERE (host IS NULL) "
              "AND (NOT (status IN (?, ?)) OR status IS NULL) "
              "AND NOT (previous_status = ?) "
              "AND (volume_type_id = ? OR volume_type_id IS NULL) "
              "AND 0 = 1 AND deleted = 0;");
}

TEST(ConditionalUpdateSql, EntityWithoutDeletedColumn) {
    ConditionalUpdate req;
    req.entity = "quota_usages";
    req.set("reserved", sql_int(0)).where("resource", "LIKE", sql_text("gigabytes%"));

    SqlStatement stmt = build_conditional_update(req);
    EXPECT_EQ(stmt.sql, "UPDATE quota_usages SET reserved = ? WHERE resource LIKE ?;");
}

TEST(ConditionalUpdateSql, ProgrammingErrors) {
    ConditionalUpdate multi;
    multi.entity = "volumes";
    multi.set("snapshots.status", sql_text("x"));
    EXPECT_THROW(build_conditional_update(multi), DbProgrammingError);

    ConditionalUpdate multi_expect;
    multi_expect.entity = "volumes";
    multi_expect.set("status", sql_text("x")).expect("snapshots.status", sql_text("y"));
    EXPECT_THROW(build_conditional_update(multi_expect), DbProgrammingError);

    ConditionalUpdate unknown_field;
    unknown_field.entity = "volumes";
    unknown_field.set("colour", sql_text("red"));
    EXPECT_THROW(build_conditional_update(unknown_field), DbProgrammingError);

    ConditionalUpdate unknown_entity;
    unknown_entity.entity = "instances";
    unknown_entity.set("status", sql_text("x"));
    EXPECT_THROW(build_conditional_update(unknown_entity), DbProgrammingError);

    ConditionalUpdate no_values;
    no_values.entity = "volumes";
    EXPECT_THROW(build_conditional_update(no_values), DbProgrammingError);

    ConditionalUpdate bad_op;
    bad_op.entity = "volumes";
    bad_op.set("status", sql_text("x")).where("size", "<>", sql_int(1));
    EXPECT_THROW(build_conditional_update(bad_op), DbProgrammingError);

    ConditionalUpdate null_compare;
    null_compare.entity = "volumes";
    null_compare.set("status", sql_text("x")).where("host", "<", sql_null());
    EXPECT_THROW(build_conditional_update(null_compare), DbProgrammingError);

    ConditionalUpdate twice;
    twice.entity = "volumes";
    twice.set("status", sql_text("a")).set("volumes.status", sql_text("b"));
    EXPECT_THROW(build_conditional_update(twice), DbProgrammingError);
}

class ConditionalUpdateDb : public LedgerDbTest {
protected:
    RetryPolicy policy() const {
        RetryPolicy p;
        p.interval_ms = 1;
        p.max_interval_ms = 10;
        return p;
    }
};

TEST_F(ConditionalUpdateDb, RetypeCopiesOldStatus) {
    add_volume("v1", "p1", 10);

    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("status", sql_text("retyping"))
       .set("previous_status", UpdateValue::field_ref("status"))
       .where("id", "=", sql_text("v1"))
       .expect("status", Condition::any_of({sql_text("available"), sql_text("in-use")}));

    bool updated = false;
    string err;
    ASSERT_EQ(conditional_update(*db_, req, updated, err, policy(), logger_.get()), DbStatus::Ok)
        << err;
    EXPECT_TRUE(updated);

    Row row;
    ASSERT_EQ(db_->get_by_id("volumes", sql_text("v1"), row, err), DbStatus::Ok);
    EXPECT_EQ(text_of(row, "status"), "retyping");
    EXPECT_EQ(text_of(row, "previous_status"), "available");

    // second attempt no longer matches
    ASSERT_EQ(conditional_update(*db_, req, updated, err, policy(), logger_.get()), DbStatus::Ok);
    EXPECT_FALSE(updated);
}

TEST_F(ConditionalUpdateDb, DeletedRowsAreSkipped) {
    add_row("volumes", {{"id", sql_text("v1")}, {"project_id", sql_text("p1")},
                        {"status", sql_text("available")}, {"deleted", sql_int(1)}});

    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("status", sql_text("error")).where("id", "=", sql_text("v1"));

    bool updated = true;
    string err;
    ASSERT_EQ(conditional_update(*db_, req, updated, err, policy()), DbStatus::Ok);
    EXPECT_FALSE(updated);

    req.include_deleted = true;
    ASSERT_EQ(conditional_update(*db_, req, updated, err, policy()), DbStatus::Ok);
    EXPECT_TRUE(updated);
}

TEST_F(ConditionalUpdateDb, NotEqualMatchesNullWithAutoNone) {
    add_volume("v1", "p1", 1);   // host is NULL

    ConditionalUpdate strict;
    strict.entity = "volumes";
    strict.set("status", sql_text("migrating"))
          .where("id", "=", sql_text("v1"))
          .expect("host", Condition::not_equal(sql_text("node1"), false));

    bool updated = true;
    string err;
    ASSERT_EQ(conditional_update(*db_, strict, updated, err, policy()), DbStatus::Ok);
    EXPECT_FALSE(updated);

    ConditionalUpdate lenient = strict;
    lenient.expected.clear();
    lenient.expect("host", Condition::not_equal(sql_text("node1")));
    ASSERT_EQ(conditional_update(*db_, lenient, updated, err, policy()), DbStatus::Ok);
    EXPECT_TRUE(updated);
}

TEST_F(ConditionalUpdateDb, MultitableThrowsBeforeTouchingStore) {
    add_volume("v1", "p1", 1);

    ConditionalUpdate req;
    req.entity = "volumes";
    req.set("status", sql_text("x")).expect("snapshots.status", sql_text("y"));

    bool updated = false;
    string err;
    EXPECT_THROW(conditional_update(*db_, req, updated, err, policy()), DbProgrammingError);
    EXPECT_FALSE(db_->in_write_transaction());
}

TEST_F(ConditionalUpdateDb, ConcurrentClaimsHaveOneWinner) {
    add_volume("v1", "p1", 10);

    const int kWorkers = 8;
    atomic<int> winners{0};
    atomic<int> failures{0};
    vector<thread> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back([&, i]() {
            auto db = connect();
            ConditionalUpdate req;
            req.entity = "volumes";
            req.set("status", sql_text("attaching"))
               .set("host", sql_text("node" + to_string(i)))
               .where("id", "=", sql_text("v1"))
               .expect("status", sql_text("available"));

            bool updated = false;
            string err;
            RetryPolicy p;
            p.max_retries = 20;
            p.interval_ms = 1;
            p.max_interval_ms = 20;
            DbStatus st = conditional_update(*db, req, updated, err, p, logger_.get());
            if (st != DbStatus::Ok) failures++;
            else if (updated) winners++;
        });
    }
    for (auto &t : workers) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(winners.load(), 1);

    Row row;
    string err;
    ASSERT_EQ(db_->get_by_id("volumes", sql_text("v1"), row, err), DbStatus::Ok);
    EXPECT_EQ(text_of(row, "status"), "attaching");
}
