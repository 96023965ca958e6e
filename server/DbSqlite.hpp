#pragma once
#include "Db.hpp"
#include <sqlite3.h>

using namespace std;

// SQLite implementation of the ledger store. One instance is one connection
// and must only be used by one thread at a time; concurrent workers open
// their own instance on the same file.
class DbSqlite : public Db {
public:
    explicit DbSqlite(const string &db_path, int busy_timeout_ms = 5000);
    ~DbSqlite() override;

    DbSqlite(const DbSqlite &) = delete;
    DbSqlite &operator=(const DbSqlite &) = delete;

    DbStatus init_schema(string &err) override;

    DbStatus begin(TxMode mode, string &err) override;
    DbStatus commit(string &err) override;
    DbStatus rollback(string &err) override;
    bool in_write_transaction() const override;

    DbStatus get_by_id(const string &entity, const SqlValue &id,
                       Row &out, string &err) override;
    DbStatus insert_row(const string &entity, const Row &row,
                        int64_t &rowid, string &err) override;
    DbStatus conditional_update(const ConditionalUpdate &req,
                                bool &updated, string &err) override;

    DbStatus get_quota(const string &project_id, const string &resource,
                       QuotaRecord &out, string &err) override;
    DbStatus get_quotas_by_project(const string &project_id,
                                   map<string, int64_t> &out, string &err) override;
    DbStatus create_quota(const string &project_id, const string &resource,
                          int64_t limit, QuotaRecord &out, string &err) override;
    DbStatus update_quota(const string &project_id, const string &resource,
                          int64_t limit, string &err) override;
    DbStatus rename_quota_resource(const string &old_res, const string &new_res,
                                   string &err) override;
    DbStatus destroy_quota(const string &project_id, const string &resource,
                           string &err) override;
    DbStatus destroy_quotas_by_project(const string &project_id, string &err) override;

    DbStatus get_quota_class(const string &class_name, const string &resource,
                             QuotaClassRecord &out, string &err) override;
    DbStatus get_quota_classes_by_name(const string &class_name,
                                       map<string, int64_t> &out, string &err) override;
    DbStatus create_quota_class(const string &class_name, const string &resource,
                                int64_t limit, QuotaClassRecord &out, string &err) override;
    DbStatus update_quota_class(const string &class_name, const string &resource,
                                int64_t limit, string &err) override;
    DbStatus rename_quota_class_resource(const string &old_res, const string &new_res,
                                         string &err) override;
    DbStatus destroy_quota_class(const string &class_name, const string &resource,
                                 string &err) override;
    DbStatus destroy_quota_classes_by_name(const string &class_name, string &err) override;

    DbStatus get_usage(const string &project_id, const string &resource,
                       QuotaUsageRecord &out, string &err) override;
    DbStatus get_usages_by_project(const string &project_id,
                                   vector<QuotaUsageRecord> &out, string &err) override;
    DbStatus lock_usages(const string &project_id, const set<string> &resources,
                         map<string, QuotaUsageRecord> &out, string &err) override;
    DbStatus lock_usages_by_ids(const set<int64_t> &ids,
                                map<int64_t, QuotaUsageRecord> &out, string &err) override;
    DbStatus lock_usages_by_resource(const string &resource,
                                     vector<QuotaUsageRecord> &out, string &err) override;
    DbStatus insert_usage(QuotaUsageRecord &rec, string &err) override;
    DbStatus save_usage(const QuotaUsageRecord &rec, string &err) override;
    DbStatus destroy_usages_by_project(const string &project_id, string &err) override;

    DbStatus insert_reservation(ReservationRecord &rec, string &err) override;
    DbStatus get_reservation_resources(const vector<string> &uuids,
                                       set<string> &out, string &err) override;
    DbStatus get_reservations_by_project(const string &project_id,
                                         vector<ReservationRecord> &out, string &err) override;
    DbStatus lock_reservations(const vector<string> &uuids,
                               vector<ReservationRecord> &out, string &err) override;
    DbStatus get_expired_usage_ids(Timestamp now, set<int64_t> &out, string &err) override;
    DbStatus lock_expired_reservations(Timestamp now,
                                       vector<ReservationRecord> &out, string &err) override;
    DbStatus delete_reservation(int64_t id, string &err) override;
    DbStatus destroy_reservations_by_project(const string &project_id, string &err) override;

    DbStatus volume_data_for_project(const string &project_id,
                                     const string &volume_type_id,
                                     int64_t &count, int64_t &gigabytes,
                                     string &err) override;
    DbStatus snapshot_data_for_project(const string &project_id,
                                       const string &volume_type_id,
                                       int64_t &count, int64_t &gigabytes,
                                       string &err) override;
    DbStatus backup_data_for_project(const string &project_id,
                                     const string &volume_type_id,
                                     int64_t &count, int64_t &gigabytes,
                                     string &err) override;
    DbStatus group_count_for_project(const string &project_id,
                                     int64_t &count, string &err) override;
    DbStatus get_volume_types(vector<VolumeTypeRecord> &out, string &err) override;

private:
    DbStatus fail(int rc, string &err) const;
    DbStatus prepare(const string &sql, sqlite3_stmt **stmt, string &err);
    // prepare + bind + step to completion; changes gets sqlite3_changes()
    DbStatus run(const string &sql, const vector<SqlValue> &params,
                 string &err, int *changes = nullptr);
    DbStatus query_usages(const string &sql, const vector<SqlValue> &params,
                          vector<QuotaUsageRecord> &out, string &err);
    DbStatus query_reservations(const string &sql, const vector<SqlValue> &params,
                                vector<ReservationRecord> &out, string &err);
    DbStatus query_aggregate(const string &sql, const vector<SqlValue> &params,
                             int64_t &count, int64_t &sum, string &err);
    DbStatus query_limits(const string &sql, const string &key,
                          map<string, int64_t> &out, string &err);
    void require_write_tx(const char *what) const;

    string db_path_;
    string open_err_;
    sqlite3 *db_ = nullptr;
    bool write_tx_ = false;
};
