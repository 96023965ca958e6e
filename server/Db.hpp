#pragma once
#include <string>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>
#include "../common/Utils.hpp"
#include "DbErrors.hpp"
#include "DbValue.hpp"
#include "ConditionalUpdate.hpp"

using namespace std;

struct QuotaRecord {
    int64_t id = 0;
    string project_id;
    string resource;
    int64_t hard_limit = 0;
};

struct QuotaClassRecord {
    int64_t id = 0;
    string class_name;
    string resource;
    int64_t hard_limit = 0;
};

struct QuotaUsageRecord {
    int64_t id = 0;
    string project_id;
    string resource;
    int64_t in_use = 0;
    int64_t reserved = 0;
    optional<int64_t> until_refresh;
    optional<Timestamp> updated_at;

    int64_t total() const { return in_use + reserved; }
};

struct ReservationRecord {
    int64_t id = 0;
    string uuid;
    int64_t usage_id = 0;
    string project_id;
    string resource;
    int64_t delta = 0;
    Timestamp expire;
};

struct VolumeTypeRecord {
    string id;
    string name;
};

enum class TxMode {
    Read,
    Write    // takes the write lock up front; required for locked reads
};

// Persistence for the quota ledger. Every call reports through DbStatus and
// fills err on failure. NotFound leaves err empty.
class Db {
public:
    virtual ~Db() = default;

    virtual DbStatus init_schema(string &err) = 0;

    // Transactions
    virtual DbStatus begin(TxMode mode, string &err) = 0;
    virtual DbStatus commit(string &err) = 0;
    virtual DbStatus rollback(string &err) = 0;
    virtual bool in_write_transaction() const = 0;

    // Generic entity access, checked against the entity registry
    virtual DbStatus get_by_id(const string &entity, const SqlValue &id,
                               Row &out, string &err) = 0;
    virtual DbStatus insert_row(const string &entity, const Row &row,
                                int64_t &rowid, string &err) = 0;
    // Executes in the current transaction (or autocommit). Prefer the free
    // function conditional_update(), which adds transaction and retry.
    virtual DbStatus conditional_update(const ConditionalUpdate &req,
                                        bool &updated, string &err) = 0;

    // Quotas
    virtual DbStatus get_quota(const string &project_id, const string &resource,
                               QuotaRecord &out, string &err) = 0;
    virtual DbStatus get_quotas_by_project(const string &project_id,
                                           map<string, int64_t> &out, string &err) = 0;
    virtual DbStatus create_quota(const string &project_id, const string &resource,
                                  int64_t limit, QuotaRecord &out, string &err) = 0;
    virtual DbStatus update_quota(const string &project_id, const string &resource,
                                  int64_t limit, string &err) = 0;
    virtual DbStatus rename_quota_resource(const string &old_res, const string &new_res,
                                           string &err) = 0;
    virtual DbStatus destroy_quota(const string &project_id, const string &resource,
                                   string &err) = 0;
    virtual DbStatus destroy_quotas_by_project(const string &project_id, string &err) = 0;

    // Quota classes
    virtual DbStatus get_quota_class(const string &class_name, const string &resource,
                                     QuotaClassRecord &out, string &err) = 0;
    virtual DbStatus get_quota_classes_by_name(const string &class_name,
                                               map<string, int64_t> &out, string &err) = 0;
    virtual DbStatus create_quota_class(const string &class_name, const string &resource,
                                        int64_t limit, QuotaClassRecord &out, string &err) = 0;
    virtual DbStatus update_quota_class(const string &class_name, const string &resource,
                                        int64_t limit, string &err) = 0;
    virtual DbStatus rename_quota_class_resource(const string &old_res, const string &new_res,
                                                 string &err) = 0;
    virtual DbStatus destroy_quota_class(const string &class_name, const string &resource,
                                         string &err) = 0;
    virtual DbStatus destroy_quota_classes_by_name(const string &class_name, string &err) = 0;

    // Usages. lock_* are locked reads: write transaction only, rows come
    // back in ascending id order.
    virtual DbStatus get_usage(const string &project_id, const string &resource,
                               QuotaUsageRecord &out, string &err) = 0;
    virtual DbStatus get_usages_by_project(const string &project_id,
                                           vector<QuotaUsageRecord> &out, string &err) = 0;
    // Empty resources locks every usage row of the project.
    virtual DbStatus lock_usages(const string &project_id, const set<string> &resources,
                                 map<string, QuotaUsageRecord> &out, string &err) = 0;
    virtual DbStatus lock_usages_by_ids(const set<int64_t> &ids,
                                        map<int64_t, QuotaUsageRecord> &out, string &err) = 0;
    virtual DbStatus lock_usages_by_resource(const string &resource,
                                             vector<QuotaUsageRecord> &out, string &err) = 0;
    virtual DbStatus insert_usage(QuotaUsageRecord &rec, string &err) = 0;
    // Writes resource, in_use, reserved, until_refresh and updated_at.
    virtual DbStatus save_usage(const QuotaUsageRecord &rec, string &err) = 0;
    virtual DbStatus destroy_usages_by_project(const string &project_id, string &err) = 0;

    // Reservations
    virtual DbStatus insert_reservation(ReservationRecord &rec, string &err) = 0;
    virtual DbStatus get_reservation_resources(const vector<string> &uuids,
                                               set<string> &out, string &err) = 0;
    virtual DbStatus get_reservations_by_project(const string &project_id,
                                                 vector<ReservationRecord> &out, string &err) = 0;
    virtual DbStatus lock_reservations(const vector<string> &uuids,
                                       vector<ReservationRecord> &out, string &err) = 0;
    virtual DbStatus get_expired_usage_ids(Timestamp now, set<int64_t> &out, string &err) = 0;
    virtual DbStatus lock_expired_reservations(Timestamp now,
                                               vector<ReservationRecord> &out, string &err) = 0;
    virtual DbStatus delete_reservation(int64_t id, string &err) = 0;
    virtual DbStatus destroy_reservations_by_project(const string &project_id, string &err) = 0;

    // Aggregates read by the usage sync functions. Empty volume_type_id
    // means all types.
    virtual DbStatus volume_data_for_project(const string &project_id,
                                             const string &volume_type_id,
                                             int64_t &count, int64_t &gigabytes,
                                             string &err) = 0;
    virtual DbStatus snapshot_data_for_project(const string &project_id,
                                               const string &volume_type_id,
                                               int64_t &count, int64_t &gigabytes,
                                               string &err) = 0;
    virtual DbStatus backup_data_for_project(const string &project_id,
                                             const string &volume_type_id,
                                             int64_t &count, int64_t &gigabytes,
                                             string &err) = 0;
    virtual DbStatus group_count_for_project(const string &project_id,
                                             int64_t &count, string &err) = 0;
    virtual DbStatus get_volume_types(vector<VolumeTypeRecord> &out, string &err) = 0;
};
