#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "Db.hpp"
#include "DbRetry.hpp"
#include "LedgerConfig.hpp"
#include "Logger.hpp"
#include "QuotaSync.hpp"

using namespace std;

// Class whose limits apply when a project has no quota of its own.
extern const char *const kDefaultQuotaClass;

struct UsageSnapshot {
    int64_t in_use = 0;
    int64_t reserved = 0;
};

// Details of a rejected reservation, for display to the caller.
struct OverQuota {
    vector<string> overs;                  // sorted
    map<string, int64_t> quotas;
    map<string, UsageSnapshot> usages;

    string message() const;
};

struct ReserveRequest {
    string project_id;
    map<string, QuotaResource> resources;  // must cover every delta
    map<string, int64_t> quotas;           // limit per resource, -1 = unlimited
    map<string, int64_t> deltas;
    Timestamp expire;
    int64_t until_refresh = 0;             // 0 = off
    int64_t max_age = 0;                   // seconds, 0 = off
};

// Per-project usage and reservation ledger. Every call takes the connection
// to work on; the ledger itself holds no per-request state and may be
// shared by threads that each use their own Db.
class QuotaLedger {
public:
    QuotaLedger(Logger &logger, const LedgerConfig &cfg);

    // Claim deltas for req.project_id. On success reservations holds one
    // uuid per delta. OverQuota fills over; usage refreshes done on the way
    // are kept either way.
    DbStatus reserve(Db &db, const ReserveRequest &req, vector<string> &reservations,
                     OverQuota &over, string &err);

    // Apply reservations to in_use and release what they reserved. Ids that
    // no longer exist are skipped.
    DbStatus commit(Db &db, const vector<string> &reservations,
                    const string &project_id, string &err);

    // Release reservations without touching in_use.
    DbStatus rollback(Db &db, const vector<string> &reservations,
                      const string &project_id, string &err);

    // Roll back every reservation that expired before now.
    DbStatus expire(Db &db, Timestamp now, int &expired, string &err);

    // Fill a reserve request for project from the configured resources,
    // effective limits and expiry. NotFound for an unknown resource.
    DbStatus build_request(Db &db, const string &project_id,
                           const map<string, int64_t> &deltas,
                           ReserveRequest &req, string &err);

    // Usage reads
    DbStatus get_usage(Db &db, const string &project_id,
                       map<string, UsageSnapshot> &out, string &err);
    DbStatus get_usage(Db &db, const string &project_id, const string &resource,
                       QuotaUsageRecord &out, string &err);

    // Quotas
    DbStatus get_quota(Db &db, const string &project_id, const string &resource,
                       QuotaRecord &out, string &err);
    DbStatus get_quotas(Db &db, const string &project_id,
                        map<string, int64_t> &out, string &err);
    DbStatus set_quota(Db &db, const string &project_id, const string &resource,
                       int64_t limit, string &err);
    DbStatus destroy_quota(Db &db, const string &project_id, const string &resource,
                           string &err);
    // only_quotas keeps usages and reservations
    DbStatus destroy_by_project(Db &db, const string &project_id, bool only_quotas,
                                string &err);
    // Rename in quotas, quota classes and usages; renamed usages refresh on
    // their next reservation.
    DbStatus rename_resource(Db &db, const string &old_res, const string &new_res,
                             string &err);
    // project quota, else default class, else configured default
    DbStatus effective_limits(Db &db, const string &project_id,
                              const map<string, QuotaResource> &resources,
                              map<string, int64_t> &out, string &err);

    // Quota classes
    DbStatus get_quota_class(Db &db, const string &class_name, const string &resource,
                             QuotaClassRecord &out, string &err);
    DbStatus get_quota_class_limits(Db &db, const string &class_name,
                                    map<string, int64_t> &out, string &err);
    DbStatus get_default_limits(Db &db, map<string, int64_t> &out, string &err);
    DbStatus set_quota_class(Db &db, const string &class_name, const string &resource,
                             int64_t limit, string &err);
    DbStatus destroy_quota_class(Db &db, const string &class_name, const string &resource,
                                 string &err);
    DbStatus destroy_quota_classes(Db &db, const string &class_name, string &err);

    const LedgerConfig &config() const { return cfg_; }
    RetryPolicy retry_policy() const;
    void set_clock(function<Timestamp()> clock) { clock_ = move(clock); }

private:
    DbStatus reserve_once(Db &db, const ReserveRequest &req, vector<string> &reservations,
                          OverQuota &over, bool &is_over, string &err);
    DbStatus resolve_once(Db &db, const vector<string> &reservations,
                          const string &project_id, bool apply, string &err);
    DbStatus expire_once(Db &db, Timestamp now, int &expired, string &err);

    Logger &logger_;
    LedgerConfig cfg_;
    function<Timestamp()> clock_;
};
