#include "QuotaLedger.hpp"
#include "DbTransaction.hpp"
#include <algorithm>
#include <set>

const char *const kDefaultQuotaClass = "default";

// Locking: any transaction touching both kinds of row locks quota_usages
// first and reservations second, each in ascending id order. Writes follow
// the same order. Do not reverse it in new code paths.

string OverQuota::message() const {
    vector<string> parts;
    for (const auto &res : overs) {
        string part = res;
        auto q = quotas.find(res);
        if (q != quotas.end()) part += " (limit " + to_string(q->second);
        else part += " (limit ?";
        auto u = usages.find(res);
        if (u != usages.end()) {
            part += ", in_use " + to_string(u->second.in_use) +
                    ", reserved " + to_string(u->second.reserved);
        }
        parts.push_back(part + ")");
    }
    return "Quota exceeded for resources: " + utils::join(parts, ", ");
}

QuotaLedger::QuotaLedger(Logger &logger, const LedgerConfig &cfg)
    : logger_(logger), cfg_(cfg), clock_(utils::now) {}

RetryPolicy QuotaLedger::retry_policy() const {
    RetryPolicy p;
    p.max_retries = cfg_.db_max_retries;
    p.interval_ms = cfg_.db_retry_interval_ms;
    p.max_interval_ms = cfg_.db_max_retry_interval_ms;
    return p;
}

// ===== reserve =====

DbStatus QuotaLedger::reserve(Db &db, const ReserveRequest &req, vector<string> &reservations,
                              OverQuota &over, string &err) {
    reservations.clear();
    if (req.deltas.empty()) return DbStatus::Ok;

    for (const auto &kv : req.deltas) {
        string missing;
        if (!req.resources.count(kv.first)) missing = "resource definition";
        else if (!req.quotas.count(kv.first)) missing = "quota limit";
        if (!missing.empty()) {
            string msg = "reserve: no " + missing + " for " + kv.first;
            logger_.error(req.project_id, msg);
            throw DbProgrammingError(msg);
        }
    }

    bool is_over = false;
    DbStatus st;
    try {
        // Duplicate entries come from racing usage row creation and are
        // retried like deadlocks.
        st = with_retry(retry_policy(), &logger_, "reserve for " + req.project_id, [&]() {
            err.clear();
            return reserve_once(db, req, reservations, over, is_over, err);
        }, true);
    } catch (const DbProgrammingError &e) {
        logger_.error(req.project_id, string("reserve: ") + e.what());
        throw;
    }

    if (st != DbStatus::Ok) {
        reservations.clear();
        return st;
    }
    if (is_over) {
        logger_.info(req.project_id, over.message());
        return DbStatus::OverQuota;
    }
    logger_.debug(req.project_id, "reserved " + utils::join(reservations, ","));
    return DbStatus::Ok;
}

DbStatus QuotaLedger::reserve_once(Db &db, const ReserveRequest &req,
                                   vector<string> &reservations, OverQuota &over,
                                   bool &is_over, string &err) {
    reservations.clear();
    over = OverQuota{};
    is_over = false;

    set<string> wanted;
    for (const auto &kv : req.deltas) wanted.insert(kv.first);

    DbTransaction tx(db, TxMode::Write);
    DbStatus st = tx.begin(err);
    if (st != DbStatus::Ok) return st;

    // A locked read cannot lock rows that do not exist yet. Create the
    // missing ones from a fresh sync, commit, and lock everything again:
    // another worker may have created (or an admin removed) rows meanwhile.
    map<string, QuotaUsageRecord> usages;
    while (true) {
        st = db.lock_usages(req.project_id, wanted, usages, err);
        if (st != DbStatus::Ok) return st;

        vector<string> missing;
        for (const auto &res : wanted) {
            if (!usages.count(res)) missing.push_back(res);
        }
        if (missing.empty()) break;

        for (const auto &res : missing) {
            QuotaUsageRecord rec;
            rec.project_id = req.project_id;
            rec.resource = res;
            rec.reserved = 0;
            if (req.until_refresh > 0) rec.until_refresh = req.until_refresh;

            st = sync_usage(db, cfg_, req.resources.at(res), req.project_id, rec.in_use, err);
            if (st != DbStatus::Ok) return st;
            st = db.insert_usage(rec, err);
            if (st != DbStatus::Ok) return st;

            logger_.info(req.project_id, "created usage for " + res + ", in_use " +
                                         to_string(rec.in_use));
        }

        st = tx.commit(err);
        if (st != DbStatus::Ok) return st;
        st = tx.begin(err);
        if (st != DbStatus::Ok) return st;
    }

    Timestamp now = clock_();
    set<string> dirty;

    for (const auto &kv : req.deltas) {
        const string &res = kv.first;
        QuotaUsageRecord &usage = usages[res];

        bool refresh = false;
        if (usage.in_use < 0) {
            // negative in_use means an earlier desync
            refresh = true;
        } else if (usage.until_refresh) {
            usage.until_refresh = *usage.until_refresh - 1;
            dirty.insert(res);
            if (*usage.until_refresh <= 0) refresh = true;
        } else if (req.max_age > 0 && usage.updated_at &&
                   chrono::duration_cast<chrono::seconds>(now - *usage.updated_at).count() >=
                       req.max_age) {
            refresh = true;
        }

        if (refresh) {
            int64_t in_use = 0;
            st = sync_usage(db, cfg_, req.resources.at(res), req.project_id, in_use, err);
            if (st != DbStatus::Ok) return st;

            logger_.debug(req.project_id, "refreshed usage for " + res + ": in_use " +
                                          to_string(usage.in_use) + " -> " + to_string(in_use));
            usage.in_use = in_use;
            usage.until_refresh = req.until_refresh > 0 ? optional<int64_t>(req.until_refresh)
                                                        : nullopt;
            dirty.insert(res);
        } else {
            // Only enable, disable or lower the countdown, never raise it.
            int64_t current = usage.until_refresh.value_or(0);
            if ((!usage.until_refresh && req.until_refresh > 0) || current > req.until_refresh) {
                usage.until_refresh = req.until_refresh > 0 ? optional<int64_t>(req.until_refresh)
                                                            : nullopt;
                dirty.insert(res);
            }
        }
    }

    vector<string> unders;
    vector<string> overs;
    for (const auto &kv : req.deltas) {
        const QuotaUsageRecord &usage = usages[kv.first];
        int64_t delta = kv.second;
        if (delta < 0 && delta + usage.in_use < 0) unders.push_back(kv.first);

        // Only increments are checked, so a project over its limit can
        // always shrink.
        int64_t limit = req.quotas.at(kv.first);
        if (limit >= 0 && delta >= 0 && limit < delta + usage.total()) {
            overs.push_back(kv.first);
        }
    }

    vector<ReservationRecord> created;
    if (overs.empty()) {
        for (const auto &kv : req.deltas) {
            QuotaUsageRecord &usage = usages[kv.first];

            ReservationRecord r;
            r.uuid = utils::generate_uuid();
            r.usage_id = usage.id;
            r.project_id = req.project_id;
            r.resource = kv.first;
            r.delta = kv.second;
            r.expire = req.expire;
            created.push_back(r);

            // Negative deltas leave reserved alone: a shrink that is later
            // reverted must not have freed room for someone else meanwhile.
            if (kv.second > 0) {
                usage.reserved += kv.second;
                dirty.insert(kv.first);
            }
        }
    }

    for (const auto &res : dirty) {
        QuotaUsageRecord &usage = usages[res];
        usage.updated_at = now;
        st = db.save_usage(usage, err);
        if (st != DbStatus::Ok) return st;
    }
    for (auto &r : created) {
        st = db.insert_reservation(r, err);
        if (st != DbStatus::Ok) return st;
    }

    // Over quota does not undo the refreshes above.
    st = tx.commit(err);
    if (st != DbStatus::Ok) return st;

    if (!unders.empty()) {
        logger_.warning(req.project_id,
                        "Reservation would make usage less than 0 for the following "
                        "resources, so on commit they will be limited to prevent going "
                        "below 0: " + utils::join(unders, ", "));
    }

    if (!overs.empty()) {
        sort(overs.begin(), overs.end());
        over.overs = overs;
        over.quotas = req.quotas;
        for (const auto &kv : usages) {
            over.usages[kv.first] = UsageSnapshot{kv.second.in_use, kv.second.reserved};
        }
        is_over = true;
        return DbStatus::Ok;
    }

    for (const auto &r : created) reservations.push_back(r.uuid);
    return DbStatus::Ok;
}

// ===== commit / rollback =====

DbStatus QuotaLedger::commit(Db &db, const vector<string> &reservations,
                             const string &project_id, string &err) {
    try {
        return with_retry(retry_policy(), &logger_, "commit for " + project_id, [&]() {
            err.clear();
            return resolve_once(db, reservations, project_id, true, err);
        });
    } catch (const DbProgrammingError &e) {
        logger_.error(project_id, string("commit: ") + e.what());
        throw;
    }
}

DbStatus QuotaLedger::rollback(Db &db, const vector<string> &reservations,
                               const string &project_id, string &err) {
    try {
        return with_retry(retry_policy(), &logger_, "rollback for " + project_id, [&]() {
            err.clear();
            return resolve_once(db, reservations, project_id, false, err);
        });
    } catch (const DbProgrammingError &e) {
        logger_.error(project_id, string("rollback: ") + e.what());
        throw;
    }
}

DbStatus QuotaLedger::resolve_once(Db &db, const vector<string> &reservations,
                                   const string &project_id, bool apply, string &err) {
    if (reservations.empty()) return DbStatus::Ok;

    DbTransaction tx(db, TxMode::Write);
    DbStatus st = tx.begin(err);
    if (st != DbStatus::Ok) return st;

    set<string> resources;
    st = db.get_reservation_resources(reservations, resources, err);
    if (st != DbStatus::Ok) return st;
    if (resources.empty()) {
        // all already resolved
        return tx.commit(err);
    }

    map<string, QuotaUsageRecord> usages;
    st = db.lock_usages(project_id, resources, usages, err);
    if (st != DbStatus::Ok) return st;

    map<int64_t, QuotaUsageRecord *> by_id;
    for (auto &kv : usages) by_id[kv.second.id] = &kv.second;

    vector<ReservationRecord> rows;
    st = db.lock_reservations(reservations, rows, err);
    if (st != DbStatus::Ok) return st;

    set<int64_t> touched;
    for (const auto &r : rows) {
        auto it = by_id.find(r.usage_id);
        if (it == by_id.end()) {
            string msg = "reservation " + r.uuid + " (" + r.resource + ") references usage " +
                         to_string(r.usage_id) + " which is not a usage of project " + project_id;
            logger_.error(project_id, msg);
            throw DbIntegrityError(msg);
        }
        QuotaUsageRecord &usage = *it->second;

        int64_t delta = r.delta;
        if (delta >= 0) {
            usage.reserved -= min(delta, usage.reserved);
            touched.insert(usage.id);
        } else if (apply && -delta > usage.in_use) {
            // never commit usage below zero
            delta = -usage.in_use;
        }
        if (apply) {
            usage.in_use += delta;
            touched.insert(usage.id);
        }
    }

    Timestamp now = clock_();
    for (int64_t id : touched) {
        QuotaUsageRecord &usage = *by_id[id];
        usage.updated_at = now;
        st = db.save_usage(usage, err);
        if (st != DbStatus::Ok) return st;
    }
    for (const auto &r : rows) {
        st = db.delete_reservation(r.id, err);
        if (st != DbStatus::Ok) return st;
    }

    st = tx.commit(err);
    if (st != DbStatus::Ok) return st;

    logger_.debug(project_id, string(apply ? "committed " : "rolled back ") +
                              to_string(rows.size()) + " reservation(s)");
    return DbStatus::Ok;
}

// ===== expire =====

DbStatus QuotaLedger::expire(Db &db, Timestamp now, int &expired, string &err) {
    expired = 0;
    DbStatus st;
    try {
        st = with_retry(retry_policy(), &logger_, "reservation expiry", [&]() {
            err.clear();
            return expire_once(db, now, expired, err);
        });
    } catch (const DbProgrammingError &e) {
        logger_.error("expire", e.what());
        throw;
    }
    if (st == DbStatus::Ok && expired > 0) {
        logger_.info("expire", "expired " + to_string(expired) + " reservation(s) older than " +
                               utils::format_utc(now));
    }
    return st;
}

DbStatus QuotaLedger::expire_once(Db &db, Timestamp now, int &expired, string &err) {
    expired = 0;

    DbTransaction tx(db, TxMode::Write);
    DbStatus st = tx.begin(err);
    if (st != DbStatus::Ok) return st;

    set<int64_t> usage_ids;
    st = db.get_expired_usage_ids(now, usage_ids, err);
    if (st != DbStatus::Ok) return st;
    if (usage_ids.empty()) return tx.commit(err);

    map<int64_t, QuotaUsageRecord> usages;
    st = db.lock_usages_by_ids(usage_ids, usages, err);
    if (st != DbStatus::Ok) return st;

    vector<ReservationRecord> rows;
    st = db.lock_expired_reservations(now, rows, err);
    if (st != DbStatus::Ok) return st;

    set<int64_t> touched;
    vector<int64_t> doomed;
    for (const auto &r : rows) {
        if (!usage_ids.count(r.usage_id)) {
            // appeared after the usage ids were read; next sweep gets it
            continue;
        }
        if (r.delta >= 0) {
            auto it = usages.find(r.usage_id);
            if (it == usages.end()) {
                string msg = "expired reservation " + r.uuid + " references missing usage " +
                             to_string(r.usage_id);
                logger_.error(r.project_id, msg);
                throw DbIntegrityError(msg);
            }
            it->second.reserved -= min(r.delta, it->second.reserved);
            touched.insert(r.usage_id);
        }
        doomed.push_back(r.id);
    }

    Timestamp stamp = clock_();
    for (int64_t id : touched) {
        QuotaUsageRecord &usage = usages[id];
        usage.updated_at = stamp;
        st = db.save_usage(usage, err);
        if (st != DbStatus::Ok) return st;
    }
    for (int64_t id : doomed) {
        st = db.delete_reservation(id, err);
        if (st != DbStatus::Ok) return st;
    }

    st = tx.commit(err);
    if (st != DbStatus::Ok) return st;
    expired = (int)doomed.size();
    return DbStatus::Ok;
}

// ===== requests and reads =====

DbStatus QuotaLedger::build_request(Db &db, const string &project_id,
                                    const map<string, int64_t> &deltas,
                                    ReserveRequest &req, string &err) {
    map<string, QuotaResource> resources;
    DbStatus st = all_resources(db, resources, err);
    if (st != DbStatus::Ok) return st;

    req = ReserveRequest{};
    req.project_id = project_id;
    for (const auto &kv : deltas) {
        auto it = resources.find(kv.first);
        if (it == resources.end()) {
            err = "Unknown quota resource: " + kv.first;
            return DbStatus::NotFound;
        }
        req.resources.insert(*it);
    }

    st = effective_limits(db, project_id, req.resources, req.quotas, err);
    if (st != DbStatus::Ok) return st;

    req.deltas = deltas;
    req.expire = clock_() + chrono::seconds(cfg_.reservation_expire);
    req.until_refresh = cfg_.until_refresh;
    req.max_age = cfg_.max_age;
    return DbStatus::Ok;
}

DbStatus QuotaLedger::get_usage(Db &db, const string &project_id,
                                map<string, UsageSnapshot> &out, string &err) {
    out.clear();
    vector<QuotaUsageRecord> rows;
    DbStatus st = db.get_usages_by_project(project_id, rows, err);
    if (st != DbStatus::Ok) return st;
    for (const auto &row : rows) {
        out[row.resource] = UsageSnapshot{row.in_use, row.reserved};
    }
    return DbStatus::Ok;
}

DbStatus QuotaLedger::get_usage(Db &db, const string &project_id, const string &resource,
                                QuotaUsageRecord &out, string &err) {
    return db.get_usage(project_id, resource, out, err);
}

DbStatus QuotaLedger::get_quota(Db &db, const string &project_id, const string &resource,
                                QuotaRecord &out, string &err) {
    return db.get_quota(project_id, resource, out, err);
}

DbStatus QuotaLedger::get_quotas(Db &db, const string &project_id,
                                 map<string, int64_t> &out, string &err) {
    return db.get_quotas_by_project(project_id, out, err);
}

DbStatus QuotaLedger::effective_limits(Db &db, const string &project_id,
                                       const map<string, QuotaResource> &resources,
                                       map<string, int64_t> &out, string &err) {
    out.clear();
    map<string, int64_t> project_limits, defaults;
    DbStatus st = with_transaction(db, TxMode::Read, err, [&]() {
        DbStatus s = db.get_quotas_by_project(project_id, project_limits, err);
        if (s != DbStatus::Ok) return s;
        return get_default_limits(db, defaults, err);
    });
    if (st != DbStatus::Ok) return st;

    for (const auto &kv : resources) {
        const string &res = kv.first;
        if (project_limits.count(res)) out[res] = project_limits[res];
        else if (defaults.count(res)) out[res] = defaults[res];
        else out[res] = cfg_.default_quota;
    }
    return DbStatus::Ok;
}

// ===== quota administration =====

DbStatus QuotaLedger::set_quota(Db &db, const string &project_id, const string &resource,
                                int64_t limit, string &err) {
    DbStatus st = with_retry(retry_policy(), &logger_, "set quota", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            DbStatus s = db.update_quota(project_id, resource, limit, err);
            if (s != DbStatus::NotFound) return s;
            QuotaRecord rec;
            return db.create_quota(project_id, resource, limit, rec, err);
        });
    });
    if (st == DbStatus::Ok) {
        logger_.info(project_id, "quota " + resource + " set to " + to_string(limit));
    }
    return st;
}

DbStatus QuotaLedger::destroy_quota(Db &db, const string &project_id, const string &resource,
                                    string &err) {
    return with_retry(retry_policy(), &logger_, "destroy quota", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            return db.destroy_quota(project_id, resource, err);
        });
    });
}

DbStatus QuotaLedger::destroy_by_project(Db &db, const string &project_id, bool only_quotas,
                                         string &err) {
    DbStatus st = with_retry(retry_policy(), &logger_, "destroy project quotas", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            DbStatus s = db.destroy_quotas_by_project(project_id, err);
            if (s != DbStatus::Ok || only_quotas) return s;

            map<string, QuotaUsageRecord> usages;
            s = db.lock_usages(project_id, {}, usages, err);
            if (s != DbStatus::Ok) return s;
            s = db.destroy_reservations_by_project(project_id, err);
            if (s != DbStatus::Ok) return s;
            return db.destroy_usages_by_project(project_id, err);
        });
    });
    if (st == DbStatus::Ok) {
        logger_.info(project_id, only_quotas ? "quota limits destroyed"
                                             : "quota limits, usages and reservations destroyed");
    }
    return st;
}

DbStatus QuotaLedger::rename_resource(Db &db, const string &old_res, const string &new_res,
                                      string &err) {
    DbStatus st = with_retry(retry_policy(), &logger_, "rename resource", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            DbStatus s = db.rename_quota_resource(old_res, new_res, err);
            if (s != DbStatus::Ok) return s;
            s = db.rename_quota_class_resource(old_res, new_res, err);
            if (s != DbStatus::Ok) return s;

            vector<QuotaUsageRecord> usages;
            s = db.lock_usages_by_resource(old_res, usages, err);
            if (s != DbStatus::Ok) return s;
            Timestamp now = clock_();
            for (auto &usage : usages) {
                usage.resource = new_res;
                usage.until_refresh = 1;
                usage.updated_at = now;
                s = db.save_usage(usage, err);
                if (s != DbStatus::Ok) return s;
            }
            return DbStatus::Ok;
        });
    });
    if (st == DbStatus::Ok) {
        logger_.info("quota", "resource " + old_res + " renamed to " + new_res);
    }
    return st;
}

DbStatus QuotaLedger::get_quota_class(Db &db, const string &class_name, const string &resource,
                                      QuotaClassRecord &out, string &err) {
    return db.get_quota_class(class_name, resource, out, err);
}

DbStatus QuotaLedger::get_quota_class_limits(Db &db, const string &class_name,
                                             map<string, int64_t> &out, string &err) {
    return db.get_quota_classes_by_name(class_name, out, err);
}

DbStatus QuotaLedger::get_default_limits(Db &db, map<string, int64_t> &out, string &err) {
    return db.get_quota_classes_by_name(kDefaultQuotaClass, out, err);
}

DbStatus QuotaLedger::set_quota_class(Db &db, const string &class_name, const string &resource,
                                      int64_t limit, string &err) {
    return with_retry(retry_policy(), &logger_, "set quota class", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            DbStatus s = db.update_quota_class(class_name, resource, limit, err);
            if (s != DbStatus::NotFound) return s;
            QuotaClassRecord rec;
            return db.create_quota_class(class_name, resource, limit, rec, err);
        });
    });
}

DbStatus QuotaLedger::destroy_quota_class(Db &db, const string &class_name,
                                          const string &resource, string &err) {
    return with_retry(retry_policy(), &logger_, "destroy quota class", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            return db.destroy_quota_class(class_name, resource, err);
        });
    });
}

DbStatus QuotaLedger::destroy_quota_classes(Db &db, const string &class_name, string &err) {
    return with_retry(retry_policy(), &logger_, "destroy quota classes", [&]() {
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            return db.destroy_quota_classes_by_name(class_name, err);
        });
    });
}
