#include "QuotaSync.hpp"

namespace {

DbStatus sync_volumes(Db &db, const LedgerConfig &, const string &project_id,
                      const string &volume_type_id, int64_t &usage, string &err) {
    int64_t gigabytes = 0;
    return db.volume_data_for_project(project_id, volume_type_id, usage, gigabytes, err);
}

DbStatus sync_snapshots(Db &db, const LedgerConfig &, const string &project_id,
                        const string &volume_type_id, int64_t &usage, string &err) {
    int64_t gigabytes = 0;
    return db.snapshot_data_for_project(project_id, volume_type_id, usage, gigabytes, err);
}

DbStatus sync_backups(Db &db, const LedgerConfig &, const string &project_id,
                      const string &volume_type_id, int64_t &usage, string &err) {
    int64_t gigabytes = 0;
    return db.backup_data_for_project(project_id, volume_type_id, usage, gigabytes, err);
}

DbStatus sync_gigabytes(Db &db, const LedgerConfig &cfg, const string &project_id,
                        const string &volume_type_id, int64_t &usage, string &err) {
    int64_t count = 0, vol_gigs = 0;
    DbStatus st = db.volume_data_for_project(project_id, volume_type_id, count, vol_gigs, err);
    if (st != DbStatus::Ok) return st;

    if (cfg.no_snapshot_gb_quota) {
        usage = vol_gigs;
        return DbStatus::Ok;
    }

    int64_t snap_gigs = 0;
    st = db.snapshot_data_for_project(project_id, volume_type_id, count, snap_gigs, err);
    if (st != DbStatus::Ok) return st;
    usage = vol_gigs + snap_gigs;
    return DbStatus::Ok;
}

DbStatus sync_backup_gigabytes(Db &db, const LedgerConfig &, const string &project_id,
                               const string &volume_type_id, int64_t &usage, string &err) {
    int64_t count = 0;
    return db.backup_data_for_project(project_id, volume_type_id, count, usage, err);
}

DbStatus sync_groups(Db &db, const LedgerConfig &, const string &project_id,
                     const string &, int64_t &usage, string &err) {
    return db.group_count_for_project(project_id, usage, err);
}

struct SyncEntry {
    const char *name;
    SyncFunction fn;
};

const SyncEntry kSyncFunctions[] = {
    {"sync_volumes", sync_volumes},
    {"sync_snapshots", sync_snapshots},
    {"sync_gigabytes", sync_gigabytes},
    {"sync_backups", sync_backups},
    {"sync_backup_gigabytes", sync_backup_gigabytes},
    {"sync_groups", sync_groups},
};

} // namespace

SyncFunction find_sync_function(const string &name) {
    for (const auto &entry : kSyncFunctions) {
        if (name == entry.name) return entry.fn;
    }
    return nullptr;
}

map<string, QuotaResource> standard_resources() {
    map<string, QuotaResource> out;
    auto add = [&out](const string &name, const string &sync) {
        out[name] = QuotaResource{name, sync, "", ""};
    };
    add("volumes", "sync_volumes");
    add("snapshots", "sync_snapshots");
    add("gigabytes", "sync_gigabytes");
    add("backups", "sync_backups");
    add("backup_gigabytes", "sync_backup_gigabytes");
    add("groups", "sync_groups");
    return out;
}

map<string, QuotaResource> volume_type_resources(const string &type_id, const string &type_name) {
    map<string, QuotaResource> out;
    for (const char *base : {"volumes", "snapshots", "gigabytes"}) {
        string name = string(base) + "_" + type_name;
        out[name] = QuotaResource{name, string("sync_") + base, type_id, type_name};
    }
    return out;
}

DbStatus all_resources(Db &db, map<string, QuotaResource> &out, string &err) {
    out = standard_resources();

    vector<VolumeTypeRecord> types;
    DbStatus st = db.get_volume_types(types, err);
    if (st != DbStatus::Ok) return st;

    for (const auto &t : types) {
        for (auto &kv : volume_type_resources(t.id, t.name)) {
            out.insert(kv);
        }
    }
    return DbStatus::Ok;
}

DbStatus sync_usage(Db &db, const LedgerConfig &cfg, const QuotaResource &resource,
                    const string &project_id, int64_t &usage, string &err) {
    SyncFunction fn = find_sync_function(resource.sync);
    if (!fn) {
        throw DbProgrammingError("resource " + resource.name + " has unknown sync function '" +
                                 resource.sync + "'");
    }
    usage = 0;
    return fn(db, cfg, project_id, resource.volume_type_id, usage, err);
}
