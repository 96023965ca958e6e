#pragma once
#include <map>
#include <string>
#include <vector>
#include "Db.hpp"
#include "LedgerConfig.hpp"

using namespace std;

// Recompute the true usage of one resource for a project from the domain
// tables. Side-effect free; volume_type_id is empty for all-type resources.
using SyncFunction = DbStatus (*)(Db &db, const LedgerConfig &cfg,
                                  const string &project_id,
                                  const string &volume_type_id,
                                  int64_t &usage, string &err);

// A quota-tracked resource and the sync function that heals its usage row.
struct QuotaResource {
    string name;
    string sync;              // key into the sync function registry
    string volume_type_id;    // per volume type resources only
    string volume_type_name;
};

// nullptr when there is no such sync function.
SyncFunction find_sync_function(const string &name);

// volumes, snapshots, gigabytes, backups, backup_gigabytes, groups
map<string, QuotaResource> standard_resources();

// volumes_<name>, snapshots_<name>, gigabytes_<name>
map<string, QuotaResource> volume_type_resources(const string &type_id, const string &type_name);

// Standard resources plus the per-type resources of every volume type.
DbStatus all_resources(Db &db, map<string, QuotaResource> &out, string &err);

// Run the sync function configured for resource. Throws DbProgrammingError
// when the resource names an unknown sync function.
DbStatus sync_usage(Db &db, const LedgerConfig &cfg, const QuotaResource &resource,
                    const string &project_id, int64_t &usage, string &err);
