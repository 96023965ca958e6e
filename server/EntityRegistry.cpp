#include "EntityRegistry.hpp"
#include <algorithm>

namespace {
const vector<EntityInfo> kEntities = {
    {"volume_types", "volume_types", "id",
     {"id", "name", "deleted"}},
    {"volumes", "volumes", "id",
     {"id", "project_id", "volume_type_id", "host", "size", "status",
      "previous_status", "use_quota", "deleted", "created_at", "updated_at"}},
    {"snapshots", "snapshots", "id",
     {"id", "project_id", "volume_id", "volume_size", "status", "use_quota",
      "deleted", "created_at", "updated_at"}},
    {"backups", "backups", "id",
     {"id", "project_id", "volume_id", "volume_type_id", "size", "status",
      "deleted", "created_at", "updated_at"}},
    {"groups", "volume_groups", "id",
     {"id", "project_id", "status", "deleted", "created_at", "updated_at"}},
    {"quotas", "quotas", "id",
     {"id", "project_id", "resource", "hard_limit", "created_at", "updated_at"}},
    {"quota_classes", "quota_classes", "id",
     {"id", "class_name", "resource", "hard_limit", "created_at", "updated_at"}},
    {"quota_usages", "quota_usages", "id",
     {"id", "project_id", "resource", "in_use", "reserved", "until_refresh",
      "created_at", "updated_at"}},
    {"reservations", "reservations", "id",
     {"id", "uuid", "usage_id", "project_id", "resource", "delta", "expire",
      "created_at"}},
};
} // namespace

const EntityInfo *find_entity(const string &name) {
    for (const auto &e : kEntities) {
        if (name == e.name) return &e;
    }
    return nullptr;
}

bool entity_has_column(const EntityInfo &info, const string &column) {
    return find(info.columns.begin(), info.columns.end(), column) != info.columns.end();
}
