#include "DbSqlite.hpp"
#include "EntityRegistry.hpp"

namespace {
const char *kUsageColumns =
    "id, project_id, resource, in_use, reserved, until_refresh, updated_at";
const char *kReservationColumns =
    "id, uuid, usage_id, project_id, resource, delta, expire";

void bind_value(sqlite3_stmt *stmt, int idx, const SqlValue &v) {
    if (is_null(v)) {
        sqlite3_bind_null(stmt, idx);
    } else if (auto i = get_if<int64_t>(&v)) {
        sqlite3_bind_int64(stmt, idx, (sqlite3_int64)*i);
    } else if (auto d = get_if<double>(&v)) {
        sqlite3_bind_double(stmt, idx, *d);
    } else {
        sqlite3_bind_text(stmt, idx, get<string>(v).c_str(), -1, SQLITE_TRANSIENT);
    }
}

void bind_all(sqlite3_stmt *stmt, const vector<SqlValue> &params) {
    for (size_t i = 0; i < params.size(); ++i) {
        bind_value(stmt, (int)i + 1, params[i]);
    }
}

SqlValue column_value(sqlite3_stmt *stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
        return sql_int((int64_t)sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
        return SqlValue{sqlite3_column_double(stmt, col)};
    case SQLITE_NULL:
        return sql_null();
    default: {
        const unsigned char *t = sqlite3_column_text(stmt, col);
        return sql_text(t ? reinterpret_cast<const char*>(t) : "");
    }
    }
}

string column_string(sqlite3_stmt *stmt, int col) {
    const unsigned char *t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

string placeholders(size_t n) {
    string out;
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        out += "?";
    }
    return out;
}

SqlValue optional_int(const optional<int64_t> &v) {
    return v ? sql_int(*v) : sql_null();
}

SqlValue optional_time(const optional<Timestamp> &t) {
    return t ? sql_text(utils::format_utc(*t)) : sql_null();
}
} // namespace

DbSqlite::DbSqlite(const string &db_path, int busy_timeout_ms) : db_path_(db_path) {
    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        open_err_ = string("Cannot open SQLite database ") + db_path_ + ": " +
                    (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    char *errmsg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA foreign_keys = ON; PRAGMA journal_mode = WAL;",
                      nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        open_err_ = errmsg ? errmsg : "Cannot configure SQLite connection";
    }
    if (errmsg) sqlite3_free(errmsg);
}

DbSqlite::~DbSqlite() {
    if (db_) sqlite3_close(db_);
}

DbStatus DbSqlite::fail(int rc, string &err) const {
    err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) return DbStatus::Deadlock;
    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return DbStatus::Duplicate;
    }
    return DbStatus::Error;
}

DbStatus DbSqlite::prepare(const string &sql, sqlite3_stmt **stmt, string &err) {
    if (!db_) {
        err = open_err_.empty() ? "Database is not open" : open_err_;
        return DbStatus::Error;
    }
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr);
    if (rc != SQLITE_OK) {
        DbStatus st = fail(rc, err);
        sqlite3_finalize(*stmt);
        *stmt = nullptr;
        return st;
    }
    return DbStatus::Ok;
}

DbStatus DbSqlite::run(const string &sql, const vector<SqlValue> &params,
                       string &err, int *changes) {
    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    bind_all(stmt, params);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    if (changes) *changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

void DbSqlite::require_write_tx(const char *what) const {
    if (!in_write_transaction()) {
        throw DbProgrammingError(string(what) + " is a locked read and needs a write transaction");
    }
}

DbStatus DbSqlite::init_schema(string &err) {
    if (!db_) {
        err = open_err_;
        return DbStatus::Error;
    }

    const char *sql_tables = R"SQL(
CREATE TABLE IF NOT EXISTS volume_types (
    id       TEXT PRIMARY KEY,
    name     TEXT NOT NULL,
    deleted  INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS volumes (
    id              TEXT PRIMARY KEY,
    project_id      TEXT NOT NULL,
    volume_type_id  TEXT,
    host            TEXT,
    size            INTEGER NOT NULL DEFAULT 0,
    status          TEXT,
    previous_status TEXT,
    use_quota       INTEGER NOT NULL DEFAULT 1,
    deleted         INTEGER NOT NULL DEFAULT 0,
    created_at      DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at      DATETIME
);

CREATE TABLE IF NOT EXISTS snapshots (
    id           TEXT PRIMARY KEY,
    project_id   TEXT NOT NULL,
    volume_id    TEXT NOT NULL,
    volume_size  INTEGER NOT NULL DEFAULT 0,
    status       TEXT,
    use_quota    INTEGER NOT NULL DEFAULT 1,
    deleted      INTEGER NOT NULL DEFAULT 0,
    created_at   DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at   DATETIME,
    FOREIGN KEY(volume_id) REFERENCES volumes(id)
);

CREATE TABLE IF NOT EXISTS backups (
    id              TEXT PRIMARY KEY,
    project_id      TEXT NOT NULL,
    volume_id       TEXT,
    volume_type_id  TEXT,
    size            INTEGER NOT NULL DEFAULT 0,
    status          TEXT,
    deleted         INTEGER NOT NULL DEFAULT 0,
    created_at      DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at      DATETIME
);

CREATE TABLE IF NOT EXISTS volume_groups (
    id          TEXT PRIMARY KEY,
    project_id  TEXT NOT NULL,
    status      TEXT,
    deleted     INTEGER NOT NULL DEFAULT 0,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at  DATETIME
);

CREATE TABLE IF NOT EXISTS quotas (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    project_id  TEXT NOT NULL,
    resource    TEXT NOT NULL,
    hard_limit  INTEGER,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at  DATETIME,
    UNIQUE(project_id, resource)
);

CREATE TABLE IF NOT EXISTS quota_classes (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    class_name  TEXT NOT NULL,
    resource    TEXT NOT NULL,
    hard_limit  INTEGER,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at  DATETIME,
    UNIQUE(class_name, resource)
);

CREATE TABLE IF NOT EXISTS quota_usages (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    project_id     TEXT NOT NULL,
    resource       TEXT NOT NULL,
    in_use         INTEGER NOT NULL,
    reserved       INTEGER NOT NULL,
    until_refresh  INTEGER,
    created_at     DATETIME DEFAULT CURRENT_TIMESTAMP,
    updated_at     DATETIME,
    UNIQUE(project_id, resource)
);

CREATE TABLE IF NOT EXISTS reservations (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    uuid        TEXT NOT NULL UNIQUE,
    usage_id    INTEGER NOT NULL,
    project_id  TEXT NOT NULL,
    resource    TEXT NOT NULL,
    delta       INTEGER NOT NULL,
    expire      DATETIME NOT NULL,
    created_at  DATETIME DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY(usage_id) REFERENCES quota_usages(id)
);

CREATE INDEX IF NOT EXISTS idx_volumes_project ON volumes(project_id);
CREATE INDEX IF NOT EXISTS idx_snapshots_project ON snapshots(project_id);
CREATE INDEX IF NOT EXISTS idx_backups_project ON backups(project_id);
CREATE INDEX IF NOT EXISTS idx_volume_groups_project ON volume_groups(project_id);
CREATE INDEX IF NOT EXISTS idx_reservations_expire ON reservations(expire);
CREATE INDEX IF NOT EXISTS idx_reservations_project ON reservations(project_id);
)SQL";

    char *errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql_tables, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        DbStatus st = fail(rc, err);
        if (errmsg) {
            err = errmsg;
            sqlite3_free(errmsg);
        }
        return st;
    }
    return DbStatus::Ok;
}

// ===== Transactions =====

DbStatus DbSqlite::begin(TxMode mode, string &err) {
    if (db_ && !sqlite3_get_autocommit(db_)) {
        throw DbProgrammingError("transaction already open on " + db_path_);
    }
    // IMMEDIATE takes the write lock now, so every read inside is a locked read.
    DbStatus st = run(mode == TxMode::Write ? "BEGIN IMMEDIATE;" : "BEGIN;", {}, err);
    if (st == DbStatus::Ok) write_tx_ = (mode == TxMode::Write);
    return st;
}

DbStatus DbSqlite::commit(string &err) {
    DbStatus st = run("COMMIT;", {}, err);
    if (st == DbStatus::Ok) write_tx_ = false;
    return st;
}

DbStatus DbSqlite::rollback(string &err) {
    write_tx_ = false;
    if (!db_ || sqlite3_get_autocommit(db_)) return DbStatus::Ok;
    return run("ROLLBACK;", {}, err);
}

bool DbSqlite::in_write_transaction() const {
    return db_ && write_tx_ && !sqlite3_get_autocommit(db_);
}

// ===== Generic entity access =====

DbStatus DbSqlite::get_by_id(const string &entity, const SqlValue &id,
                             Row &out, string &err) {
    const EntityInfo *info = find_entity(entity);
    if (!info) throw DbProgrammingError("Unknown entity '" + entity + "'");

    string sql = "SELECT " + utils::join(info->columns, ", ") + " FROM " + info->table +
                 " WHERE " + info->id_column + " = ?;";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    bind_value(stmt, 1, id);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out.clear();
        for (size_t i = 0; i < info->columns.size(); ++i) {
            out[info->columns[i]] = column_value(stmt, (int)i);
        }
        sqlite3_finalize(stmt);
        return DbStatus::Ok;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return DbStatus::NotFound;
    }
    st = fail(rc, err);
    sqlite3_finalize(stmt);
    return st;
}

DbStatus DbSqlite::insert_row(const string &entity, const Row &row,
                              int64_t &rowid, string &err) {
    const EntityInfo *info = find_entity(entity);
    if (!info) throw DbProgrammingError("Unknown entity '" + entity + "'");
    if (row.empty()) throw DbProgrammingError("Empty row for " + entity);

    vector<string> cols;
    vector<SqlValue> params;
    for (const auto &kv : row) {
        if (!entity_has_column(*info, kv.first)) {
            throw DbProgrammingError("Unknown field '" + kv.first + "' for " + entity);
        }
        cols.push_back(kv.first);
        params.push_back(kv.second);
    }

    string sql = string("INSERT INTO ") + info->table + " (" + utils::join(cols, ", ") +
                 ") VALUES (" + placeholders(cols.size()) + ");";
    DbStatus st = run(sql, params, err);
    if (st != DbStatus::Ok) return st;
    rowid = (int64_t)sqlite3_last_insert_rowid(db_);
    return DbStatus::Ok;
}

DbStatus DbSqlite::conditional_update(const ConditionalUpdate &req,
                                      bool &updated, string &err) {
    SqlStatement stmt = build_conditional_update(req);
    int changes = 0;
    DbStatus st = run(stmt.sql, stmt.params, err, &changes);
    if (st != DbStatus::Ok) return st;
    updated = changes > 0;
    return DbStatus::Ok;
}

// ===== Quotas =====

DbStatus DbSqlite::get_quota(const string &project_id, const string &resource,
                             QuotaRecord &out, string &err) {
    const char *sql =
        "SELECT id, project_id, resource, hard_limit FROM quotas "
        "WHERE project_id = ? AND resource = ?;";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    sqlite3_bind_text(stmt, 1, project_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, resource.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out.id         = sqlite3_column_int64(stmt, 0);
        out.project_id = column_string(stmt, 1);
        out.resource   = column_string(stmt, 2);
        out.hard_limit = sqlite3_column_int64(stmt, 3);
        sqlite3_finalize(stmt);
        return DbStatus::Ok;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return DbStatus::NotFound;
    }
    st = fail(rc, err);
    sqlite3_finalize(stmt);
    return st;
}

DbStatus DbSqlite::query_limits(const string &sql, const string &key,
                                map<string, int64_t> &out, string &err) {
    out.clear();

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out[column_string(stmt, 0)] = sqlite3_column_int64(stmt, 1);
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::get_quotas_by_project(const string &project_id,
                                         map<string, int64_t> &out, string &err) {
    return query_limits("SELECT resource, hard_limit FROM quotas WHERE project_id = ?;",
                        project_id, out, err);
}

DbStatus DbSqlite::create_quota(const string &project_id, const string &resource,
                                int64_t limit, QuotaRecord &out, string &err) {
    DbStatus st = run("INSERT INTO quotas (project_id, resource, hard_limit) VALUES (?, ?, ?);",
                      {sql_text(project_id), sql_text(resource), sql_int(limit)}, err);
    if (st != DbStatus::Ok) return st;

    out.id = (int64_t)sqlite3_last_insert_rowid(db_);
    out.project_id = project_id;
    out.resource = resource;
    out.hard_limit = limit;
    return DbStatus::Ok;
}

DbStatus DbSqlite::update_quota(const string &project_id, const string &resource,
                                int64_t limit, string &err) {
    int changes = 0;
    DbStatus st = run("UPDATE quotas SET hard_limit = ?, updated_at = CURRENT_TIMESTAMP "
                      "WHERE project_id = ? AND resource = ?;",
                      {sql_int(limit), sql_text(project_id), sql_text(resource)}, err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::rename_quota_resource(const string &old_res, const string &new_res,
                                         string &err) {
    return run("UPDATE quotas SET resource = ?, updated_at = CURRENT_TIMESTAMP "
               "WHERE resource = ?;",
               {sql_text(new_res), sql_text(old_res)}, err);
}

DbStatus DbSqlite::destroy_quota(const string &project_id, const string &resource,
                                 string &err) {
    int changes = 0;
    DbStatus st = run("DELETE FROM quotas WHERE project_id = ? AND resource = ?;",
                      {sql_text(project_id), sql_text(resource)}, err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::destroy_quotas_by_project(const string &project_id, string &err) {
    return run("DELETE FROM quotas WHERE project_id = ?;", {sql_text(project_id)}, err);
}

// ===== Quota classes =====

DbStatus DbSqlite::get_quota_class(const string &class_name, const string &resource,
                                   QuotaClassRecord &out, string &err) {
    const char *sql =
        "SELECT id, class_name, resource, hard_limit FROM quota_classes "
        "WHERE class_name = ? AND resource = ?;";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    sqlite3_bind_text(stmt, 1, class_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, resource.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out.id         = sqlite3_column_int64(stmt, 0);
        out.class_name = column_string(stmt, 1);
        out.resource   = column_string(stmt, 2);
        out.hard_limit = sqlite3_column_int64(stmt, 3);
        sqlite3_finalize(stmt);
        return DbStatus::Ok;
    } else if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return DbStatus::NotFound;
    }
    st = fail(rc, err);
    sqlite3_finalize(stmt);
    return st;
}

DbStatus DbSqlite::get_quota_classes_by_name(const string &class_name,
                                             map<string, int64_t> &out, string &err) {
    return query_limits("SELECT resource, hard_limit FROM quota_classes WHERE class_name = ?;",
                        class_name, out, err);
}

DbStatus DbSqlite::create_quota_class(const string &class_name, const string &resource,
                                      int64_t limit, QuotaClassRecord &out, string &err) {
    DbStatus st = run("INSERT INTO quota_classes (class_name, resource, hard_limit) "
                      "VALUES (?, ?, ?);",
                      {sql_text(class_name), sql_text(resource), sql_int(limit)}, err);
    if (st != DbStatus::Ok) return st;

    out.id = (int64_t)sqlite3_last_insert_rowid(db_);
    out.class_name = class_name;
    out.resource = resource;
    out.hard_limit = limit;
    return DbStatus::Ok;
}

DbStatus DbSqlite::update_quota_class(const string &class_name, const string &resource,
                                      int64_t limit, string &err) {
    int changes = 0;
    DbStatus st = run("UPDATE quota_classes SET hard_limit = ?, updated_at = CURRENT_TIMESTAMP "
                      "WHERE class_name = ? AND resource = ?;",
                      {sql_int(limit), sql_text(class_name), sql_text(resource)}, err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::rename_quota_class_resource(const string &old_res, const string &new_res,
                                               string &err) {
    return run("UPDATE quota_classes SET resource = ?, updated_at = CURRENT_TIMESTAMP "
               "WHERE resource = ?;",
               {sql_text(new_res), sql_text(old_res)}, err);
}

DbStatus DbSqlite::destroy_quota_class(const string &class_name, const string &resource,
                                       string &err) {
    int changes = 0;
    DbStatus st = run("DELETE FROM quota_classes WHERE class_name = ? AND resource = ?;",
                      {sql_text(class_name), sql_text(resource)}, err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::destroy_quota_classes_by_name(const string &class_name, string &err) {
    return run("DELETE FROM quota_classes WHERE class_name = ?;", {sql_text(class_name)}, err);
}

// ===== Usages =====

DbStatus DbSqlite::query_usages(const string &sql, const vector<SqlValue> &params,
                                vector<QuotaUsageRecord> &out, string &err) {
    out.clear();

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    bind_all(stmt, params);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        QuotaUsageRecord rec;
        rec.id         = sqlite3_column_int64(stmt, 0);
        rec.project_id = column_string(stmt, 1);
        rec.resource   = column_string(stmt, 2);
        rec.in_use     = sqlite3_column_int64(stmt, 3);
        rec.reserved   = sqlite3_column_int64(stmt, 4);
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            rec.until_refresh = sqlite3_column_int64(stmt, 5);
        }
        if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
            Timestamp t;
            if (!utils::parse_utc(column_string(stmt, 6), t)) {
                err = "Malformed updated_at on quota_usages row " + to_string(rec.id);
                sqlite3_finalize(stmt);
                return DbStatus::Error;
            }
            rec.updated_at = t;
        }
        out.push_back(rec);
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::get_usage(const string &project_id, const string &resource,
                             QuotaUsageRecord &out, string &err) {
    vector<QuotaUsageRecord> rows;
    DbStatus st = query_usages(string("SELECT ") + kUsageColumns + " FROM quota_usages "
                               "WHERE project_id = ? AND resource = ?;",
                               {sql_text(project_id), sql_text(resource)}, rows, err);
    if (st != DbStatus::Ok) return st;
    if (rows.empty()) return DbStatus::NotFound;
    out = rows.front();
    return DbStatus::Ok;
}

DbStatus DbSqlite::get_usages_by_project(const string &project_id,
                                         vector<QuotaUsageRecord> &out, string &err) {
    return query_usages(string("SELECT ") + kUsageColumns + " FROM quota_usages "
                        "WHERE project_id = ? ORDER BY id ASC;",
                        {sql_text(project_id)}, out, err);
}

DbStatus DbSqlite::lock_usages(const string &project_id, const set<string> &resources,
                               map<string, QuotaUsageRecord> &out, string &err) {
    require_write_tx("lock_usages");
    out.clear();

    string sql = string("SELECT ") + kUsageColumns + " FROM quota_usages WHERE project_id = ?";
    vector<SqlValue> params = {sql_text(project_id)};
    if (!resources.empty()) {
        sql += " AND resource IN (" + placeholders(resources.size()) + ")";
        for (const auto &r : resources) params.push_back(sql_text(r));
    }
    sql += " ORDER BY id ASC;";

    vector<QuotaUsageRecord> rows;
    DbStatus st = query_usages(sql, params, rows, err);
    if (st != DbStatus::Ok) return st;
    for (auto &row : rows) out[row.resource] = row;
    return DbStatus::Ok;
}

DbStatus DbSqlite::lock_usages_by_ids(const set<int64_t> &ids,
                                      map<int64_t, QuotaUsageRecord> &out, string &err) {
    require_write_tx("lock_usages_by_ids");
    out.clear();
    if (ids.empty()) return DbStatus::Ok;

    vector<SqlValue> params;
    for (int64_t id : ids) params.push_back(sql_int(id));

    vector<QuotaUsageRecord> rows;
    DbStatus st = query_usages(string("SELECT ") + kUsageColumns + " FROM quota_usages "
                               "WHERE id IN (" + placeholders(ids.size()) + ") ORDER BY id ASC;",
                               params, rows, err);
    if (st != DbStatus::Ok) return st;
    for (auto &row : rows) out[row.id] = row;
    return DbStatus::Ok;
}

DbStatus DbSqlite::lock_usages_by_resource(const string &resource,
                                           vector<QuotaUsageRecord> &out, string &err) {
    require_write_tx("lock_usages_by_resource");
    return query_usages(string("SELECT ") + kUsageColumns + " FROM quota_usages "
                        "WHERE resource = ? ORDER BY id ASC;",
                        {sql_text(resource)}, out, err);
}

DbStatus DbSqlite::insert_usage(QuotaUsageRecord &rec, string &err) {
    DbStatus st = run("INSERT INTO quota_usages "
                      "(project_id, resource, in_use, reserved, until_refresh, updated_at) "
                      "VALUES (?, ?, ?, ?, ?, ?);",
                      {sql_text(rec.project_id), sql_text(rec.resource), sql_int(rec.in_use),
                       sql_int(rec.reserved), optional_int(rec.until_refresh),
                       optional_time(rec.updated_at)},
                      err);
    if (st != DbStatus::Ok) return st;
    rec.id = (int64_t)sqlite3_last_insert_rowid(db_);
    return DbStatus::Ok;
}

DbStatus DbSqlite::save_usage(const QuotaUsageRecord &rec, string &err) {
    int changes = 0;
    DbStatus st = run("UPDATE quota_usages SET resource = ?, in_use = ?, reserved = ?, "
                      "until_refresh = ?, updated_at = ? WHERE id = ?;",
                      {sql_text(rec.resource), sql_int(rec.in_use), sql_int(rec.reserved),
                       optional_int(rec.until_refresh), optional_time(rec.updated_at),
                       sql_int(rec.id)},
                      err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::destroy_usages_by_project(const string &project_id, string &err) {
    return run("DELETE FROM quota_usages WHERE project_id = ?;", {sql_text(project_id)}, err);
}

// ===== Reservations =====

DbStatus DbSqlite::query_reservations(const string &sql, const vector<SqlValue> &params,
                                      vector<ReservationRecord> &out, string &err) {
    out.clear();

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    bind_all(stmt, params);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ReservationRecord rec;
        rec.id         = sqlite3_column_int64(stmt, 0);
        rec.uuid       = column_string(stmt, 1);
        rec.usage_id   = sqlite3_column_int64(stmt, 2);
        rec.project_id = column_string(stmt, 3);
        rec.resource   = column_string(stmt, 4);
        rec.delta      = sqlite3_column_int64(stmt, 5);
        if (!utils::parse_utc(column_string(stmt, 6), rec.expire)) {
            err = "Malformed expire on reservation " + rec.uuid;
            sqlite3_finalize(stmt);
            return DbStatus::Error;
        }
        out.push_back(rec);
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::insert_reservation(ReservationRecord &rec, string &err) {
    DbStatus st = run("INSERT INTO reservations "
                      "(uuid, usage_id, project_id, resource, delta, expire) "
                      "VALUES (?, ?, ?, ?, ?, ?);",
                      {sql_text(rec.uuid), sql_int(rec.usage_id), sql_text(rec.project_id),
                       sql_text(rec.resource), sql_int(rec.delta),
                       sql_text(utils::format_utc(rec.expire))},
                      err);
    if (st != DbStatus::Ok) return st;
    rec.id = (int64_t)sqlite3_last_insert_rowid(db_);
    return DbStatus::Ok;
}

DbStatus DbSqlite::get_reservation_resources(const vector<string> &uuids,
                                             set<string> &out, string &err) {
    out.clear();
    if (uuids.empty()) return DbStatus::Ok;

    string sql = "SELECT DISTINCT resource FROM reservations WHERE uuid IN (" +
                 placeholders(uuids.size()) + ");";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    for (size_t i = 0; i < uuids.size(); ++i) {
        sqlite3_bind_text(stmt, (int)i + 1, uuids[i].c_str(), -1, SQLITE_TRANSIENT);
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.insert(column_string(stmt, 0));
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::get_reservations_by_project(const string &project_id,
                                               vector<ReservationRecord> &out, string &err) {
    return query_reservations(string("SELECT ") + kReservationColumns + " FROM reservations "
                              "WHERE project_id = ? ORDER BY id ASC;",
                              {sql_text(project_id)}, out, err);
}

DbStatus DbSqlite::lock_reservations(const vector<string> &uuids,
                                     vector<ReservationRecord> &out, string &err) {
    require_write_tx("lock_reservations");
    out.clear();
    if (uuids.empty()) return DbStatus::Ok;

    vector<SqlValue> params;
    for (const auto &u : uuids) params.push_back(sql_text(u));
    return query_reservations(string("SELECT ") + kReservationColumns + " FROM reservations "
                              "WHERE uuid IN (" + placeholders(uuids.size()) + ") ORDER BY id ASC;",
                              params, out, err);
}

DbStatus DbSqlite::get_expired_usage_ids(Timestamp now, set<int64_t> &out, string &err) {
    out.clear();

    const char *sql = "SELECT DISTINCT usage_id FROM reservations WHERE expire < ?;";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    string now_text = utils::format_utc(now);
    sqlite3_bind_text(stmt, 1, now_text.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.insert(sqlite3_column_int64(stmt, 0));
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::lock_expired_reservations(Timestamp now,
                                             vector<ReservationRecord> &out, string &err) {
    require_write_tx("lock_expired_reservations");
    return query_reservations(string("SELECT ") + kReservationColumns + " FROM reservations "
                              "WHERE expire < ? ORDER BY id ASC;",
                              {sql_text(utils::format_utc(now))}, out, err);
}

DbStatus DbSqlite::delete_reservation(int64_t id, string &err) {
    int changes = 0;
    DbStatus st = run("DELETE FROM reservations WHERE id = ?;", {sql_int(id)}, err, &changes);
    if (st != DbStatus::Ok) return st;
    return changes > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

DbStatus DbSqlite::destroy_reservations_by_project(const string &project_id, string &err) {
    return run("DELETE FROM reservations WHERE project_id = ?;", {sql_text(project_id)}, err);
}

// ===== Aggregates for usage sync =====

DbStatus DbSqlite::query_aggregate(const string &sql, const vector<SqlValue> &params,
                                   int64_t &count, int64_t &sum, string &err) {
    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    bind_all(stmt, params);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    // SUM() over no rows is NULL; column_int64 reads that as 0
    count = sqlite3_column_int64(stmt, 0);
    sum   = sqlite3_column_int64(stmt, 1);
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}

DbStatus DbSqlite::volume_data_for_project(const string &project_id,
                                           const string &volume_type_id,
                                           int64_t &count, int64_t &gigabytes,
                                           string &err) {
    string sql = "SELECT COUNT(id), SUM(size) FROM volumes "
                 "WHERE project_id = ? AND deleted = 0 AND use_quota = 1";
    vector<SqlValue> params = {sql_text(project_id)};
    if (!volume_type_id.empty()) {
        sql += " AND volume_type_id = ?";
        params.push_back(sql_text(volume_type_id));
    }
    return query_aggregate(sql + ";", params, count, gigabytes, err);
}

DbStatus DbSqlite::snapshot_data_for_project(const string &project_id,
                                             const string &volume_type_id,
                                             int64_t &count, int64_t &gigabytes,
                                             string &err) {
    string sql = "SELECT COUNT(s.id), SUM(s.volume_size) FROM snapshots s";
    vector<SqlValue> params;
    if (!volume_type_id.empty()) {
        sql += " JOIN volumes v ON v.id = s.volume_id AND v.volume_type_id = ?";
        params.push_back(sql_text(volume_type_id));
    }
    sql += " WHERE s.project_id = ? AND s.deleted = 0 AND s.use_quota = 1;";
    params.push_back(sql_text(project_id));
    return query_aggregate(sql, params, count, gigabytes, err);
}

DbStatus DbSqlite::backup_data_for_project(const string &project_id,
                                           const string &volume_type_id,
                                           int64_t &count, int64_t &gigabytes,
                                           string &err) {
    string sql = "SELECT COUNT(id), SUM(size) FROM backups WHERE project_id = ? AND deleted = 0";
    vector<SqlValue> params = {sql_text(project_id)};
    if (!volume_type_id.empty()) {
        sql += " AND volume_type_id = ?";
        params.push_back(sql_text(volume_type_id));
    }
    return query_aggregate(sql + ";", params, count, gigabytes, err);
}

DbStatus DbSqlite::group_count_for_project(const string &project_id,
                                           int64_t &count, string &err) {
    int64_t unused = 0;
    return query_aggregate("SELECT COUNT(id), 0 FROM volume_groups "
                           "WHERE project_id = ? AND deleted = 0;",
                           {sql_text(project_id)}, count, unused, err);
}

DbStatus DbSqlite::get_volume_types(vector<VolumeTypeRecord> &out, string &err) {
    out.clear();

    const char *sql = "SELECT id, name FROM volume_types WHERE deleted = 0 ORDER BY name;";

    sqlite3_stmt *stmt = nullptr;
    DbStatus st = prepare(sql, &stmt, err);
    if (st != DbStatus::Ok) return st;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.push_back(VolumeTypeRecord{column_string(stmt, 0), column_string(stmt, 1)});
    }
    if (rc != SQLITE_DONE) {
        st = fail(rc, err);
        sqlite3_finalize(stmt);
        return st;
    }
    sqlite3_finalize(stmt);
    return DbStatus::Ok;
}
