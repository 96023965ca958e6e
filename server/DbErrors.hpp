#pragma once
#include <stdexcept>
#include <string>

using namespace std;

// Outcome of a store or ledger call. NotFound and OverQuota are ordinary
// results the caller branches on; Deadlock and Duplicate are transient and
// normally absorbed by with_retry.
enum class DbStatus {
    Ok = 0,
    NotFound,
    OverQuota,
    Duplicate,
    Deadlock,
    Error
};

const char *db_status_name(DbStatus status);

inline bool is_transient(DbStatus status) {
    return status == DbStatus::Deadlock || status == DbStatus::Duplicate;
}

// Caller defect: multi-entity conditional update, unknown field, malformed
// filter, locked read outside a write transaction. Never retried.
class DbProgrammingError : public logic_error {
public:
    explicit DbProgrammingError(const string &reason)
        : logic_error("Programming error: " + reason) {}
};

// Ledger state contradicts its own invariants, e.g. an outstanding
// reservation whose usage row is gone.
class DbIntegrityError : public runtime_error {
public:
    explicit DbIntegrityError(const string &reason)
        : runtime_error("Data integrity fault: " + reason) {}
};
