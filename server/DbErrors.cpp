#include "DbErrors.hpp"

const char *db_status_name(DbStatus status) {
    switch (status) {
    case DbStatus::Ok:        return "ok";
    case DbStatus::NotFound:  return "not found";
    case DbStatus::OverQuota: return "over quota";
    case DbStatus::Duplicate: return "duplicate entry";
    case DbStatus::Deadlock:  return "deadlock";
    case DbStatus::Error:     return "error";
    }
    return "unknown";
}
