#include "LedgerConfig.hpp"
#include "../common/Utils.hpp"
#include <climits>
#include <cstdlib>
#include <filesystem>

using namespace std;

namespace {
bool env_int(const char *name, int64_t min_value, int64_t &out, string &err) {
    const char *p = ::getenv(name);
    if (!p) return true;

    int64_t v = 0;
    if (!utils::parse_int64(p, v)) {
        err = string(name) + ": not an integer: '" + p + "'";
        return false;
    }
    if (v < min_value) {
        err = string(name) + ": must be >= " + to_string(min_value);
        return false;
    }
    out = v;
    return true;
}

bool env_int(const char *name, int64_t min_value, int &out, string &err) {
    int64_t v = out;
    if (!env_int(name, min_value, v, err)) return false;
    if (v > INT_MAX) {
        err = string(name) + ": must be <= " + to_string(INT_MAX);
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool env_bool(const char *name, bool &out, string &err) {
    const char *p = ::getenv(name);
    if (!p) return true;

    string v = p;
    if (v == "1" || v == "true" || v == "yes") {
        out = true;
    } else if (v == "0" || v == "false" || v == "no") {
        out = false;
    } else {
        err = string(name) + ": not a boolean: '" + v + "'";
        return false;
    }
    return true;
}
} // namespace

LedgerConfig default_config() {
    namespace fs = std::filesystem;
    LedgerConfig cfg;
    cfg.db_path  = (fs::current_path() / "quotaledger.db").string();
    cfg.log_path = (fs::current_path() / "quotaledger.log").string();
    return cfg;
}

bool load_config_from_env(LedgerConfig &cfg, string &err) {
    if (const char *p = ::getenv("QL_DB_PATH")) cfg.db_path = p;
    if (const char *p = ::getenv("QL_LOG_PATH")) cfg.log_path = p;

    if (const char *p = ::getenv("QL_LOG_LEVEL")) {
        if (!parse_log_level(p, cfg.log_level)) {
            err = string("QL_LOG_LEVEL: unknown level '") + p + "'";
            return false;
        }
    }

    if (!env_int("QL_RESERVATION_EXPIRE", 1, cfg.reservation_expire, err)) return false;
    if (!env_int("QL_UNTIL_REFRESH", 0, cfg.until_refresh, err)) return false;
    if (!env_int("QL_MAX_AGE", 0, cfg.max_age, err)) return false;
    if (!env_bool("QL_NO_SNAPSHOT_GB_QUOTA", cfg.no_snapshot_gb_quota, err)) return false;
    if (!env_int("QL_DEFAULT_QUOTA", -1, cfg.default_quota, err)) return false;
    if (!env_int("QL_DB_MAX_RETRIES", 0, cfg.db_max_retries, err)) return false;
    if (!env_int("QL_DB_RETRY_INTERVAL_MS", 0, cfg.db_retry_interval_ms, err)) return false;
    if (!env_int("QL_DB_MAX_RETRY_INTERVAL_MS", 0, cfg.db_max_retry_interval_ms, err)) return false;
    if (!env_int("QL_BUSY_TIMEOUT_MS", 0, cfg.busy_timeout_ms, err)) return false;
    if (!env_int("QL_EXPIRE_INTERVAL", 1, cfg.expire_interval, err)) return false;

    if (cfg.db_path.empty()) {
        err = "QL_DB_PATH: must not be empty";
        return false;
    }
    return true;
}
