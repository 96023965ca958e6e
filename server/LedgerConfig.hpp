#pragma once
#include <string>
#include <cstdint>
#include "Logger.hpp"

using namespace std;

struct LedgerConfig {
    string db_path;
    string log_path;
    LogLevel log_level = LogLevel::Info;

    // Seconds until a reservation is considered abandoned.
    int64_t reservation_expire = 86400;
    // Reservations between forced usage refreshes, 0 disables.
    int64_t until_refresh = 0;
    // Usage age in seconds forcing a refresh, 0 disables.
    int64_t max_age = 0;
    bool no_snapshot_gb_quota = false;
    // Limit used when neither project nor default class sets one. -1 = unlimited.
    int64_t default_quota = -1;

    int db_max_retries = 5;
    int db_retry_interval_ms = 100;
    int db_max_retry_interval_ms = 1000;
    int busy_timeout_ms = 5000;

    int64_t expire_interval = 60;
};

// Defaults, with paths resolved against the current directory.
LedgerConfig default_config();

// Overlay QL_* environment variables on cfg. Returns false with err set on
// the first malformed value; cfg is left partially updated in that case.
bool load_config_from_env(LedgerConfig &cfg, string &err);
