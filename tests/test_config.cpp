#include <gtest/gtest.h>
#include <cstdlib>
#include "LedgerConfig.hpp"

using namespace std;

namespace {
const char *const kVars[] = {
    "QL_DB_PATH", "QL_LOG_PATH", "QL_LOG_LEVEL", "QL_RESERVATION_EXPIRE",
    "QL_UNTIL_REFRESH", "QL_MAX_AGE", "QL_NO_SNAPSHOT_GB_QUOTA", "QL_DEFAULT_QUOTA",
    "QL_DB_MAX_RETRIES", "QL_DB_RETRY_INTERVAL_MS", "QL_DB_MAX_RETRY_INTERVAL_MS",
    "QL_BUSY_TIMEOUT_MS", "QL_EXPIRE_INTERVAL",
};
} // namespace

class ConfigEnv : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char *name : kVars) ::unsetenv(name);
    }
};

TEST_F(ConfigEnv, Defaults) {
    LedgerConfig cfg = default_config();
    string err;
    ASSERT_TRUE(load_config_from_env(cfg, err)) << err;

    EXPECT_NE(cfg.db_path.find("quotaledger.db"), string::npos);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
    EXPECT_EQ(cfg.reservation_expire, 86400);
    EXPECT_EQ(cfg.until_refresh, 0);
    EXPECT_EQ(cfg.max_age, 0);
    EXPECT_FALSE(cfg.no_snapshot_gb_quota);
    EXPECT_EQ(cfg.default_quota, -1);
    EXPECT_EQ(cfg.db_max_retries, 5);
    EXPECT_EQ(cfg.db_retry_interval_ms, 100);
    EXPECT_EQ(cfg.db_max_retry_interval_ms, 1000);
    EXPECT_EQ(cfg.expire_interval, 60);
}

TEST_F(ConfigEnv, Overrides) {
    ::setenv("QL_DB_PATH", "/tmp/other.db", 1);
    ::setenv("QL_LOG_LEVEL", "debug", 1);
    ::setenv("QL_UNTIL_REFRESH", "5", 1);
    ::setenv("QL_MAX_AGE", "3600", 1);
    ::setenv("QL_NO_SNAPSHOT_GB_QUOTA", "yes", 1);
    ::setenv("QL_DEFAULT_QUOTA", "100", 1);
    ::setenv("QL_DB_MAX_RETRIES", "2", 1);

    LedgerConfig cfg = default_config();
    string err;
    ASSERT_TRUE(load_config_from_env(cfg, err)) << err;
    EXPECT_EQ(cfg.db_path, "/tmp/other.db");
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.until_refresh, 5);
    EXPECT_EQ(cfg.max_age, 3600);
    EXPECT_TRUE(cfg.no_snapshot_gb_quota);
    EXPECT_EQ(cfg.default_quota, 100);
    EXPECT_EQ(cfg.db_max_retries, 2);
}

TEST_F(ConfigEnv, RejectsMalformedValues) {
    LedgerConfig cfg = default_config();
    string err;

    ::setenv("QL_MAX_AGE", "soon", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    EXPECT_NE(err.find("QL_MAX_AGE"), string::npos);
    ::unsetenv("QL_MAX_AGE");

    ::setenv("QL_UNTIL_REFRESH", "-1", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    ::unsetenv("QL_UNTIL_REFRESH");

    ::setenv("QL_DEFAULT_QUOTA", "-2", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    ::unsetenv("QL_DEFAULT_QUOTA");

    ::setenv("QL_EXPIRE_INTERVAL", "0", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    ::unsetenv("QL_EXPIRE_INTERVAL");

    ::setenv("QL_LOG_LEVEL", "chatty", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    ::unsetenv("QL_LOG_LEVEL");

    ::setenv("QL_NO_SNAPSHOT_GB_QUOTA", "maybe", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    ::unsetenv("QL_NO_SNAPSHOT_GB_QUOTA");

    ::setenv("QL_DB_PATH", "", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
}

TEST_F(ConfigEnv, RejectsValuesBeyondIntRange) {
    LedgerConfig cfg = default_config();
    string err;

    ::setenv("QL_DB_MAX_RETRIES", "4294967296", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    EXPECT_NE(err.find("QL_DB_MAX_RETRIES"), string::npos);
    EXPECT_EQ(cfg.db_max_retries, 5);
    ::unsetenv("QL_DB_MAX_RETRIES");

    ::setenv("QL_BUSY_TIMEOUT_MS", "4294967297", 1);
    EXPECT_FALSE(load_config_from_env(cfg, err));
    EXPECT_NE(err.find("QL_BUSY_TIMEOUT_MS"), string::npos);
    EXPECT_EQ(cfg.busy_timeout_ms, 5000);
    ::unsetenv("QL_BUSY_TIMEOUT_MS");

    ::setenv("QL_DB_RETRY_INTERVAL_MS", "2147483647", 1);
    ASSERT_TRUE(load_config_from_env(cfg, err)) << err;
    EXPECT_EQ(cfg.db_retry_interval_ms, 2147483647);
}
