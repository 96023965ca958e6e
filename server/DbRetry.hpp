#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include "DbErrors.hpp"
#include "Logger.hpp"

using namespace std;

struct RetryPolicy {
    int max_retries = 5;
    int interval_ms = 100;
    int max_interval_ms = 1000;
};

// Run op() until it returns something other than a transient status or the
// retries are spent. Deadlock is always retried, Duplicate only when
// retry_on_duplicate is set. op must leave no transaction open when it
// returns a failure (DbTransaction takes care of that).
template <typename Op>
DbStatus with_retry(const RetryPolicy &policy, Logger *logger, const string &what,
                    Op op, bool retry_on_duplicate = false) {
    int interval = policy.interval_ms;
    for (int attempt = 0;; ++attempt) {
        DbStatus st = op();
        bool retryable = st == DbStatus::Deadlock ||
                         (retry_on_duplicate && st == DbStatus::Duplicate);
        if (!retryable || attempt >= policy.max_retries) {
            if (retryable && logger) {
                logger->error("db", what + ": giving up after " + to_string(attempt + 1) +
                                    " attempts (" + db_status_name(st) + ")");
            }
            return st;
        }
        if (logger) {
            logger->warning("db", what + ": " + db_status_name(st) + ", retry " +
                                  to_string(attempt + 1) + "/" + to_string(policy.max_retries));
        }
        if (interval > 0) this_thread::sleep_for(chrono::milliseconds(interval));
        interval = min(interval * 2, policy.max_interval_ms);
    }
}
