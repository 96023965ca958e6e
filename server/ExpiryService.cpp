#include "ExpiryService.hpp"
#include "DbSqlite.hpp"
#include <chrono>
#include <thread>

using namespace std;

ExpiryService::ExpiryService(const LedgerConfig &cfg)
    : cfg_(cfg),
      logger_(cfg.log_path, cfg.log_level),
      db_(make_unique<DbSqlite>(cfg.db_path, cfg.busy_timeout_ms)),
      ledger_(logger_, cfg_) {}

bool ExpiryService::init(string &err) {
    DbStatus st = db_->init_schema(err);
    if (st != DbStatus::Ok) {
        logger_.error("server", "DB init failed for " + cfg_.db_path + ": " + err);
        return false;
    }
    logger_.info("server", "ledger store ready at " + cfg_.db_path);
    return true;
}

int ExpiryService::run_once() {
    int expired = 0;
    string err;
    DbStatus st = ledger_.expire(*db_, utils::now(), expired, err);
    sweeps_++;
    if (st != DbStatus::Ok) {
        logger_.error("expire", string("sweep failed (") + db_status_name(st) + "): " + err);
        return -1;
    }
    expired_total_ += (uint64_t)expired;
    return expired;
}

void ExpiryService::run() {
    logger_.info("server", "expiry service started, interval " +
                           to_string(cfg_.expire_interval) + "s");

    while (!stop_) {
        run_once();

        // sleep in short slices so stop() takes effect promptly
        auto deadline = chrono::steady_clock::now() + chrono::seconds(cfg_.expire_interval);
        while (!stop_ && chrono::steady_clock::now() < deadline) {
            this_thread::sleep_for(chrono::milliseconds(200));
        }
    }

    logger_.info("server", "expiry service stopped after " + to_string(sweeps_.load()) +
                           " sweep(s), " + to_string(expired_total_.load()) + " expired");
}
