#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "Db.hpp"
#include "LedgerConfig.hpp"
#include "Logger.hpp"
#include "QuotaLedger.hpp"

using namespace std;

// Owns the process-wide logger, store connection and ledger. run() sweeps
// expired reservations every expire_interval seconds until stop().
class ExpiryService {
public:
    explicit ExpiryService(const LedgerConfig &cfg);

    // Open the schema. Must succeed before run() or run_once().
    bool init(string &err);

    void run();
    // One sweep; returns the number of reservations expired, -1 on failure.
    int run_once();
    // Safe to call from a signal handler.
    void stop() { stop_ = true; }
    bool stopping() const { return stop_.load(); }

    Logger& logger() { return logger_; }
    QuotaLedger& ledger() { return ledger_; }
    Db& db() { return *db_; }
    const LedgerConfig& config() const { return cfg_; }

    uint64_t sweeps() const { return sweeps_.load(); }
    uint64_t expired_total() const { return expired_total_.load(); }

private:
    LedgerConfig cfg_;
    Logger logger_;
    unique_ptr<Db> db_;
    QuotaLedger ledger_;
    atomic<bool> stop_{false};
    atomic<uint64_t> sweeps_{0};
    atomic<uint64_t> expired_total_{0};
};
