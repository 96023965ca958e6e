#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "Db.hpp"
#include "Logger.hpp"
#include "QuotaLedger.hpp"

using namespace std;

// Line oriented operator session over a pair of streams. One command per
// line, one reply line per command.
class AdminSession {
public:
    AdminSession(istream &in, ostream &out, QuotaLedger &ledger, Db &db, Logger &logger);

    // Until QUIT or end of input.
    void run();
    // False once the session should end.
    bool handle_command(const string &line);

private:
    bool cmd_quota_set(const vector<string> &tokens);
    bool cmd_quota_get(const vector<string> &tokens);
    bool cmd_quota_delete(const vector<string> &tokens);
    bool cmd_class_set(const vector<string> &tokens);
    bool cmd_class_get(const vector<string> &tokens);
    bool cmd_class_delete(const vector<string> &tokens);
    bool cmd_usage(const vector<string> &tokens);
    bool cmd_reserve(const vector<string> &tokens);
    bool cmd_commit(const vector<string> &tokens, bool apply);
    bool cmd_expire();

    // Reply for a failed ledger call.
    void reply_status(DbStatus st, const string &err);

    istream &in_;
    ostream &out_;
    QuotaLedger &ledger_;
    Db &db_;
    Logger &logger_;
};
