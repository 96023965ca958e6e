#include "AdminSession.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <map>

using namespace std;
using namespace proto;

AdminSession::AdminSession(istream &in, ostream &out, QuotaLedger &ledger, Db &db,
                           Logger &logger)
    : in_(in), out_(out), ledger_(ledger), db_(db), logger_(logger) {}

void AdminSession::run() {
    string line;
    while (recv_line(in_, line)) {
        if (!handle_command(line)) break;
    }
}

bool AdminSession::handle_command(const string &line) {
    vector<string> tokens = split_tokens(line);
    if (tokens.empty()) {
        send_line(out_, error(400, "Empty command"));
        return true;
    }

    const string &cmd = tokens[0];
    logger_.debug("admin", line);

    if (cmd == "QUOTA_SET")    return cmd_quota_set(tokens);
    if (cmd == "QUOTA_GET")    return cmd_quota_get(tokens);
    if (cmd == "QUOTA_DELETE") return cmd_quota_delete(tokens);
    if (cmd == "CLASS_SET")    return cmd_class_set(tokens);
    if (cmd == "CLASS_GET")    return cmd_class_get(tokens);
    if (cmd == "CLASS_DELETE") return cmd_class_delete(tokens);
    if (cmd == "USAGE")        return cmd_usage(tokens);
    if (cmd == "RESERVE")      return cmd_reserve(tokens);
    if (cmd == "COMMIT")       return cmd_commit(tokens, true);
    if (cmd == "ROLLBACK")     return cmd_commit(tokens, false);
    if (cmd == "EXPIRE")       return cmd_expire();
    if (cmd == "QUIT") {
        send_line(out_, ok(200, "Bye"));
        return false;
    }

    send_line(out_, error(400, "Unknown command"));
    return true;
}

void AdminSession::reply_status(DbStatus st, const string &err) {
    string msg = err.empty() ? string(db_status_name(st)) : err;
    switch (st) {
    case DbStatus::NotFound:  send_line(out_, error(404, msg)); break;
    case DbStatus::OverQuota: send_line(out_, error(413, msg)); break;
    case DbStatus::Duplicate: send_line(out_, error(409, msg)); break;
    default:                  send_line(out_, error(500, msg)); break;
    }
}

bool AdminSession::cmd_quota_set(const vector<string> &tokens) {
    int64_t limit = 0;
    if (tokens.size() != 4 || !utils::parse_int64(tokens[3], limit) || limit < -1) {
        send_line(out_, error(400, "Usage: QUOTA_SET <project> <resource> <limit>"));
        return true;
    }

    string err;
    DbStatus st = ledger_.set_quota(db_, tokens[1], tokens[2], limit, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, tokens[2] + "=" + to_string(limit)));
    return true;
}

bool AdminSession::cmd_quota_get(const vector<string> &tokens) {
    if (tokens.size() != 2 && tokens.size() != 3) {
        send_line(out_, error(400, "Usage: QUOTA_GET <project> [resource]"));
        return true;
    }

    string err;
    if (tokens.size() == 3) {
        QuotaRecord rec;
        DbStatus st = ledger_.get_quota(db_, tokens[1], tokens[2], rec, err);
        if (st == DbStatus::NotFound) {
            send_line(out_, error(404, "No quota for " + tokens[2]));
            return true;
        }
        if (st != DbStatus::Ok) {
            reply_status(st, err);
            return true;
        }
        send_line(out_, ok(200, rec.resource + "=" + to_string(rec.hard_limit)));
        return true;
    }

    // Effective limits for every known resource.
    map<string, QuotaResource> resources;
    DbStatus st = all_resources(db_, resources, err);
    map<string, int64_t> limits;
    if (st == DbStatus::Ok) st = ledger_.effective_limits(db_, tokens[1], resources, limits, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }

    vector<string> parts;
    for (const auto &kv : limits) parts.push_back(kv.first + "=" + to_string(kv.second));
    send_line(out_, ok(200, utils::join(parts, " ")));
    return true;
}

bool AdminSession::cmd_quota_delete(const vector<string> &tokens) {
    if (tokens.size() != 2 && tokens.size() != 3) {
        send_line(out_, error(400, "Usage: QUOTA_DELETE <project> [resource]"));
        return true;
    }

    string err;
    DbStatus st;
    if (tokens.size() == 3) {
        st = ledger_.destroy_quota(db_, tokens[1], tokens[2], err);
        if (st == DbStatus::NotFound) {
            send_line(out_, error(404, "No quota for " + tokens[2]));
            return true;
        }
    } else {
        // whole project: limits, usages and outstanding reservations
        st = ledger_.destroy_by_project(db_, tokens[1], false, err);
        if (st == DbStatus::NotFound) {
            send_line(out_, error(404, "No quotas for project " + tokens[1]));
            return true;
        }
    }
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, "Deleted"));
    return true;
}

bool AdminSession::cmd_class_set(const vector<string> &tokens) {
    int64_t limit = 0;
    if (tokens.size() != 4 || !utils::parse_int64(tokens[3], limit) || limit < -1) {
        send_line(out_, error(400, "Usage: CLASS_SET <class> <resource> <limit>"));
        return true;
    }

    string err;
    DbStatus st = ledger_.set_quota_class(db_, tokens[1], tokens[2], limit, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, tokens[1] + ":" + tokens[2] + "=" + to_string(limit)));
    return true;
}

bool AdminSession::cmd_class_get(const vector<string> &tokens) {
    if (tokens.size() != 2 && tokens.size() != 3) {
        send_line(out_, error(400, "Usage: CLASS_GET <class> [resource]"));
        return true;
    }

    string err;
    if (tokens.size() == 3) {
        QuotaClassRecord rec;
        DbStatus st = ledger_.get_quota_class(db_, tokens[1], tokens[2], rec, err);
        if (st == DbStatus::NotFound) {
            send_line(out_, error(404, "No class limit for " + tokens[1] + ":" + tokens[2]));
            return true;
        }
        if (st != DbStatus::Ok) {
            reply_status(st, err);
            return true;
        }
        send_line(out_, ok(200, rec.resource + "=" + to_string(rec.hard_limit)));
        return true;
    }

    map<string, int64_t> limits;
    DbStatus st = ledger_.get_quota_class_limits(db_, tokens[1], limits, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    vector<string> parts;
    for (const auto &kv : limits) parts.push_back(kv.first + "=" + to_string(kv.second));
    send_line(out_, ok(200, utils::join(parts, " ")));
    return true;
}

bool AdminSession::cmd_class_delete(const vector<string> &tokens) {
    if (tokens.size() != 2 && tokens.size() != 3) {
        send_line(out_, error(400, "Usage: CLASS_DELETE <class> [resource]"));
        return true;
    }

    string err;
    DbStatus st;
    if (tokens.size() == 3) {
        st = ledger_.destroy_quota_class(db_, tokens[1], tokens[2], err);
        if (st == DbStatus::NotFound) {
            send_line(out_, error(404, "No class limit for " + tokens[1] + ":" + tokens[2]));
            return true;
        }
    } else {
        st = ledger_.destroy_quota_classes(db_, tokens[1], err);
    }
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, "Deleted"));
    return true;
}

bool AdminSession::cmd_usage(const vector<string> &tokens) {
    if (tokens.size() != 2) {
        send_line(out_, error(400, "Usage: USAGE <project>"));
        return true;
    }

    string err;
    map<string, UsageSnapshot> usage;
    DbStatus st = ledger_.get_usage(db_, tokens[1], usage, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }

    // resource=in_use/reserved
    vector<string> parts;
    for (const auto &kv : usage) {
        parts.push_back(kv.first + "=" + to_string(kv.second.in_use) + "/" +
                        to_string(kv.second.reserved));
    }
    send_line(out_, ok(200, utils::join(parts, " ")));
    return true;
}

bool AdminSession::cmd_reserve(const vector<string> &tokens) {
    if (tokens.size() < 3) {
        send_line(out_, error(400, "Usage: RESERVE <project> <resource>=<delta>..."));
        return true;
    }

    map<string, int64_t> deltas;
    for (size_t i = 2; i < tokens.size(); ++i) {
        string res, text;
        int64_t delta = 0;
        if (!split_pair(tokens[i], res, text) || !utils::parse_int64(text, delta)) {
            send_line(out_, error(400, "Bad delta: " + tokens[i]));
            return true;
        }
        if (deltas.count(res)) {
            send_line(out_, error(400, "Duplicate resource: " + res));
            return true;
        }
        deltas[res] = delta;
    }

    string err;
    ReserveRequest req;
    DbStatus st = ledger_.build_request(db_, tokens[1], deltas, req, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }

    vector<string> ids;
    OverQuota over;
    st = ledger_.reserve(db_, req, ids, over, err);
    if (st == DbStatus::OverQuota) {
        send_line(out_, error(413, over.message()));
        return true;
    }
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, utils::join(ids, " ")));
    return true;
}

bool AdminSession::cmd_commit(const vector<string> &tokens, bool apply) {
    if (tokens.size() < 3) {
        send_line(out_, error(400, string("Usage: ") + (apply ? "COMMIT" : "ROLLBACK") +
                                   " <project> <uuid>..."));
        return true;
    }

    vector<string> ids(tokens.begin() + 2, tokens.end());
    string err;
    DbStatus st = apply ? ledger_.commit(db_, ids, tokens[1], err)
                        : ledger_.rollback(db_, ids, tokens[1], err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, apply ? "Committed" : "Rolled back"));
    return true;
}

bool AdminSession::cmd_expire() {
    int expired = 0;
    string err;
    DbStatus st = ledger_.expire(db_, utils::now(), expired, err);
    if (st != DbStatus::Ok) {
        reply_status(st, err);
        return true;
    }
    send_line(out_, ok(200, "Expired " + to_string(expired)));
    return true;
}
