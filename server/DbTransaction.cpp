#include "DbTransaction.hpp"

DbTransaction::~DbTransaction() {
    rollback();
}

DbStatus DbTransaction::begin(string &err) {
    DbStatus st = db_.begin(mode_, err);
    if (st == DbStatus::Ok) active_ = true;
    return st;
}

DbStatus DbTransaction::commit(string &err) {
    DbStatus st = db_.commit(err);
    if (st == DbStatus::Ok) {
        active_ = false;
    } else {
        rollback();
    }
    return st;
}

void DbTransaction::rollback() {
    if (!active_) return;
    active_ = false;
    string err;
    // A failed ROLLBACK means SQLite already ended the transaction.
    (void)db_.rollback(err);
}
