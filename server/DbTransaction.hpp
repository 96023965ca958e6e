#pragma once
#include <string>
#include "Db.hpp"

using namespace std;

// Scoped transaction on one connection. Rolls back on destruction unless
// commit() succeeded. begin() may be called again after commit() to restart.
class DbTransaction {
public:
    DbTransaction(Db &db, TxMode mode) : db_(db), mode_(mode) {}
    ~DbTransaction();

    DbTransaction(const DbTransaction &) = delete;
    DbTransaction &operator=(const DbTransaction &) = delete;

    DbStatus begin(string &err);
    DbStatus commit(string &err);
    void rollback();

private:
    Db &db_;
    TxMode mode_;
    bool active_ = false;
};

// begin, fn(), commit. fn returns a DbStatus; anything but Ok rolls back and
// is returned as is. Exceptions thrown by fn roll back and propagate.
template <typename Fn>
DbStatus with_transaction(Db &db, TxMode mode, string &err, Fn fn) {
    DbTransaction tx(db, mode);
    DbStatus st = tx.begin(err);
    if (st != DbStatus::Ok) return st;

    st = fn();
    if (st != DbStatus::Ok) return st;
    return tx.commit(err);
}
