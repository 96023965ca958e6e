#pragma once
#include <string>
#include <utility>
#include <vector>
#include "DbValue.hpp"
#include "DbErrors.hpp"
#include "DbRetry.hpp"

using namespace std;

class Db;
class Logger;

// Extra predicate "field op value". Supported ops: = != < <= > >= LIKE.
// A NULL value is only valid with = and != (rendered as IS [NOT] NULL).
struct Filter {
    string field;
    string op;
    SqlValue value;
};

struct CaseWhen;

// New value for one field: a literal, another field of the same row
// (optionally plus an integer offset) or a searched CASE expression.
struct UpdateValue {
    enum class Kind { Literal, Field, Case };

    Kind kind = Kind::Literal;
    SqlValue literal;
    string field;
    int64_t offset = 0;
    vector<CaseWhen> whens;
    vector<UpdateValue> else_value;   // empty or exactly one

    static UpdateValue of(const SqlValue &v);
    static UpdateValue field_ref(const string &name, int64_t offset = 0);
    static UpdateValue case_of(const vector<CaseWhen> &whens);
    static UpdateValue case_of(const vector<CaseWhen> &whens, const UpdateValue &else_value);
};

struct CaseWhen {
    Filter when;
    UpdateValue then;
};

// Expected current value of a field. Equal conditions match any of values
// (NULL included); not-equal conditions match none of them. With auto_none a
// NULL field satisfies a not-equal condition, as != would outside SQL.
struct Condition {
    vector<SqlValue> values;
    bool match = true;
    bool auto_none = true;

    static Condition equal(const SqlValue &v);
    static Condition any_of(const vector<SqlValue> &vs);
    static Condition not_equal(const SqlValue &v, bool auto_none = true);
    static Condition none_of(const vector<SqlValue> &vs, bool auto_none = true);
};

// Compare-and-swap over the rows of one entity.
struct ConditionalUpdate {
    string entity;
    // field -> new value; keys may be "status" or "volumes.status"
    vector<pair<string, UpdateValue>> values;
    // field -> expected current value
    vector<pair<string, Condition>> expected;
    vector<Filter> filters;
    // fields to assign first, in this order
    vector<string> order;
    bool include_deleted = false;

    ConditionalUpdate &set(const string &field, const UpdateValue &v);
    ConditionalUpdate &set(const string &field, const SqlValue &v);
    ConditionalUpdate &expect(const string &field, const Condition &c);
    ConditionalUpdate &expect(const string &field, const SqlValue &v);
    ConditionalUpdate &where(const string &field, const string &op, const SqlValue &v);
};

struct SqlStatement {
    string sql;
    vector<SqlValue> params;
};

// Render the UPDATE statement. SET clauses are emitted in this order:
// explicit order list, field references, CASE expressions, literals.
// Throws DbProgrammingError for multi-entity updates, unknown entities or
// fields, duplicate keys and malformed filters.
SqlStatement build_conditional_update(const ConditionalUpdate &req);

// Run req in its own write transaction, retrying on deadlock. updated is set
// when at least one row changed; no match is not an error.
DbStatus conditional_update(Db &db, const ConditionalUpdate &req, bool &updated,
                            string &err, const RetryPolicy &policy,
                            Logger *logger = nullptr);
