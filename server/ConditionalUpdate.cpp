#include "ConditionalUpdate.hpp"
#include "Db.hpp"
#include "DbTransaction.hpp"
#include "EntityRegistry.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <set>

using namespace std;

UpdateValue UpdateValue::of(const SqlValue &v) {
    UpdateValue u;
    u.kind = Kind::Literal;
    u.literal = v;
    return u;
}

UpdateValue UpdateValue::field_ref(const string &name, int64_t offset) {
    UpdateValue u;
    u.kind = Kind::Field;
    u.field = name;
    u.offset = offset;
    return u;
}

UpdateValue UpdateValue::case_of(const vector<CaseWhen> &whens) {
    UpdateValue u;
    u.kind = Kind::Case;
    u.whens = whens;
    return u;
}

UpdateValue UpdateValue::case_of(const vector<CaseWhen> &whens, const UpdateValue &else_value) {
    UpdateValue u = case_of(whens);
    u.else_value.push_back(else_value);
    return u;
}

Condition Condition::equal(const SqlValue &v) {
    Condition c;
    c.values.push_back(v);
    return c;
}

Condition Condition::any_of(const vector<SqlValue> &vs) {
    Condition c;
    c.values = vs;
    return c;
}

Condition Condition::not_equal(const SqlValue &v, bool auto_none) {
    Condition c = equal(v);
    c.match = false;
    c.auto_none = auto_none;
    return c;
}

Condition Condition::none_of(const vector<SqlValue> &vs, bool auto_none) {
    Condition c = any_of(vs);
    c.match = false;
    c.auto_none = auto_none;
    return c;
}

ConditionalUpdate &ConditionalUpdate::set(const string &field, const UpdateValue &v) {
    values.emplace_back(field, v);
    return *this;
}

ConditionalUpdate &ConditionalUpdate::set(const string &field, const SqlValue &v) {
    return set(field, UpdateValue::of(v));
}

ConditionalUpdate &ConditionalUpdate::expect(const string &field, const Condition &c) {
    expected.emplace_back(field, c);
    return *this;
}

ConditionalUpdate &ConditionalUpdate::expect(const string &field, const SqlValue &v) {
    return expect(field, Condition::equal(v));
}

ConditionalUpdate &ConditionalUpdate::where(const string &field, const string &op,
                                            const SqlValue &v) {
    filters.push_back(Filter{field, op, v});
    return *this;
}

namespace {

class StatementBuilder {
public:
    explicit StatementBuilder(const ConditionalUpdate &req) : req_(req) {
        info_ = find_entity(req.entity);
        if (!info_) {
            throw DbProgrammingError("DB Conditional update - Unknown entity '" +
                                     req.entity + "'.");
        }
    }

    SqlStatement build() {
        if (req_.values.empty()) {
            throw DbProgrammingError("DB Conditional update - No values to update.");
        }

        // Resolve keys first so multitable updates fail before anything else.
        vector<pair<string, const UpdateValue *>> resolved;
        set<string> seen;
        for (const auto &kv : req_.values) {
            string col = column_of(kv.first);
            if (!seen.insert(col).second) {
                throw DbProgrammingError("DB Conditional update - Field '" + col +
                                         "' updated twice.");
            }
            check_value_fields(kv.second);
            resolved.emplace_back(col, &kv.second);
        }

        vector<pair<string, const UpdateValue *>> ordered;
        for (const auto &key : req_.order) {
            string col = column_of(key);
            auto it = find_if(resolved.begin(), resolved.end(),
                              [&](const pair<string, const UpdateValue *> &p) { return p.first == col; });
            if (it == resolved.end()) {
                throw DbProgrammingError("DB Conditional update - Ordered field '" + col +
                                         "' has no value.");
            }
            ordered.push_back(*it);
            resolved.erase(it);
        }
        for (auto kind : {UpdateValue::Kind::Field, UpdateValue::Kind::Case,
                          UpdateValue::Kind::Literal}) {
            for (const auto &p : resolved) {
                if (p.second->kind == kind) ordered.push_back(p);
            }
        }

        string sql = string("UPDATE ") + info_->table + " SET ";
        for (size_t i = 0; i < ordered.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += ordered[i].first + " = " + render_value(*ordered[i].second);
        }

        vector<string> where;
        for (const auto &f : req_.filters) {
            where.push_back(render_filter(f));
        }
        for (const auto &kv : req_.expected) {
            where.push_back(render_condition(column_of(kv.first), kv.second));
        }
        if (!req_.include_deleted && entity_has_column(*info_, "deleted")) {
            where.push_back("deleted = 0");
        }
        if (!where.empty()) {
            sql += " WHERE " + utils::join(where, " AND ");
        }
        sql += ";";

        return SqlStatement{sql, params_};
    }

private:
    // "status" or "volumes.status" -> "status"; any other entity is a
    // multitable update.
    string column_of(const string &key) const {
        string col = key;
        auto dot = key.find('.');
        if (dot != string::npos) {
            string entity = key.substr(0, dot);
            col = key.substr(dot + 1);
            if (entity != info_->name) {
                if (!find_entity(entity)) {
                    throw DbProgrammingError("DB Conditional update - Unknown field type '" +
                                             key + "', must be a field of " + info_->name + ".");
                }
                throw DbProgrammingError(
                    "DB Conditional update - Error in query, multitable updates are not supported.");
            }
        }
        if (!entity_has_column(*info_, col)) {
            throw DbProgrammingError("DB Conditional update - Unknown field '" + key +
                                     "' for " + info_->name + ".");
        }
        return col;
    }

    void check_value_fields(const UpdateValue &v) const {
        switch (v.kind) {
        case UpdateValue::Kind::Literal:
            return;
        case UpdateValue::Kind::Field:
            column_of(v.field);
            return;
        case UpdateValue::Kind::Case:
            if (v.whens.empty()) {
                throw DbProgrammingError("DB Conditional update - CASE without WHEN.");
            }
            for (const auto &w : v.whens) {
                column_of(w.when.field);
                check_value_fields(w.then);
            }
            for (const auto &e : v.else_value) check_value_fields(e);
            return;
        }
    }

    string placeholder(const SqlValue &v) {
        params_.push_back(v);
        return "?";
    }

    string render_value(const UpdateValue &v) {
        switch (v.kind) {
        case UpdateValue::Kind::Literal:
            return placeholder(v.literal);
        case UpdateValue::Kind::Field:
            if (v.offset == 0) return column_of(v.field);
            return "(" + column_of(v.field) + " + " + placeholder(sql_int(v.offset)) + ")";
        case UpdateValue::Kind::Case: {
            string out = "CASE";
            for (const auto &w : v.whens) {
                out += " WHEN " + render_filter(w.when);
                out += " THEN " + render_value(w.then);
            }
            if (!v.else_value.empty()) {
                out += " ELSE " + render_value(v.else_value.front());
            }
            return out + " END";
        }
        }
        return "NULL";
    }

    string render_filter(const Filter &f) {
        static const set<string> kOps = {"=", "!=", "<", "<=", ">", ">=", "LIKE"};
        string col = column_of(f.field);
        if (!kOps.count(f.op)) {
            throw DbProgrammingError("DB Conditional update - Unsupported operator '" +
                                     f.op + "' in filter on " + col + ".");
        }
        if (is_null(f.value)) {
            if (f.op == "=") return col + " IS NULL";
            if (f.op == "!=") return col + " IS NOT NULL";
            throw DbProgrammingError("DB Conditional update - Operator '" + f.op +
                                     "' cannot compare " + col + " with NULL.");
        }
        return col + " " + f.op + " " + placeholder(f.value);
    }

    string render_match(const string &col, const vector<SqlValue> &values) {
        if (values.empty()) return "0 = 1";

        bool has_null = any_of(values.begin(), values.end(),
                               [](const SqlValue &v) { return is_null(v); });
        if (!has_null) {
            if (values.size() == 1) return col + " = " + placeholder(values.front());
            vector<string> marks;
            for (const auto &v : values) marks.push_back(placeholder(v));
            return col + " IN (" + utils::join(marks, ", ") + ")";
        }

        // IN cannot match NULL
        vector<string> alternatives;
        for (const auto &v : values) {
            alternatives.push_back(is_null(v) ? col + " IS NULL" : col + " = " + placeholder(v));
        }
        return "(" + utils::join(alternatives, " OR ") + ")";
    }

    string render_condition(const string &col, const Condition &c) {
        string match = render_match(col, c.values);
        if (c.match) return match;

        string result = "NOT (" + match + ")";
        bool has_null = any_of(c.values.begin(), c.values.end(),
                               [](const SqlValue &v) { return is_null(v); });
        if (c.auto_none && !has_null) {
            result = "(" + result + " OR " + col + " IS NULL)";
        }
        return result;
    }

    const ConditionalUpdate &req_;
    const EntityInfo *info_ = nullptr;
    vector<SqlValue> params_;
};

} // namespace

SqlStatement build_conditional_update(const ConditionalUpdate &req) {
    StatementBuilder builder(req);
    return builder.build();
}

DbStatus conditional_update(Db &db, const ConditionalUpdate &req, bool &updated,
                            string &err, const RetryPolicy &policy, Logger *logger) {
    // Programming errors surface before any transaction is opened.
    build_conditional_update(req);

    return with_retry(policy, logger, "conditional update of " + req.entity, [&]() {
        updated = false;
        err.clear();
        return with_transaction(db, TxMode::Write, err, [&]() {
            return db.conditional_update(req, updated, err);
        });
    });
}
