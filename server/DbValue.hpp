#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>

using namespace std;

// A single column value as SQLite stores it: NULL, INTEGER, REAL or TEXT.
using SqlValue = variant<monostate, int64_t, double, string>;

// Column name -> value for one row of one entity.
using Row = map<string, SqlValue>;

inline SqlValue sql_null() { return SqlValue{}; }
inline SqlValue sql_int(int64_t v) { return SqlValue{v}; }
inline SqlValue sql_text(const string &v) { return SqlValue{v}; }

inline bool is_null(const SqlValue &v) { return holds_alternative<monostate>(v); }

// Typed column access; false when the column is missing or of another type.
bool row_get_int(const Row &row, const string &col, int64_t &out);
bool row_get_text(const Row &row, const string &col, string &out);
