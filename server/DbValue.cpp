#include "DbValue.hpp"

bool row_get_int(const Row &row, const string &col, int64_t &out) {
    auto it = row.find(col);
    if (it == row.end()) return false;
    auto i = get_if<int64_t>(&it->second);
    if (!i) return false;
    out = *i;
    return true;
}

bool row_get_text(const Row &row, const string &col, string &out) {
    auto it = row.find(col);
    if (it == row.end()) return false;
    auto s = get_if<string>(&it->second);
    if (!s) return false;
    out = *s;
    return true;
}
