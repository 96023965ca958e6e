#include "Utils.hpp"
#include <ctime>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/random_generator.hpp>

using namespace std;

namespace utils {

Timestamp now() {
    return chrono::time_point_cast<chrono::seconds>(chrono::system_clock::now());
}

string format_utc(Timestamp t) {
    time_t tt = chrono::system_clock::to_time_t(t);
    tm tmv{};
    gmtime_r(&tt, &tmv);

    ostringstream ss;
    ss << put_time(&tmv, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool parse_utc(const string &text, Timestamp &out) {
    tm tmv{};
    istringstream ss(text);
    ss >> get_time(&tmv, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) return false;

    // timegm: tmv is UTC, not local time
    time_t tt = ::timegm(&tmv);
    if (tt == (time_t)-1) return false;
    out = chrono::system_clock::from_time_t(tt);
    return true;
}

string generate_uuid() {
    // random_generator is not thread safe, one per thread
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

string join(const vector<string> &items, const string &sep) {
    string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

vector<string> split(const string &s, char sep) {
    vector<string> parts;
    string cur;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(cur);
    return parts;
}

bool parse_int64(const string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = (int64_t)v;
    return true;
}

} // namespace utils
