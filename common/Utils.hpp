#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

using namespace std;

using Timestamp = chrono::system_clock::time_point;

namespace utils {

// Current UTC time truncated to whole seconds (the store's resolution).
Timestamp now();

// "YYYY-MM-DD HH:MM:SS" in UTC
string format_utc(Timestamp t);

// Parse the format written by format_utc. Returns false on malformed input.
bool parse_utc(const string &text, Timestamp &out);

// Random (version 4) UUID in canonical textual form.
string generate_uuid();

// Join items with sep.
string join(const vector<string> &items, const string &sep);

// Split on one separator character, keeping empty parts.
vector<string> split(const string &s, char sep);

// Parse a signed decimal integer; the whole string must be consumed.
bool parse_int64(const string &s, int64_t &out);

} // namespace utils
