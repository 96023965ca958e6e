#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

using namespace std;

namespace proto {

// Read one '\n' terminated line, dropping a trailing '\r'.
bool recv_line(istream &in, string &line);

// Write line and a '\n', then flush. False when the stream failed.
bool send_line(ostream &out, const string &line);

// "OK <code> <msg>" / "ERR <code> <msg>"
string ok(int code, const string &msg);
string error(int code, const string &msg);

// Split on spaces and tabs.
vector<string> split_tokens(const string &s);

// "key=value"; false when there is no '=' or either side is empty.
bool split_pair(const string &token, string &key, string &value);

} // namespace proto
