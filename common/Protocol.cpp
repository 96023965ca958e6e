#include "Protocol.hpp"

using namespace std;

namespace proto {

bool recv_line(istream &in, string &line) {
    if (!getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool send_line(ostream &out, const string &line) {
    out << line;
    if (line.empty() || line.back() != '\n') out << '\n';
    out.flush();
    return static_cast<bool>(out);
}

string ok(int code, const string &msg) {
    string s = "OK " + to_string(code);
    if (!msg.empty()) s += " " + msg;
    return s;
}

string error(int code, const string &msg) {
    string s = "ERR " + to_string(code);
    if (!msg.empty()) s += " " + msg;
    return s;
}

vector<string> split_tokens(const string &s) {
    vector<string> tokens;
    string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

bool split_pair(const string &token, string &key, string &value) {
    size_t pos = token.find('=');
    if (pos == string::npos || pos == 0 || pos + 1 == token.size()) return false;
    key = token.substr(0, pos);
    value = token.substr(pos + 1);
    return true;
}

} // namespace proto
