#pragma once
#include <fstream>
#include <mutex>
#include <string>

using namespace std;

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

const char *log_level_name(LogLevel level);
bool parse_log_level(const string &name, LogLevel &out);

class Logger {
public:
    // Empty filename logs to stderr.
    explicit Logger(const string &filename, LogLevel min_level = LogLevel::Info);

    void log(LogLevel level, const string &scope, const string &msg);

    void debug(const string &scope, const string &msg)   { log(LogLevel::Debug, scope, msg); }
    void info(const string &scope, const string &msg)    { log(LogLevel::Info, scope, msg); }
    void warning(const string &scope, const string &msg) { log(LogLevel::Warning, scope, msg); }
    void error(const string &scope, const string &msg)   { log(LogLevel::Error, scope, msg); }

    bool enabled(LogLevel level) const;

private:
    ofstream out_;
    bool to_stderr_ = false;
    LogLevel min_level_;
    mutable mutex mtx_;
};
