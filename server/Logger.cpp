#include "Logger.hpp"
#include "../common/Utils.hpp"
#include <iostream>

const char *log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

bool parse_log_level(const string &name, LogLevel &out) {
    if (name == "debug")   { out = LogLevel::Debug;   return true; }
    if (name == "info")    { out = LogLevel::Info;    return true; }
    if (name == "warning") { out = LogLevel::Warning; return true; }
    if (name == "error")   { out = LogLevel::Error;   return true; }
    return false;
}

Logger::Logger(const string &filename, LogLevel min_level)
    : min_level_(min_level) {
    if (filename.empty()) {
        to_stderr_ = true;
    } else {
        out_.open(filename, ios::app);
        if (!out_) {
            cerr << "Cannot open log file " << filename << ", logging to stderr\n";
            to_stderr_ = true;
        }
    }
}

bool Logger::enabled(LogLevel level) const {
    lock_guard<mutex> lock(mtx_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const string &scope, const string &msg) {
    string line = utils::format_utc(utils::now()) + " " + log_level_name(level) +
                  " [" + scope + "] " + msg + "\n";

    lock_guard<mutex> lock(mtx_);
    if (level < min_level_) return;
    if (to_stderr_) {
        cerr << line;
        return;
    }
    out_ << line;
    out_.flush();
}
