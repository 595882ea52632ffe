#include "Logger.hpp"
#include <ctime>
#include <iostream>

namespace {
const char *level_name(LogLevel l) {
    switch (l) {
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
} // namespace

Logger::Logger(const string &filename, bool echo_stdout)
    : echo_stdout_(echo_stdout) {
    if (!filename.empty()) {
        out_.open(filename, ios::app);
        if (!out_) cerr << "Cannot open log file " << filename << "\n";
    }
}

void Logger::write(LogLevel level, const string &who, const string &msg) {
    if (!out_.is_open() && !echo_stdout_) return;

    auto now = chrono::system_clock::now();
    auto tt  = chrono::system_clock::to_time_t(now);
    tm tmv{};
    localtime_r(&tt, &tmv);

    lock_guard<mutex> lock(mtx_);
    if (out_.is_open()) {
        out_ << put_time(&tmv, "%Y-%m-%d %H:%M:%S") << " " << level_name(level)
             << " [" << who << "] " << msg << "\n";
        out_.flush();
    }
    if (echo_stdout_) {
        ostream &os = level == LogLevel::Error ? cerr : cout;
        os << put_time(&tmv, "%H:%M:%S") << " " << level_name(level)
           << " [" << who << "] " << msg << endl;
    }
}
