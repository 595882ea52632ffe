#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <chrono>
#include <iomanip>

using namespace std;

enum class LogLevel { Info, Warn, Error };

class Logger {
public:
    // Empty filename = no file output
    explicit Logger(const string &filename, bool echo_stdout = false);

    void log(const string &who, const string &msg) { write(LogLevel::Info, who, msg); }
    void warn(const string &who, const string &msg) { write(LogLevel::Warn, who, msg); }
    void error(const string &who, const string &msg) { write(LogLevel::Error, who, msg); }

    void write(LogLevel level, const string &who, const string &msg);

private:
    ofstream out_;
    bool echo_stdout_;
    mutex mtx_;
};
