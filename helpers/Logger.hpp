#pragma once

#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

namespace util {

enum class LogLevel { Debug, Info, Warning, Error };

// "DEBUG" | "INFO" | "WARN" | "ERROR"; anything else maps to Info
LogLevel parseLogLevel(const std::string &name);
const char *logLevelName(LogLevel level);

class Logger {
public:
    // console: stdout for the HTTP transport, stderr when stdout carries protocol traffic
    static void init(const std::string &filePath, LogLevel level = LogLevel::Info,
                     std::FILE *console = stdout);
    static void shutdown();

    static LogLevel level();

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warn(const std::string &msg);
    static void error(const std::string &msg);

private:
    static std::string timeStamp();
    static void log(LogLevel level, const std::string &msg);

    static std::mutex mtx_;
    static std::ofstream out_;    // optional file
    static std::FILE *console_;
    static LogLevel level_;
};

} // namespace util
