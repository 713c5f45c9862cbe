#include "Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace util {

std::mutex Logger::mtx_;
std::ofstream Logger::out_;
std::FILE *Logger::console_ = stdout;
LogLevel Logger::level_ = LogLevel::Info;

LogLevel parseLogLevel(const std::string &name) {
    if (name == "DEBUG") return LogLevel::Debug;
    if (name == "WARN" || name == "WARNING") return LogLevel::Warning;
    if (name == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

const char *logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void Logger::init(const std::string &filePath, LogLevel level, std::FILE *console) {
    std::lock_guard<std::mutex> lk(mtx_);
    level_ = level;
    console_ = console ? console : stdout;
    if (out_.is_open()) out_.close();
    if (!filePath.empty()) {
        std::filesystem::path p(filePath);
        std::error_code ec;
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
        out_.open(filePath, std::ios::app);
        if (!out_.is_open()) {
            std::fprintf(console_, "Logger: cannot open log file %s, logging to console only\n",
                         filePath.c_str());
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
    std::fflush(console_);
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lk(mtx_);
    return level_;
}

std::string Logger::timeStamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t itt = system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&itt, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::log(LogLevel level, const std::string &msg) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (level < level_) return;
    std::ostringstream oss;
    oss << "[" << timeStamp() << "] [" << logLevelName(level) << "] " << msg << "\n";
    const std::string outStr = oss.str();
    std::fwrite(outStr.data(), 1, outStr.size(), console_);
    std::fflush(console_);
    if (out_.is_open()) {
        out_ << outStr;
        out_.flush();
    }
}

void Logger::debug(const std::string &msg) { log(LogLevel::Debug, msg); }
void Logger::info(const std::string &msg)  { log(LogLevel::Info, msg); }
void Logger::warn(const std::string &msg)  { log(LogLevel::Warning, msg); }
void Logger::error(const std::string &msg) { log(LogLevel::Error, msg); }

} // namespace util
