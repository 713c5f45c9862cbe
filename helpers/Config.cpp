#include "Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace {

// empty values count as unset unless allowEmpty
bool readEnv(const char* name, std::string& out, bool allowEmpty = false) {
    const char* v = std::getenv(name);
    if (!v) return false;
    std::string s = v;
    if (s.empty() && !allowEmpty) return false;
    out = s;
    return true;
}

}  // namespace

Config::Config()
    : dbPath(defaultDbPath()) {}

std::string Config::defaultDbPath() {
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "expenses.db").string();
}

Config Config::fromEnvironment() {
    Config cfg;
    std::string s;

    if (readEnv("EXPENSE_DB_PATH", s)) cfg.dbPath = s;
    if (readEnv("EXPENSE_CATEGORIES_PATH", s)) cfg.categoriesPath = s;
    if (readEnv("EXPENSE_HOST", s)) cfg.host = s;

    if (readEnv("EXPENSE_TRANSPORT", s)) {
        cfg.transport = (s == "stdio") ? Transport::Stdio : Transport::Http;
    }

    if (readEnv("EXPENSE_PORT", s)) {
        char* end = nullptr;
        long port = std::strtol(s.c_str(), &end, 10);
        if (end && *end == '\0' && port > 0 && port <= 65535) {
            cfg.port = static_cast<int>(port);
        }
    }

    if (readEnv("LOG_FILE", s, /*allowEmpty*/ true)) cfg.logFile = s;
    if (readEnv("LOG_LEVEL", s)) cfg.logLevel = util::parseLogLevel(s);

    return cfg;
}

const char* transportName(Transport t) {
    return t == Transport::Stdio ? "stdio" : "http";
}
