#ifndef EXPENSE_CONFIG_HPP
#define EXPENSE_CONFIG_HPP

#include <string>

#include "Logger.hpp"

enum class Transport { Http, Stdio };

// ----------------------
// Runtime settings, read once in main() and handed to each component.
//
//   EXPENSE_DB_PATH          <temp dir>/expenses.db
//   EXPENSE_CATEGORIES_PATH  data/categories.json
//   EXPENSE_TRANSPORT        http | stdio            (http)
//   EXPENSE_HOST             0.0.0.0
//   EXPENSE_PORT             8000
//   LOG_FILE                 logs/server.log ("" disables the file)
//   LOG_LEVEL                DEBUG | INFO | WARN | ERROR   (INFO)
// ----------------------
struct Config {
    std::string    dbPath;
    std::string    categoriesPath = "data/categories.json";
    Transport      transport      = Transport::Http;
    std::string    host           = "0.0.0.0";
    int            port           = 8000;
    std::string    logFile        = "logs/server.log";
    util::LogLevel logLevel       = util::LogLevel::Info;

    Config();

    static Config fromEnvironment();

    static std::string defaultDbPath();
};

const char* transportName(Transport t);

#endif // EXPENSE_CONFIG_HPP
