#include <cstdlib>

#include <gtest/gtest.h>

#include "helpers/Config.hpp"

namespace {

const char* const kVariables[] = {
    "EXPENSE_DB_PATH", "EXPENSE_CATEGORIES_PATH", "EXPENSE_TRANSPORT", "EXPENSE_HOST",
    "EXPENSE_PORT",    "LOG_FILE",                "LOG_LEVEL",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

private:
    static void clear() {
        for (const char* name : kVariables) ::unsetenv(name);
    }
};

}  // namespace

TEST_F(ConfigTest, Defaults) {
    Config cfg = Config::fromEnvironment();
    EXPECT_EQ(cfg.dbPath, Config::defaultDbPath());
    EXPECT_EQ(cfg.categoriesPath, "data/categories.json");
    EXPECT_EQ(cfg.transport, Transport::Http);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8000);
    EXPECT_EQ(cfg.logFile, "logs/server.log");
    EXPECT_EQ(cfg.logLevel, util::LogLevel::Info);
}

TEST_F(ConfigTest, DefaultDbLivesInTempDirectory) {
    EXPECT_NE(Config::defaultDbPath().find("expenses.db"), std::string::npos);
}

TEST_F(ConfigTest, Overrides) {
    ::setenv("EXPENSE_DB_PATH", "/var/lib/ledger/x.db", 1);
    ::setenv("EXPENSE_CATEGORIES_PATH", "/etc/ledger/categories.json", 1);
    ::setenv("EXPENSE_TRANSPORT", "stdio", 1);
    ::setenv("EXPENSE_HOST", "127.0.0.1", 1);
    ::setenv("EXPENSE_PORT", "9100", 1);
    ::setenv("LOG_FILE", "", 1);
    ::setenv("LOG_LEVEL", "DEBUG", 1);

    Config cfg = Config::fromEnvironment();
    EXPECT_EQ(cfg.dbPath, "/var/lib/ledger/x.db");
    EXPECT_EQ(cfg.categoriesPath, "/etc/ledger/categories.json");
    EXPECT_EQ(cfg.transport, Transport::Stdio);
    EXPECT_STREQ(transportName(cfg.transport), "stdio");
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.logFile, "");
    EXPECT_EQ(cfg.logLevel, util::LogLevel::Debug);
}

TEST_F(ConfigTest, InvalidPortKeepsDefault) {
    ::setenv("EXPENSE_PORT", "80a", 1);
    EXPECT_EQ(Config::fromEnvironment().port, 8000);

    ::setenv("EXPENSE_PORT", "70000", 1);
    EXPECT_EQ(Config::fromEnvironment().port, 8000);
}

TEST_F(ConfigTest, EmptyDbPathIsIgnored) {
    ::setenv("EXPENSE_DB_PATH", "", 1);
    EXPECT_EQ(Config::fromEnvironment().dbPath, Config::defaultDbPath());
}

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(util::parseLogLevel("DEBUG"), util::LogLevel::Debug);
    EXPECT_EQ(util::parseLogLevel("WARNING"), util::LogLevel::Warning);
    EXPECT_EQ(util::parseLogLevel("WARN"), util::LogLevel::Warning);
    EXPECT_EQ(util::parseLogLevel("ERROR"), util::LogLevel::Error);
    EXPECT_EQ(util::parseLogLevel("verbose"), util::LogLevel::Info);
    EXPECT_STREQ(util::logLevelName(util::LogLevel::Warning), "WARN");
}
