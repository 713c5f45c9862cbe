#ifndef EXPENSE_TEST_HELPERS_HPP
#define EXPENSE_TEST_HELPERS_HPP

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "helpers/Logger.hpp"

// Throwaway SQLite file under the system temp directory, removed (with its
// WAL/SHM side files) when the fixture is torn down.
class TempDbTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::init("", util::LogLevel::Error, stderr);

        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("expense_test_") + std::to_string(::getpid()) + "_" +
                           std::to_string(counter++) + "_" + (info ? info->name() : "db") + ".db";
        dbPath_ = (std::filesystem::temp_directory_path() / name).string();
        removeFiles();
    }

    void TearDown() override { removeFiles(); }

    const std::string& dbPath() const { return dbPath_; }

private:
    void removeFiles() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(dbPath_ + suffix, ec);
        }
    }

    std::string dbPath_;
};

#endif // EXPENSE_TEST_HELPERS_HPP
