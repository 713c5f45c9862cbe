#ifndef EXPENSE_SQLITE_CONNECTION_HPP
#define EXPENSE_SQLITE_CONNECTION_HPP

#include <sqlite3.h>

#include <stdexcept>
#include <string>

// ----------------------
// Error kinds surfaced by the storage layer
// ----------------------

enum class StoreErrorKind {
    PermissionDenied,     // file or directory not writable / openable
    NotFound,             // statement matched no row
    ConstraintViolation,
    Other
};

const char* storeErrorKindName(StoreErrorKind kind);

// Maps a (primary or extended) SQLite result code onto StoreErrorKind.
StoreErrorKind classifySqliteCode(int code);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    StoreErrorKind kind() const { return kind_; }

private:
    StoreErrorKind kind_;
};

// ----------------------
// Prepared statement; finalized on destruction.
// Bind indexes are 1-based, column indexes 0-based (as in sqlite3).
// ----------------------

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;

    void bind(int index, const std::string& value);
    void bind(int index, double value);
    void bind(int index, sqlite3_int64 value);
    void bindNull(int index);

    // true while a row is available, false once the statement is done
    bool step();

    bool          isNull(int column) const;
    std::string   text(int column) const;
    double        real(int column) const;
    sqlite3_int64 integer(int column) const;

private:
    sqlite3*      db_   = nullptr;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc, const char* what) const;
};

// ----------------------
// One open database handle. Closed on destruction, so every operation
// scopes its connection to a block.
// ----------------------

class SqliteConnection {
public:
    explicit SqliteConnection(const std::string& path);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    // Runs one or more statements without parameters (pragmas, DDL).
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    sqlite3_int64 lastInsertId() const;
    int           changes() const;

    const std::string& path() const { return path_; }

private:
    sqlite3*    db_ = nullptr;
    std::string path_;
};

#endif // EXPENSE_SQLITE_CONNECTION_HPP
