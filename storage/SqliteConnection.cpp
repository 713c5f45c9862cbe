#include "SqliteConnection.hpp"

#include <utility>

namespace {

StoreError makeError(sqlite3* db, int rc, const std::string& context) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return StoreError(classifySqliteCode(rc), context + ": " + detail);
}

}  // namespace

const char* storeErrorKindName(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::PermissionDenied:    return "permission_denied";
        case StoreErrorKind::NotFound:            return "not_found";
        case StoreErrorKind::ConstraintViolation: return "constraint_violation";
        case StoreErrorKind::Other:               return "other";
    }
    return "other";
}

StoreErrorKind classifySqliteCode(int code) {
    switch (code & 0xff) {
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_CANTOPEN:
            return StoreErrorKind::PermissionDenied;
        case SQLITE_CONSTRAINT:
            return StoreErrorKind::ConstraintViolation;
        case SQLITE_NOTFOUND:
            return StoreErrorKind::NotFound;
        default:
            return StoreErrorKind::Other;
    }
}

// ----------------------
// Statement
// ----------------------

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw makeError(db_, rc, "prepare failed");
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::check(int rc, const char* what) const {
    if (rc != SQLITE_OK) throw makeError(db_, rc, what);
}

void Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT),
          "bind text failed");
}

void Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind real failed");
}

void Statement::bind(int index, sqlite3_int64 value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind integer failed");
}

void Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind null failed");
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw makeError(db_, rc, "step failed");
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::text(int column) const {
    const unsigned char* p = sqlite3_column_text(stmt_, column);
    if (!p) return {};
    return std::string(reinterpret_cast<const char*>(p),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

double Statement::real(int column) const {
    return sqlite3_column_double(stmt_, column);
}

sqlite3_int64 Statement::integer(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

// ----------------------
// SqliteConnection
// ----------------------

SqliteConnection::SqliteConnection(const std::string& path)
    : path_(path) {
    // "file:" URIs are honoured, e.g. file:/srv/expenses.db?mode=ro
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        StoreError err = makeError(db_, rc, "cannot open database " + path_);
        // sqlite3_open_v2 hands back a handle even on failure
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw err;
    }
}

SqliteConnection::~SqliteConnection() {
    if (db_) sqlite3_close(db_);
}

void SqliteConnection::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string e = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StoreError(classifySqliteCode(rc), "exec failed: " + e);
    }
}

Statement SqliteConnection::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

sqlite3_int64 SqliteConnection::lastInsertId() const {
    return sqlite3_last_insert_rowid(db_);
}

int SqliteConnection::changes() const {
    return sqlite3_changes(db_);
}
