#include "storage/Database.hpp"
#include "utils/Errors.hpp"
#include <spdlog/spdlog.h>

namespace Pequod {

static void throwIfError(int rc, sqlite3* db, const std::string& action) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return;
    std::string message = action + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) throw ReferentialError(message);
    throw StorageError(message);
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    throwIfError(rc, db, "Failed to prepare statement");
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, std::nullptr_t) {
    throwIfError(sqlite3_bind_null(stmt_, index), db_, "Failed to bind null");
}

void Statement::bind(int index, int value) {
    throwIfError(sqlite3_bind_int(stmt_, index, value), db_, "Failed to bind int");
}

void Statement::bind(int index, std::int64_t value) {
    throwIfError(sqlite3_bind_int64(stmt_, index, value), db_, "Failed to bind int64");
}

void Statement::bind(int index, bool value) {
    bind(index, value ? 1 : 0);
}

void Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    throwIfError(rc, db_, "Failed to bind string");
}

void Statement::bind(int index, const char* value) {
    bind(index, std::string(value));
}

void Statement::bind(int index, const std::optional<std::int64_t>& value) {
    if (value) bind(index, *value);
    else bind(index, nullptr);
}

void Statement::bind(int index, const std::optional<std::string>& value) {
    if (value) bind(index, *value);
    else bind(index, nullptr);
}

void Statement::execute() {
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throwIfError(rc, db_, "Failed to execute statement");
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throwIfError(rc, db_, "Failed to step statement");
    return false;
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt_, column));
}

std::optional<std::int64_t> Statement::getOptionalInt64(int column) const {
    if (isNull(column)) return std::nullopt;
    return getInt64(column);
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column)) return std::nullopt;
    return getString(column);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::Database(const std::string& path) : db_(nullptr) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "Failed to open database " + path + ": " +
                              (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::execute(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) throw ReferentialError(message);
        throw StorageError(message);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

std::int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

Transaction::Transaction(Database& db) : db_(db), done_(false) {
    db_.execute("BEGIN IMMEDIATE");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::error("Rollback failed: {}", err ? err : "unknown error");
    }
    sqlite3_free(err);
}

void Transaction::commit() {
    db_.execute("COMMIT");
    done_ = true;
}

}
