#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace Pequod {

// RAII wrapper around a prepared statement. Failures throw StorageError,
// foreign key violations throw ReferentialError.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, std::nullptr_t);
    void bind(int index, int value);
    void bind(int index, std::int64_t value);
    void bind(int index, bool value);
    void bind(int index, const std::string& value);
    void bind(int index, const char* value);
    void bind(int index, const std::optional<std::int64_t>& value);
    void bind(int index, const std::optional<std::string>& value);

    template <typename... Args>
    void bindAll(Args&&... args) {
        bindHelper(1, std::forward<Args>(args)...);
    }

    // Runs a statement that returns no rows.
    void execute();
    // True while a row is available.
    bool step();
    void reset();

    std::int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::optional<std::int64_t> getOptionalInt64(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    bool isNull(int column) const;

private:
    template <typename T, typename... Rest>
    void bindHelper(int index, T&& value, Rest&&... rest) {
        bind(index, std::forward<T>(value));
        if constexpr (sizeof...(rest) > 0) {
            bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class Database {
public:
    // Opens or creates the file; ":memory:" gives a private in-memory store.
    explicit Database(const std::string& path);
    ~Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void execute(const std::string& sql);
    Statement prepare(const std::string& sql);
    std::int64_t lastInsertRowId() const;
    int changes() const;
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_;
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_;
};

}
