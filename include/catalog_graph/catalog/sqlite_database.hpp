#pragma once

#include <catalog_graph/core/result.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace catalog_graph {

// ---------------------------------------------------------------------------
// SqliteStatement: RAII prepared statement. Finalized on destruction.
// ---------------------------------------------------------------------------
class SqliteStatement {
public:
    explicit SqliteStatement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept : stmt_(other.stmt_) {
        other.stmt_ = nullptr;
    }
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    /// Advance to the next row: true on a row, false when done.
    Result<bool, Error> Step();

    [[nodiscard]] bool IsNull(int col) const;
    [[nodiscard]] std::string Text(int col) const;
    [[nodiscard]] std::optional<std::string> OptionalText(int col) const;
    [[nodiscard]] int64_t Int(int col) const;
    [[nodiscard]] double Real(int col) const;
    [[nodiscard]] std::optional<double> OptionalReal(int col) const;

private:
    sqlite3_stmt* stmt_;
};

// ---------------------------------------------------------------------------
// SqliteDatabase: RAII connection. Closed on destruction.
// ---------------------------------------------------------------------------
class SqliteDatabase {
public:
    /// Open a database file. Read-only mode never creates the file.
    static Result<std::unique_ptr<SqliteDatabase>, Error> Open(
        const std::string& path, bool read_only);

    /// Private in-memory database (tests seed it with Exec).
    static Result<std::unique_ptr<SqliteDatabase>, Error> OpenInMemory();

    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    Result<SqliteStatement, Error> Prepare(const std::string& sql);

    /// Run one or more statements without results.
    Result<void, Error> Exec(const std::string& sql);

    Result<bool, Error> TableExists(const std::string& table);

    /// Column names of `table` via PRAGMA table_info (empty for no table).
    Result<std::set<std::string>, Error> Columns(const std::string& table);

    [[nodiscard]] const std::string& Path() const { return path_; }

private:
    SqliteDatabase(sqlite3* db, std::string path)
        : db_(db), path_(std::move(path)) {}

    sqlite3* db_;
    std::string path_;
};

} // namespace catalog_graph
