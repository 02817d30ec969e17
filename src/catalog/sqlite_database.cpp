#include <catalog_graph/catalog/sqlite_database.hpp>

#include <catalog_graph/core/log.hpp>

#include <sqlite3.h>

namespace catalog_graph {

namespace {

Error MakeSqliteError(sqlite3* db, const std::string& operation,
                      const std::string& subject, int rc) {
    std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    auto category = (rc == SQLITE_CANTOPEN || rc == SQLITE_NOTADB ||
                     rc == SQLITE_BUSY || rc == SQLITE_LOCKED ||
                     rc == SQLITE_IOERR)
                        ? ErrorCategory::CatalogUnavailable
                        : ErrorCategory::CatalogIntegrity;
    return MakeError(category, operation, subject, message);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SqliteStatement
// ---------------------------------------------------------------------------

SqliteStatement::~SqliteStatement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<bool, Error> SqliteStatement::Step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::Ok(false);
    }
    return Result<bool, Error>::Err(MakeSqliteError(
        sqlite3_db_handle(stmt_), "SqliteStatement::Step",
        sqlite3_sql(stmt_) != nullptr ? sqlite3_sql(stmt_) : "", rc));
}

bool SqliteStatement::IsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string SqliteStatement::Text(int col) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    return text != nullptr ? std::string(text) : std::string();
}

std::optional<std::string> SqliteStatement::OptionalText(int col) const {
    if (IsNull(col)) return std::nullopt;
    return Text(col);
}

int64_t SqliteStatement::Int(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double SqliteStatement::Real(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::optional<double> SqliteStatement::OptionalReal(int col) const {
    if (IsNull(col)) return std::nullopt;
    return Real(col);
}

// ---------------------------------------------------------------------------
// SqliteDatabase
// ---------------------------------------------------------------------------

Result<std::unique_ptr<SqliteDatabase>, Error> SqliteDatabase::Open(
    const std::string& path, bool read_only) {
    using R = Result<std::unique_ptr<SqliteDatabase>, Error>;

    sqlite3* db = nullptr;
    int flags = read_only ? SQLITE_OPEN_READONLY
                          : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto err = MakeSqliteError(db, "SqliteDatabase::Open", path, rc);
        err.category = ErrorCategory::CatalogUnavailable;
        sqlite3_close(db);
        return R::Err(std::move(err));
    }
    LogDebug("catalog", "opened " + path + (read_only ? " (read-only)" : ""));
    return R::Ok(std::unique_ptr<SqliteDatabase>(new SqliteDatabase(db, path)));
}

Result<std::unique_ptr<SqliteDatabase>, Error> SqliteDatabase::OpenInMemory() {
    return Open(":memory:", false);
}

SqliteDatabase::~SqliteDatabase() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

Result<SqliteStatement, Error> SqliteDatabase::Prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<SqliteStatement, Error>::Err(
            MakeSqliteError(db_, "SqliteDatabase::Prepare", sql, rc));
    }
    return Result<SqliteStatement, Error>::Ok(SqliteStatement(stmt));
}

Result<void, Error> SqliteDatabase::Exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        return Result<void, Error>::Err(MakeError(
            ErrorCategory::CatalogIntegrity, "SqliteDatabase::Exec", path_, message));
    }
    return Result<void, Error>::Ok();
}

Result<bool, Error> SqliteDatabase::TableExists(const std::string& table) {
    sqlite3_stmt* raw = nullptr;
    const char* sql =
        "SELECT 1 FROM sqlite_master WHERE type IN ('table', 'view') AND name = ?";
    int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        return Result<bool, Error>::Err(
            MakeSqliteError(db_, "SqliteDatabase::TableExists", table, rc));
    }
    SqliteStatement stmt(raw);
    sqlite3_bind_text(raw, 1, table.c_str(), -1, SQLITE_TRANSIENT);
    return stmt.Step();
}

Result<std::set<std::string>, Error> SqliteDatabase::Columns(const std::string& table) {
    // PRAGMA arguments cannot be bound; quote the identifier instead.
    std::string quoted = "\"";
    for (char c : table) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += "\"";

    auto stmt = Prepare("PRAGMA table_info(" + quoted + ")");
    if (stmt.IsErr()) {
        return Result<std::set<std::string>, Error>::Err(std::move(stmt).Error());
    }
    auto statement = std::move(stmt).Value();

    std::set<std::string> columns;
    while (true) {
        auto step = statement.Step();
        if (step.IsErr()) {
            return Result<std::set<std::string>, Error>::Err(step.Error());
        }
        if (!step.Value()) break;
        columns.insert(statement.Text(1));  // cid, name, type, notnull, dflt, pk
    }
    return Result<std::set<std::string>, Error>::Ok(std::move(columns));
}

} // namespace catalog_graph
