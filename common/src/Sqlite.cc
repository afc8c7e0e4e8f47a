#include "SQLiteLogKit/Sqlite.hxx"
#include "SQLiteLogKit/Errors.hxx"

#include <sqlite3.h>

namespace SQLiteLogKit {

    void check_sqlite(const int rc, sqlite3* db, std::string_view what) {
        if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
        std::string msg(what);
        msg += ": ";
        msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        throw StorageError(msg, rc);
    }

    void exec_sql(sqlite3* db, const std::string& sql) {
        char* err = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = "exec failed: ";
            msg += err ? err : sqlite3_errstr(rc);
            sqlite3_free(err);
            throw StorageError(msg, rc);
        }
    }

    Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
        check_sqlite(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr), db_, "prepare");
    }

    Statement::~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void Statement::bind(const int index, const std::int64_t value) {
        check_sqlite(sqlite3_bind_int64(stmt_, index, value), db_, "bind");
    }

    void Statement::bind(const int index, const double value) {
        check_sqlite(sqlite3_bind_double(stmt_, index, value), db_, "bind");
    }

    void Statement::bind(const int index, const std::string& value) {
        check_sqlite(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT), db_, "bind");
    }

    void Statement::bind(const int index, const std::optional<std::string>& value) {
        if (value) bind(index, *value);
        else bind_null(index);
    }

    void Statement::bind_null(const int index) {
        check_sqlite(sqlite3_bind_null(stmt_, index), db_, "bind");
    }

    bool Statement::step() {
        const int rc = sqlite3_step(stmt_);
        check_sqlite(rc, db_, "step");
        return rc == SQLITE_ROW;
    }

    int Statement::execute() {
        while (step()) {}
        return sqlite3_changes(db_);
    }

    void Statement::reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool Statement::is_null(const int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    int Statement::column_type(const int col) const {
        return sqlite3_column_type(stmt_, col);
    }

    std::int64_t Statement::column_int64(const int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    std::string Statement::column_text(const int col) const {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        if (!text) return {};
        return {text, static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
    }

    std::optional<std::string> Statement::column_optional_text(const int col) const {
        if (is_null(col)) return std::nullopt;
        return column_text(col);
    }

    Transaction::Transaction(sqlite3* db) : db_(db) {
        exec_sql(db_, "BEGIN IMMEDIATE");
    }

    Transaction::~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }

    void Transaction::commit() {
        exec_sql(db_, "COMMIT");
        done_ = true;
    }

} // namespace SQLiteLogKit
