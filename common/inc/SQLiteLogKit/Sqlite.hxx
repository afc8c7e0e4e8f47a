#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace SQLiteLogKit {

    // Throws StorageError carrying sqlite3_errmsg(db) when rc is not SQLITE_OK/ROW/DONE.
    void check_sqlite(int rc, sqlite3* db, std::string_view what);

    // Runs one or more statements without results.
    void exec_sql(sqlite3* db, const std::string& sql);

    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql);
        ~Statement();

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int index, std::int64_t value);
        void bind(int index, double value);
        void bind(int index, const std::string& value);
        void bind(int index, const std::optional<std::string>& value);
        void bind_null(int index);

        // true while a row is available; false once done.
        bool step();
        // Steps a statement that returns no rows; returns sqlite3_changes.
        int execute();
        void reset();

        [[nodiscard]] bool is_null(int col) const;
        // SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB or SQLITE_NULL.
        [[nodiscard]] int column_type(int col) const;
        [[nodiscard]] std::int64_t column_int64(int col) const;
        [[nodiscard]] std::string column_text(int col) const;
        [[nodiscard]] std::optional<std::string> column_optional_text(int col) const;

        [[nodiscard]] sqlite3_stmt* handle() const { return stmt_; }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    // BEGIN IMMEDIATE on construction; rolls back in the destructor unless committed.
    class Transaction {
    public:
        explicit Transaction(sqlite3* db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        sqlite3* db_;
        bool done_ = false;
    };

} // namespace SQLiteLogKit
