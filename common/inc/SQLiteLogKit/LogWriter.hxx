#pragma once

#include "LogEntry.hxx"

#include <memory>
#include <string>
#include <vector>

namespace SQLiteLogKit {

    class ConnectionGuard;
    class Statement;

    class LogWriter {
    public:
        explicit LogWriter(std::shared_ptr<ConnectionGuard> connection);

        // All entries or none: one transaction under the writer lease. Throws StorageError.
        void write_batch(const std::vector<LogEntry>& entries);

        // Binds every insertable catalog column of entry to an INSERT prepared from
        // SchemaCatalog::build_insert_statement().
        static void bind_entry(Statement& insert, const LogEntry& entry);

    private:
        std::shared_ptr<ConnectionGuard> connection_;
        std::string insert_sql_;
    };

    // JSON text as stored in the Properties / ScopesJson columns; invalid UTF-8 is replaced.
    [[nodiscard]] std::string to_column_json(const nlohmann::json& value);

} // namespace SQLiteLogKit
