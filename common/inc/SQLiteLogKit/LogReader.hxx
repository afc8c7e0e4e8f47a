#pragma once

#include "LogEntry.hxx"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SQLiteLogKit {

    class ConnectionGuard;
    class Statement;

    struct LogFilter {
        std::optional<LogLevel> min_level;
        std::optional<LogLevel> max_level;
        std::optional<std::string> category;
        std::string search_text;           // substring of the rendered message
        std::optional<Timestamp> since;    // inclusive
        std::optional<Timestamp> until;    // exclusive
    };

    struct Page {
        std::int64_t offset = 0;
        std::int64_t limit = -1; // negative: no limit
    };

    // Read-only view of a log database. Never writes.
    class LogReader {
    public:
        explicit LogReader(std::shared_ptr<ConnectionGuard> connection);

        [[nodiscard]] std::int64_t entry_count() const;
        [[nodiscard]] std::uintmax_t database_file_size() const;

        // Oldest first (DbId order).
        [[nodiscard]] std::vector<LogEntry> all_entries() const;
        [[nodiscard]] std::vector<LogEntry> entries(const LogFilter& filter, const Page& page = {}) const;
        // Newest first.
        [[nodiscard]] std::vector<LogEntry> recent_entries(std::int64_t max_count) const;
        // Rows whose Properties JSON has key equal to value (scalars only).
        [[nodiscard]] std::vector<LogEntry> entries_by_property(const std::string& key,
                                                                const nlohmann::json& value) const;

        // Decodes the current row of a statement built from SchemaCatalog::build_select_statement().
        // Malformed optional fields decode to empty values rather than failing.
        static LogEntry decode_row(const Statement& row);

    private:
        std::shared_ptr<ConnectionGuard> connection_;
    };

} // namespace SQLiteLogKit
