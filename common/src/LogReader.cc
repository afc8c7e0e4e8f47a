#include "SQLiteLogKit/LogReader.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/LogWriter.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include <sqlite3.h>

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace SQLiteLogKit {

    namespace {
        std::string column(const Column c) { return std::string(SchemaCatalog::name_of(c)); }

        nlohmann::json parse_object(const std::optional<std::string>& text) {
            if (!text || text->empty()) return nlohmann::json::object();
            auto parsed = nlohmann::json::parse(*text, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) return nlohmann::json::object();
            return parsed;
        }

        std::optional<nlohmann::json> parse_optional_object(const std::optional<std::string>& text) {
            if (!text || text->empty()) return std::nullopt;
            auto parsed = nlohmann::json::parse(*text, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
            return parsed;
        }

        using Binder = std::function<void(Statement&)>;

        std::vector<LogEntry> run_select(ConnectionGuard& connection, const std::string& sql, const Binder& bind) {
            std::vector<LogEntry> res;
            const auto lease = connection.acquire_reader();
            Statement stmt(lease.db(), sql);
            if (bind) bind(stmt);
            while (stmt.step()) {
                res.push_back(LogReader::decode_row(stmt));
            }
            return res;
        }
    }

    LogReader::LogReader(std::shared_ptr<ConnectionGuard> connection) : connection_(std::move(connection)) {}

    std::int64_t LogReader::entry_count() const {
        const auto lease = connection_->acquire_reader();
        Statement stmt(lease.db(), "SELECT COUNT(*) FROM " + std::string(SchemaCatalog::kTableName));
        return stmt.step() ? stmt.column_int64(0) : 0;
    }

    std::uintmax_t LogReader::database_file_size() const {
        return connection_->database_file_size();
    }

    std::vector<LogEntry> LogReader::all_entries() const {
        return run_select(*connection_, SchemaCatalog::build_select_statement() + " ORDER BY " +
                          column(Column::DbId), {});
    }

    std::vector<LogEntry> LogReader::entries(const LogFilter& filter, const Page& page) const {
        std::string sql = SchemaCatalog::build_select_statement() + " WHERE 1=1";
        if (filter.min_level) sql += " AND " + column(Column::Level) + " >= ?";
        if (filter.max_level) sql += " AND " + column(Column::Level) + " <= ?";
        if (filter.category) sql += " AND " + column(Column::Category) + " = ?";
        if (!filter.search_text.empty()) sql += " AND " + column(Column::RenderedMessage) + " LIKE ?";
        if (filter.since) sql += " AND " + column(Column::Timestamp) + " >= ?";
        if (filter.until) sql += " AND " + column(Column::Timestamp) + " < ?";
        sql += " ORDER BY " + column(Column::DbId) + " LIMIT ? OFFSET ?";

        return run_select(*connection_, sql, [&filter, &page](Statement& stmt) {
            int idx = 1;
            if (filter.min_level) stmt.bind(idx++, static_cast<std::int64_t>(*filter.min_level));
            if (filter.max_level) stmt.bind(idx++, static_cast<std::int64_t>(*filter.max_level));
            if (filter.category) stmt.bind(idx++, *filter.category);
            if (!filter.search_text.empty()) stmt.bind(idx++, "%" + filter.search_text + "%");
            if (filter.since) stmt.bind(idx++, format_timestamp(storage_ceil(*filter.since)));
            if (filter.until) stmt.bind(idx++, format_timestamp(storage_ceil(*filter.until)));
            stmt.bind(idx++, page.limit < 0 ? std::int64_t{-1} : page.limit);
            stmt.bind(idx++, std::max<std::int64_t>(0, page.offset));
        });
    }

    std::vector<LogEntry> LogReader::recent_entries(const std::int64_t max_count) const {
        if (max_count <= 0) throw std::invalid_argument("max_count must be greater than zero");
        return run_select(*connection_, SchemaCatalog::build_select_statement() + " ORDER BY " +
                          column(Column::DbId) + " DESC LIMIT ?",
                          [max_count](Statement& stmt) { stmt.bind(1, max_count); });
    }

    std::vector<LogEntry> LogReader::entries_by_property(const std::string& key, const nlohmann::json& value) const {
        if (key.find('"') != std::string::npos) return {};
        const std::string path = "$.\"" + key + "\"";
        const std::string sql = SchemaCatalog::build_select_statement() + " WHERE json_extract(" +
                                column(Column::Properties) + ", ?) = ? ORDER BY " + column(Column::DbId);

        return run_select(*connection_, sql, [&path, &value](Statement& stmt) {
            stmt.bind(1, path);
            if (value.is_boolean()) stmt.bind(2, static_cast<std::int64_t>(value.get<bool>() ? 1 : 0));
            else if (value.is_number_integer()) stmt.bind(2, value.get<std::int64_t>());
            else if (value.is_number_float()) stmt.bind(2, value.get<double>());
            else if (value.is_string()) stmt.bind(2, value.get<std::string>());
            else if (value.is_null()) stmt.bind_null(2);
            else stmt.bind(2, to_column_json(value));
        });
    }

    LogEntry LogReader::decode_row(const Statement& row) {
        const auto at = [](const Column c) { return SchemaCatalog::ordinal(c); };

        LogEntry entry;
        entry.db_id = row.column_int64(at(Column::DbId));
        entry.category = row.column_text(at(Column::Category));
        entry.event_id = static_cast<int>(row.column_int64(at(Column::EventId)));
        entry.event_name = row.column_optional_text(at(Column::EventName));
        entry.timestamp = parse_timestamp(row.column_text(at(Column::Timestamp))).value_or(Timestamp{});
        entry.level = row.column_type(at(Column::Level)) == SQLITE_INTEGER
                          ? level_from_int(row.column_int64(at(Column::Level)))
                          : LogLevel::None;
        entry.thread_id = row.column_int64(at(Column::ThreadId));
        entry.message_template = row.column_text(at(Column::MessageTemplate));
        entry.rendered_message = row.column_text(at(Column::RenderedMessage));
        entry.properties = parse_object(row.column_optional_text(at(Column::Properties)));
        entry.scopes = parse_optional_object(row.column_optional_text(at(Column::ScopesJson)));

        if (const auto text = row.column_optional_text(at(Column::ExceptionJson))) {
            if (auto ex = ExceptionCodec::decode(*text)) {
                entry.exception = std::make_shared<const SerializedException>(std::move(*ex));
            }
        }
        return entry;
    }

} // namespace SQLiteLogKit
