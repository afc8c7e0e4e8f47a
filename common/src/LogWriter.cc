#include "SQLiteLogKit/LogWriter.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

namespace SQLiteLogKit {

    std::string to_column_json(const nlohmann::json& value) {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    LogWriter::LogWriter(std::shared_ptr<ConnectionGuard> connection)
        : connection_(std::move(connection)), insert_sql_(SchemaCatalog::build_insert_statement()) {}

    void LogWriter::bind_entry(Statement& insert, const LogEntry& entry) {
        for (const auto& column : SchemaCatalog::columns()) {
            if (!column.insertable) continue;
            const int idx = SchemaCatalog::insert_ordinal(column.id);
            switch (column.id) {
                case Column::Category:
                    insert.bind(idx, entry.category);
                    break;
                case Column::EventId:
                    insert.bind(idx, static_cast<std::int64_t>(entry.event_id));
                    break;
                case Column::EventName:
                    insert.bind(idx, entry.event_name);
                    break;
                case Column::Timestamp:
                    insert.bind(idx, format_timestamp(entry.timestamp));
                    break;
                case Column::Level:
                    insert.bind(idx, static_cast<std::int64_t>(entry.level));
                    break;
                case Column::ThreadId:
                    insert.bind(idx, entry.thread_id);
                    break;
                case Column::MessageTemplate:
                    insert.bind(idx, entry.message_template);
                    break;
                case Column::Properties:
                    insert.bind(idx, to_column_json(entry.properties.is_null() ? nlohmann::json::object()
                                                                               : entry.properties));
                    break;
                case Column::RenderedMessage:
                    insert.bind(idx, entry.rendered_message);
                    break;
                case Column::ExceptionJson:
                    if (entry.exception) insert.bind(idx, ExceptionCodec::encode(*entry.exception));
                    else insert.bind_null(idx);
                    break;
                case Column::ScopesJson:
                    if (entry.scopes && !entry.scopes->empty()) insert.bind(idx, to_column_json(*entry.scopes));
                    else insert.bind_null(idx);
                    break;
                case Column::DbId:
                    break;
            }
        }
    }

    void LogWriter::write_batch(const std::vector<LogEntry>& entries) {
        if (entries.empty()) return;

        const auto lease = connection_->acquire();
        Transaction tx(lease.db());
        {
            Statement insert(lease.db(), insert_sql_);
            for (const auto& entry : entries) {
                bind_entry(insert, entry);
                insert.execute();
                insert.reset();
            }
        }
        tx.commit();
    }

} // namespace SQLiteLogKit
