#include "SQLiteLogKit/Exporter.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

namespace SQLiteLogKit {

    namespace {
        // Copies one column of the current source row into the insert, preserving its storage class.
        void copy_value(const Statement& from, const int col, Statement& to, const int idx) {
            switch (from.column_type(col)) {
                case SQLITE_NULL:
                    to.bind_null(idx);
                    break;
                case SQLITE_INTEGER:
                    to.bind(idx, from.column_int64(col));
                    break;
                case SQLITE_FLOAT:
                    to.bind(idx, sqlite3_column_double(from.handle(), col));
                    break;
                default:
                    to.bind(idx, from.column_text(col));
                    break;
            }
        }
    }

    size_t Exporter::export_entries(const std::filesystem::path& source,
                                    const std::filesystem::path& destination,
                                    const std::vector<std::int64_t>& ids,
                                    std::shared_ptr<spdlog::logger> diagnostics) {
        if (!std::filesystem::exists(source)) {
            throw std::invalid_argument("export source does not exist: " + source.string());
        }
        ConnectionGuard src(source, diagnostics);
        ConnectionGuard dst(destination, diagnostics);
        return export_entries(src, dst, ids);
    }

    size_t Exporter::export_entries(ConnectionGuard& source, ConnectionGuard& destination,
                                    const std::vector<std::int64_t>& ids) {
        const std::string table(SchemaCatalog::kTableName);
        const std::string id_column(SchemaCatalog::name_of(Column::DbId));
        const std::string insert_sql = SchemaCatalog::build_insert_statement();

        size_t copied = 0;
        for (size_t start = 0; start < ids.size(); start += kChunkSize) {
            const size_t count = std::min(kChunkSize, ids.size() - start);
            std::string placeholders;
            for (size_t i = 0; i < count; ++i) placeholders += i ? ",?" : "?";

            const auto read = source.acquire_reader();
            Statement select(read.db(), SchemaCatalog::build_select_statement() + " WHERE " + id_column +
                                        " IN (" + placeholders + ") ORDER BY " + id_column);
            for (size_t i = 0; i < count; ++i) select.bind(static_cast<int>(i + 1), ids[start + i]);

            const auto write = destination.acquire();
            Transaction tx(write.db());
            {
                Statement insert(write.db(), insert_sql);
                while (select.step()) {
                    for (const auto& column : SchemaCatalog::columns()) {
                        if (!column.insertable) continue;
                        copy_value(select, SchemaCatalog::ordinal(column.id),
                                   insert, SchemaCatalog::insert_ordinal(column.id));
                    }
                    insert.execute();
                    insert.reset();
                    ++copied;
                }
            }
            tx.commit();
        }
        return copied;
    }

} // namespace SQLiteLogKit
