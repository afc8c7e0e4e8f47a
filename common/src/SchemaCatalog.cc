#include "SQLiteLogKit/SchemaCatalog.hxx"

#include <stdexcept>

namespace SQLiteLogKit {

    namespace {
        constexpr std::array<ColumnDescriptor, SchemaCatalog::kColumnCount> kColumns = {{
            {Column::DbId,            "DbId",            "INTEGER PRIMARY KEY AUTOINCREMENT", false, true},
            {Column::Category,        "Category",        "TEXT",    true, false},
            {Column::EventId,         "EventId",         "INTEGER", true, false},
            {Column::EventName,       "EventName",       "TEXT",    true, false},
            {Column::Timestamp,       "Timestamp",       "TEXT",    true, false},
            {Column::Level,           "Level",           "INTEGER", true, false},
            {Column::ThreadId,        "ThreadId",        "INTEGER", true, false},
            {Column::MessageTemplate, "MessageTemplate", "TEXT",    true, false},
            {Column::Properties,      "Properties",      "TEXT",    true, false},
            {Column::RenderedMessage, "RenderedMessage", "TEXT",    true, false},
            {Column::ExceptionJson,   "ExceptionJson",   "TEXT",    true, false},
            {Column::ScopesJson,      "ScopesJson",      "TEXT",    true, false},
        }};

        std::string join(const std::vector<std::string>& parts, std::string_view sep) {
            std::string out;
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i) out += sep;
                out += parts[i];
            }
            return out;
        }
    }

    const std::array<ColumnDescriptor, SchemaCatalog::kColumnCount>& SchemaCatalog::columns() {
        return kColumns;
    }

    const ColumnDescriptor& SchemaCatalog::descriptor(const Column column) {
        for (const auto& c : kColumns) {
            if (c.id == column) return c;
        }
        throw std::out_of_range("column not declared in schema catalog");
    }

    std::vector<std::string> SchemaCatalog::all_column_names() {
        std::vector<std::string> names;
        names.reserve(kColumns.size());
        for (const auto& c : kColumns) names.emplace_back(c.name);
        return names;
    }

    std::vector<std::string> SchemaCatalog::insertable_column_names() {
        std::vector<std::string> names;
        for (const auto& c : kColumns) {
            if (c.insertable) names.emplace_back(c.name);
        }
        return names;
    }

    int SchemaCatalog::ordinal(const Column column) {
        for (size_t i = 0; i < kColumns.size(); ++i) {
            if (kColumns[i].id == column) return static_cast<int>(i);
        }
        throw std::out_of_range("column not declared in schema catalog");
    }

    int SchemaCatalog::insert_ordinal(const Column column) {
        int index = 0;
        for (const auto& c : kColumns) {
            if (!c.insertable) continue;
            ++index;
            if (c.id == column) return index;
        }
        return 0;
    }

    std::string SchemaCatalog::build_create_statement() {
        std::vector<std::string> defs;
        for (const auto& c : kColumns) {
            defs.push_back(std::string(c.name) + " " + std::string(c.sql_type));
        }
        const std::string table(kTableName);
        const std::string ts(name_of(Column::Timestamp));
        return "CREATE TABLE IF NOT EXISTS " + table + " (" + join(defs, ", ") + ");"
               " CREATE INDEX IF NOT EXISTS idx_" + table + "_" + ts + " ON " + table + "(" + ts + ");";
    }

    std::string SchemaCatalog::build_insert_statement() {
        const auto names = insertable_column_names();
        std::vector<std::string> params(names.size(), "?");
        return "INSERT INTO " + std::string(kTableName) + " (" + join(names, ", ") +
               ") VALUES (" + join(params, ", ") + ")";
    }

    std::string SchemaCatalog::build_select_statement() {
        return "SELECT " + join(all_column_names(), ", ") + " FROM " + std::string(kTableName);
    }

    std::string SchemaCatalog::versioned_file_name(std::string_view stem) {
        return std::string(stem) + "_V" + std::to_string(kSchemaVersion) + ".db";
    }

} // namespace SQLiteLogKit
