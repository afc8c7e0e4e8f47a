#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace SQLiteLogKit {

    enum class Column {
        DbId,
        Category,
        EventId,
        EventName,
        Timestamp,
        Level,
        ThreadId,
        MessageTemplate,
        Properties,
        RenderedMessage,
        ExceptionJson,
        ScopesJson
    };

    struct ColumnDescriptor {
        Column id;
        std::string_view name;
        std::string_view sql_type;
        bool insertable;
        bool auto_generated;
    };

    // Every statement touching the log table is derived from this class.
    class SchemaCatalog {
    public:
        // Bump on any incompatible column change; it selects a new database file.
        static constexpr int kSchemaVersion = 1;
        static constexpr std::string_view kTableName = "LogEntry";
        static constexpr size_t kColumnCount = 12;

        static const std::array<ColumnDescriptor, kColumnCount>& columns();
        static const ColumnDescriptor& descriptor(Column column);
        static std::string_view name_of(Column column) { return descriptor(column).name; }

        static std::vector<std::string> all_column_names();
        static std::vector<std::string> insertable_column_names();

        // Position of column in all_column_names() / SELECT results.
        static int ordinal(Column column);
        // 1-based bind index of column in the INSERT statement, or 0 if not insertable.
        static int insert_ordinal(Column column);

        static std::string build_create_statement();
        static std::string build_insert_statement();
        static std::string build_select_statement();

        // "<stem>_V<kSchemaVersion>.db"
        static std::string versioned_file_name(std::string_view stem);
    };

} // namespace SQLiteLogKit
