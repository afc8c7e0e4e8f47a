#include "AdminCommands.hxx"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string_view>
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"
#include "SQLiteLogKit/Exporter.hxx"
#include "SQLiteLogKit/Housekeeper.hxx"
#include "SQLiteLogKit/LogReader.hxx"

namespace SQLiteLogKit::admin {

    namespace {
        bool parse_int(const std::string_view text, std::int64_t& out) {
            const auto* end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, out);
            return ec == std::errc() && ptr == end;
        }
    }

    void print_usage(std::ostream& err) {
        err << "usage: sqlitelogkit-admin <database> <command> [args]\n"
               "  count                 number of stored entries\n"
               "  size                  database size in bytes (including the WAL)\n"
               "  tail N                the N most recent entries, oldest first\n"
               "  purge-all             delete every entry\n"
               "  purge-older DAYS      delete entries older than DAYS days\n"
               "  cap N                 keep only the N newest entries\n"
               "  export DEST ID...     copy entries by id into DEST" << std::endl;
    }

    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
        if (args.size() < 2) {
            print_usage(err);
            return 2;
        }
        const std::filesystem::path db_path = args[0];
        const std::string& command = args[1];

        if (!std::filesystem::exists(db_path)) {
            err << "No such database: " << db_path.string() << std::endl;
            return 1;
        }

        auto diagnostics = make_diagnostics_logger("sqlitelogkit-admin");

        if (command == "export") {
            if (args.size() < 4) {
                print_usage(err);
                return 2;
            }
            std::vector<std::int64_t> ids;
            for (size_t i = 3; i < args.size(); ++i) {
                std::int64_t id = 0;
                if (!parse_int(args[i], id)) {
                    err << "Invalid id: " << args[i] << std::endl;
                    return 2;
                }
                ids.push_back(id);
            }
            const auto copied = Exporter::export_entries(db_path, args[2], ids, diagnostics);
            out << "Exported " << copied << " entries to " << args[2] << std::endl;
            return 0;
        }

        auto connection = std::make_shared<ConnectionGuard>(db_path, diagnostics);
        const LogReader reader(connection);

        if (command == "count") {
            out << reader.entry_count() << std::endl;
            return 0;
        }
        if (command == "size") {
            out << reader.database_file_size() << std::endl;
            return 0;
        }

        std::int64_t number = 0;
        const bool needs_number = command == "tail" || command == "purge-older" || command == "cap";
        if (needs_number && (args.size() < 3 || !parse_int(args[2], number) || number < 0)) {
            print_usage(err);
            return 2;
        }
        if (command == "purge-older" && number > kMaxPurgeDays) {
            err << "DAYS must be at most " << kMaxPurgeDays << std::endl;
            return 2;
        }

        if (command == "tail") {
            if (number == 0) return 0;
            auto entries = reader.recent_entries(number);
            std::reverse(entries.begin(), entries.end());
            for (const auto& entry : entries) {
                out << entry.db_id << " " << entry.to_string() << std::endl;
            }
            return 0;
        }

        HouseKeepingOptions options;
        options.mode = HousekeepingMode::Manual;
        Housekeeper housekeeper(connection, options, diagnostics);

        int deleted = 0;
        if (command == "purge-all") {
            deleted = housekeeper.delete_all();
        } else if (command == "purge-older") {
            deleted = housekeeper.delete_older_than(Clock::now() - std::chrono::hours(24) * number);
        } else if (command == "cap") {
            deleted = housekeeper.delete_exceeding_count(number);
        } else {
            err << "Unknown command: " << command << std::endl;
            print_usage(err);
            return 2;
        }
        out << "Deleted " << deleted << " entries" << std::endl;
        return 0;
    }

} // namespace SQLiteLogKit::admin
