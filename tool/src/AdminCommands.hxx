#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace SQLiteLogKit::admin {

    // Largest DAYS accepted by purge-older.
    constexpr std::int64_t kMaxPurgeDays = 100 * 366;

    void print_usage(std::ostream& err);

    /// Runs one sqlitelogkit-admin command. args is argv without the program name:
    /// <database> <command> [args]. Results go to out, problems to err.
    /// Returns the process exit code: 0 ok, 1 failure, 2 bad usage. Storage errors propagate.
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace SQLiteLogKit::admin
