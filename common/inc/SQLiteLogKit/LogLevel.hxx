#pragma once

#include <string_view>

namespace SQLiteLogKit {

    enum class LogLevel {
        Trace = 0,       // Deep diagnostic detail
        Debug = 1,       // Development-time detail
        Information = 2, // Normal runtime events
        Warning = 3,     // Unexpected but handled
        Error = 4,       // Recoverable failures
        Critical = 5,    // Failures that stop the process
        None = 6         // Filtering sentinel; also the fallback for unknown stored values
    };

    [[nodiscard]] std::string_view to_string(LogLevel level);

    // Never throws: values outside [Trace, None] map to LogLevel::None.
    [[nodiscard]] LogLevel level_from_int(long long value);

    // Accepts the names returned by to_string (case-insensitive); None when unrecognized.
    [[nodiscard]] LogLevel level_from_string(std::string_view name);

} // namespace SQLiteLogKit
