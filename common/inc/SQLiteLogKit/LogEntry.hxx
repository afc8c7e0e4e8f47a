#pragma once

#include "LogLevel.hxx"
#include "ExceptionCodec.hxx"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace SQLiteLogKit {

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    // Timestamps are stored with microsecond resolution.
    using StoragePrecision = std::chrono::microseconds;

    // Clock::now() truncated to StoragePrecision, so a stored entry compares exactly as it did in memory.
    [[nodiscard]] Timestamp current_timestamp();

    // Smallest storable time point not earlier than ts. A bound compared against stored
    // timestamps must be rounded this way for "< ts" and ">= ts" to stay exact.
    [[nodiscard]] Timestamp storage_ceil(Timestamp ts);

    struct EventId {
        int id = 0;
        std::optional<std::string> name;
    };

    struct LogEntry {
        std::int64_t db_id = 0; // assigned by storage; 0 until read back
        Timestamp timestamp = current_timestamp();
        LogLevel level = LogLevel::Information;
        std::string category;
        int event_id = 0;
        std::optional<std::string> event_name;
        std::int64_t thread_id = 0;
        std::string message_template;
        std::string rendered_message;
        nlohmann::json properties = nlohmann::json::object();
        std::optional<nlohmann::json> scopes;
        std::shared_ptr<const SerializedException> exception;

        // Stamps timestamp and thread id for the calling thread.
        static LogEntry make(LogLevel level, std::string category, std::string message);

        [[nodiscard]] std::string to_string() const;
    };

    [[nodiscard]] std::int64_t current_thread_id();

    // Fixed-width UTC ISO-8601 ("2025-01-31T08:15:02.123456Z"); lexical order equals time order.
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    // Accepts format_timestamp output (the fraction and trailing 'Z' are optional).
    [[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

} // namespace SQLiteLogKit
