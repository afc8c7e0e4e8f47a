#pragma once

#include "LogSink.hxx"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>

namespace SQLiteLogKit {

    /// Reads SinkOptions from a JSON file:
    ///
    ///   { "database":     { "folder": "logs", "stem": "Log" },
    ///     "batching":     { "max_batch_size", "max_wait_ms", "queue_capacity",
    ///                       "overflow_policy": "drop" | "block", "max_retries", "retry_backoff_ms" },
    ///     "housekeeping": { "mode": "automatic" | "manual", "max_age_seconds", "max_row_count",
    ///                       "sweep_interval_seconds", "vacuum_after_sweep" },
    ///     "diagnostics":  { "level": "trace" ... "off" } }
    ///
    /// Missing keys keep their defaults; null disables max_age_seconds/max_row_count.
    /// The database path is folder / SchemaCatalog::versioned_file_name(stem).
    /// Hooks and middleware are not configurable from the file.
    class ConfigLoader {
    public:
        explicit ConfigLoader(std::filesystem::path config_path);

        // Re-reads the file on every call. Throws ConfigError.
        [[nodiscard]] SinkOptions load() const;

        static SinkOptions parse(const nlohmann::json& config);

    private:
        std::filesystem::path path_;
    };

} // namespace SQLiteLogKit
