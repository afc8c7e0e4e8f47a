#pragma once

#include <spdlog/logger.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace SQLiteLogKit {

    class ConnectionGuard;

    class Exporter {
    public:
        // Keeps each chunk's IN (...) list well below SQLite's bound-parameter limit.
        static constexpr size_t kChunkSize = 500;

        /// Copies the rows with the given DbIds from source into destination (created if needed),
        /// one transaction per chunk. Copied rows get new DbIds. Returns the number of rows copied.
        /// Throws StorageError, or std::invalid_argument if the source file does not exist.
        static size_t export_entries(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     const std::vector<std::int64_t>& ids,
                                     std::shared_ptr<spdlog::logger> diagnostics = nullptr);

        static size_t export_entries(ConnectionGuard& source, ConnectionGuard& destination,
                                     const std::vector<std::int64_t>& ids);
    };

} // namespace SQLiteLogKit
