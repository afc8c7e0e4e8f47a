#pragma once

#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

struct sqlite3;

namespace SQLiteLogKit {

    /// Owns the one writable connection to a log database plus one read-only connection.
    ///
    /// SQLite allows a single writer per file, so every statement that modifies the file
    /// (batch inserts, housekeeping deletes, table creation) runs under a Lease from acquire().
    /// The database runs in WAL mode, which lets acquire_reader() leases proceed concurrently
    /// with the writer.
    class ConnectionGuard {
    public:
        /// Exclusive use of one connection; released when the lease is destroyed.
        class Lease {
        public:
            Lease(std::unique_lock<std::mutex> lock, sqlite3* db) : lock_(std::move(lock)), db_(db) {}

            [[nodiscard]] sqlite3* db() const { return db_; }

        private:
            std::unique_lock<std::mutex> lock_;
            sqlite3* db_;
        };

        /// Creates the parent directory and opens (or creates) the file. Throws StorageError.
        explicit ConnectionGuard(std::filesystem::path path,
                                 std::shared_ptr<spdlog::logger> diagnostics = nullptr);
        ~ConnectionGuard();

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        /// Writer lease. Creates the log table on first use. Throws DisposedError after close().
        Lease acquire();

        /// Read-only lease on a separate connection. Throws DisposedError after close().
        Lease acquire_reader();

        /// Waits for outstanding leases, then closes both connections. Idempotent.
        void close();

        /// While set, a writer statement that finds the file locked fails with SQLITE_BUSY at once
        /// instead of waiting out the busy timeout. Used to bound shutdown.
        void abort_busy_waits(bool abort) { abort_busy_waits_ = abort; }

        [[nodiscard]] bool is_open() const { return !closed_; }
        [[nodiscard]] const std::filesystem::path& get_db_path() const { return db_path_; }

        /// Main file plus write-ahead log, in bytes; 0 if neither exists.
        [[nodiscard]] std::uintmax_t database_file_size() const;

    private:
        void init_table(sqlite3* db);
        static int busy_handler(void* self, int attempts);

        std::filesystem::path db_path_;
        std::shared_ptr<spdlog::logger> log_;

        std::mutex write_mutex_;
        std::mutex read_mutex_;
        sqlite3* db_ = nullptr;     // guarded by write_mutex_
        sqlite3* reader_ = nullptr; // guarded by read_mutex_
        std::atomic<bool> table_ready_{false};
        std::atomic<bool> closed_{false};
        std::atomic<bool> abort_busy_waits_{false};
    };

} // namespace SQLiteLogKit
