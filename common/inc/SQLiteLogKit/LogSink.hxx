#pragma once

#include "BatchWriter.hxx"
#include "Housekeeper.hxx"
#include "LogEntry.hxx"
#include "LogReader.hxx"
#include "MessageFormatter.hxx"
#include "Middleware.hxx"
#include "Options.hxx"
#include "Scopes.hxx"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

namespace SQLiteLogKit {

    class ConnectionGuard;

    using EntryListener = std::function<void(const LogEntry&)>;

    struct SinkOptions {
        std::filesystem::path database_path;
        BatchingOptions batching;
        HouseKeepingOptions housekeeping;
        MiddlewareList middlewares;
        FailureHandler on_failure;            // storage failures on background threads
        EntryListener on_entry_received;      // every accepted entry, on the producer's thread
        std::shared_ptr<spdlog::logger> diagnostics;
        TimeSource clock;                     // defaults to system_clock::now
    };

    /// Structured-log sink backed by one SQLite file.
    ///
    /// Producers call add()/log() from any thread; entries are queued and written in batches by
    /// a background thread. Storage failures never surface on the producer's path: they are
    /// retried, counted, logged and reported through SinkOptions::on_failure. Using the sink
    /// after dispose() throws DisposedError.
    class LogSink {
    public:
        // Validates options (ConfigError) and opens the database (StorageError).
        explicit LogSink(SinkOptions options);
        ~LogSink();

        LogSink(const LogSink&) = delete;
        LogSink& operator=(const LogSink&) = delete;

        // Runs middleware, then enqueues. false when dropped by the overflow policy.
        bool add(LogEntry entry);

        // Builds an entry (rendered message, scopes, thread id, flattened exception) and adds it.
        bool log(LogLevel level, std::string category, std::string message_template,
                 nlohmann::json properties = nlohmann::json::object(),
                 const std::exception* error = nullptr, EventId event = {});

        [[nodiscard]] LogScope begin_scope(nlohmann::json state) { return scopes_.push(std::move(state)); }

        bool flush(std::chrono::milliseconds timeout);

        /// Flushes (bounded by timeout), stops background threads and closes the database.
        /// Returns whether every buffered entry was handled. Idempotent.
        bool dispose(std::chrono::milliseconds timeout = std::chrono::seconds(2));

        [[nodiscard]] std::uint64_t discarded_count() const;
        void reset_discarded_count();
        [[nodiscard]] size_t pending_count() const;
        [[nodiscard]] std::uint64_t failed_batch_count() const;
        [[nodiscard]] std::uint64_t lost_entry_count() const;

        [[nodiscard]] Housekeeper& housekeeper();
        [[nodiscard]] const LogReader& reader() const;
        [[nodiscard]] const std::filesystem::path& database_path() const { return options_.database_path; }
        [[nodiscard]] bool is_disposed() const { return disposed_; }

    private:
        void ensure_alive(const char* operation) const;

        SinkOptions options_;
        std::shared_ptr<spdlog::logger> log_;
        std::shared_ptr<ConnectionGuard> connection_;
        MessageFormatter formatter_;
        ScopeProvider scopes_;
        LogReader reader_;
        std::unique_ptr<BatchWriter> writer_;
        std::unique_ptr<Housekeeper> housekeeper_;

        std::mutex dispose_mutex_;
        std::atomic<bool> disposed_{false};
    };

} // namespace SQLiteLogKit
