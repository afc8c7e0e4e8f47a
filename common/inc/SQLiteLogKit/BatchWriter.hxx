#pragma once

#include "LogWriter.hxx"
#include "Options.hxx"
#include "WriteBuffer.hxx"

#include <spdlog/logger.h>

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace SQLiteLogKit {

    struct StorageFailure {
        std::string operation;    // "batch insert", "housekeeping sweep", ...
        std::string message;      // what() of the last error
        size_t entries_lost = 0;  // entries dropped because of this failure
    };

    using FailureHandler = std::function<void(const StorageFailure&)>;

    /// Drains a WriteBuffer on one dedicated thread, writing each batch in one transaction.
    /// Failed batches are retried with linear backoff and then dropped; nothing propagates
    /// to producers.
    class BatchWriter {
    public:
        BatchWriter(std::shared_ptr<ConnectionGuard> connection, BatchingOptions options,
                    std::shared_ptr<spdlog::logger> diagnostics = nullptr, FailureHandler on_failure = {});
        ~BatchWriter();

        BatchWriter(const BatchWriter&) = delete;
        BatchWriter& operator=(const BatchWriter&) = delete;

        // false when the overflow policy dropped the entry or the writer is stopping.
        bool enqueue(LogEntry entry);

        // true once everything enqueued before the call has been written or dropped.
        bool flush(std::chrono::milliseconds timeout);

        /// Flushes with timeout, then stops the worker. Entries still queued after a timed-out
        /// flush are abandoned; a batch caught mid-write gets no further retries and is counted
        /// as lost. Returns the flush result. Idempotent.
        bool stop(std::chrono::milliseconds timeout);

        [[nodiscard]] size_t pending_count() const { return buffer_.pending(); }
        [[nodiscard]] std::uint64_t discarded_count() const { return buffer_.discarded(); }
        void reset_discarded_count() { buffer_.reset_discarded(); }
        [[nodiscard]] std::uint64_t failed_batch_count() const { return failed_batches_; }
        [[nodiscard]] std::uint64_t lost_entry_count() const { return lost_entries_; }
        [[nodiscard]] std::uint64_t written_entry_count() const { return written_entries_; }
        [[nodiscard]] std::uint64_t abandoned_entry_count() const { return abandoned_entries_; }
        [[nodiscard]] bool is_running() const { return running_; }

    private:
        void run(std::stop_token stop);
        void write_with_retry(const std::vector<LogEntry>& batch, const std::stop_token& stop);
        void drop_batch(const std::vector<LogEntry>& batch, int attempts, const std::string& error);

        const BatchingOptions options_;
        std::shared_ptr<spdlog::logger> log_;
        FailureHandler on_failure_;
        std::shared_ptr<ConnectionGuard> connection_;
        LogWriter writer_;
        WriteBuffer buffer_;

        std::mutex backoff_mutex_;
        std::condition_variable_any backoff_;
        std::atomic<bool> running_{false};
        std::atomic<bool> overflow_reported_{false};
        std::atomic<std::uint64_t> failed_batches_{0};
        std::atomic<std::uint64_t> lost_entries_{0};
        std::atomic<std::uint64_t> written_entries_{0};
        std::atomic<std::uint64_t> abandoned_entries_{0};
        std::jthread worker_; // last: joined before the members it uses are destroyed
    };

} // namespace SQLiteLogKit
