#pragma once

#include "LogEntry.hxx"
#include "Options.hxx"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stop_token>
#include <vector>

namespace SQLiteLogKit {

    /// Bounded FIFO between producer threads and the batch writer.
    ///
    /// Entries stay queued (and count against capacity) until the consumer takes a batch;
    /// take_batch() removes them and marks them in flight until complete() is called, so
    /// wait_drained() only succeeds once they have been handled.
    class WriteBuffer {
    public:
        WriteBuffer(size_t capacity, OverflowPolicy policy);

        // false if dropped by overflow or the buffer is closed.
        bool enqueue(LogEntry entry);

        /// Blocks until max_batch entries are queued, max_wait has passed since the oldest
        /// queued entry arrived, a drain is requested, or stop is requested. Returns up to
        /// max_batch entries; empty only when stopping with nothing queued.
        std::vector<LogEntry> take_batch(size_t max_batch, std::chrono::milliseconds max_wait,
                                         std::stop_token stop);

        /// Takes up to max_batch entries without waiting.
        std::vector<LogEntry> take_now(size_t max_batch);

        // Marks count taken entries as handled.
        void complete(size_t count);

        // Waits until nothing is queued or in flight; false on timeout.
        bool wait_drained(std::chrono::milliseconds timeout);

        // Rejects further entries and wakes blocked producers.
        void close();

        // Removes everything still queued; returns how many entries were removed.
        size_t clear();

        [[nodiscard]] size_t pending() const;
        [[nodiscard]] std::uint64_t discarded() const { return discarded_.load(); }
        void reset_discarded() { discarded_ = 0; }
        [[nodiscard]] bool closed() const;

    private:
        using Arrival = std::chrono::steady_clock::time_point;

        std::vector<LogEntry> pop_locked(size_t max_batch);

        const size_t capacity_;
        const OverflowPolicy policy_;

        mutable std::mutex mutex_;
        std::condition_variable_any not_empty_;
        std::condition_variable not_full_;
        std::condition_variable drained_;
        std::deque<std::pair<LogEntry, Arrival>> queue_;
        size_t in_flight_ = 0;
        int drain_requests_ = 0;
        bool closed_ = false;
        std::atomic<std::uint64_t> discarded_{0};
    };

} // namespace SQLiteLogKit
