#pragma once

#include "BatchWriter.hxx"
#include "LogEntry.hxx"
#include "Options.hxx"

#include <spdlog/logger.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace SQLiteLogKit {

    class ConnectionGuard;
    class Statement;

    using TimeSource = std::function<Timestamp()>;

    /// Retention for the log table. Explicit calls work in either mode; in Automatic mode a
    /// background thread also calls run_once() immediately and then every sweep_interval.
    /// Every delete is a single statement keyed on the catalog's DbId/Timestamp columns and
    /// runs under the same writer lease as batch inserts.
    class Housekeeper {
    public:
        Housekeeper(std::shared_ptr<ConnectionGuard> connection, HouseKeepingOptions options,
                    std::shared_ptr<spdlog::logger> diagnostics = nullptr, FailureHandler on_failure = {},
                    TimeSource now = {});
        ~Housekeeper();

        Housekeeper(const Housekeeper&) = delete;
        Housekeeper& operator=(const Housekeeper&) = delete;

        // Each returns the number of rows deleted; throws StorageError once retries are exhausted.
        int delete_all();
        int delete_older_than(Timestamp threshold);
        int delete_exceeding_count(std::int64_t max_rows);
        int delete_by_ids(const std::vector<std::int64_t>& ids);

        /// Applies max_age, then max_row_count, then VACUUM if anything was removed.
        int run_once();

        // Stops the background sweep (if any). Idempotent.
        void stop();

        [[nodiscard]] HousekeepingMode mode() const { return options_.mode; }
        [[nodiscard]] const HouseKeepingOptions& options() const { return options_; }
        [[nodiscard]] std::uint64_t sweep_count() const { return sweeps_; }
        [[nodiscard]] std::uint64_t failed_sweep_count() const { return failed_sweeps_; }

        static constexpr size_t kIdChunkSize = 500;

    private:
        void sweep_loop(std::stop_token stop);
        int execute_delete(const std::string& sql, const std::function<void(Statement&)>& bind);
        void vacuum();

        const HouseKeepingOptions options_;
        std::shared_ptr<ConnectionGuard> connection_;
        std::shared_ptr<spdlog::logger> log_;
        FailureHandler on_failure_;
        TimeSource now_;

        std::mutex wait_mutex_;
        std::condition_variable_any wake_;
        std::atomic<std::uint64_t> sweeps_{0};
        std::atomic<std::uint64_t> failed_sweeps_{0};
        std::stop_source stop_source_; // signalled by stop(); also cuts short delete retries
        std::jthread worker_;
    };

} // namespace SQLiteLogKit
