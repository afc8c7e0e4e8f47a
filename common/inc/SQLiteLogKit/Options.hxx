#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace SQLiteLogKit {

    enum class OverflowPolicy {
        Drop,  // discard the new entry and count it
        Block  // wait for the writer to free space
    };

    enum class HousekeepingMode {
        Automatic, // a background thread sweeps every sweep_interval
        Manual     // rows are only deleted by explicit calls
    };

    struct BatchingOptions {
        size_t max_batch_size = 100;
        std::chrono::milliseconds max_wait_time{5000};
        size_t queue_capacity = 1000;
        OverflowPolicy overflow_policy = OverflowPolicy::Drop;
        int max_retries = 3;
        std::chrono::milliseconds retry_backoff{100}; // multiplied by the attempt number

        // Throws ConfigError.
        void validate() const;
    };

    struct HouseKeepingOptions {
        HousekeepingMode mode = HousekeepingMode::Automatic;
        std::optional<std::chrono::seconds> max_age = std::chrono::hours(24 * 30);
        std::optional<std::int64_t> max_row_count;
        std::chrono::milliseconds sweep_interval = std::chrono::hours(1);
        bool vacuum_after_sweep = true;
        int max_retries = 3;
        std::chrono::milliseconds retry_backoff{100};

        // Throws ConfigError.
        void validate() const;
    };

} // namespace SQLiteLogKit
