#include "SQLiteLogKit/Options.hxx"
#include "SQLiteLogKit/Errors.hxx"

#include <string>

namespace SQLiteLogKit {

    void BatchingOptions::validate() const {
        if (max_batch_size == 0) throw ConfigError("batching: max_batch_size must be positive");
        if (max_wait_time.count() <= 0) throw ConfigError("batching: max_wait_time must be positive");
        if (queue_capacity == 0) throw ConfigError("batching: queue_capacity must be positive");
        if (max_retries < 0) throw ConfigError("batching: max_retries must not be negative");
        if (retry_backoff.count() < 0) throw ConfigError("batching: retry_backoff must not be negative");
    }

    void HouseKeepingOptions::validate() const {
        if (sweep_interval.count() <= 0) throw ConfigError("housekeeping: sweep_interval must be positive");
        if (max_age && max_age->count() <= 0) throw ConfigError("housekeeping: max_age must be positive");
        if (max_row_count && *max_row_count <= 0) {
            throw ConfigError("housekeeping: max_row_count must be positive, got " + std::to_string(*max_row_count));
        }
        if (mode == HousekeepingMode::Automatic && !max_age && !max_row_count) {
            throw ConfigError("housekeeping: automatic mode needs max_age or max_row_count");
        }
        if (max_retries < 0) throw ConfigError("housekeeping: max_retries must not be negative");
        if (retry_backoff.count() < 0) throw ConfigError("housekeeping: retry_backoff must not be negative");
    }

} // namespace SQLiteLogKit
