#include "SQLiteLogKit/Housekeeper.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"
#include "SQLiteLogKit/Errors.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include <algorithm>
#include <stdexcept>

namespace SQLiteLogKit {

    namespace {
        std::string table() { return std::string(SchemaCatalog::kTableName); }
        std::string column(const Column c) { return std::string(SchemaCatalog::name_of(c)); }
    }

    Housekeeper::Housekeeper(std::shared_ptr<ConnectionGuard> connection, HouseKeepingOptions options,
                             std::shared_ptr<spdlog::logger> diagnostics, FailureHandler on_failure,
                             TimeSource now)
        : options_(std::move(options)),
          connection_(std::move(connection)),
          log_(resolve_diagnostics(std::move(diagnostics))),
          on_failure_(std::move(on_failure)),
          now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {
        options_.validate();
        if (options_.mode == HousekeepingMode::Automatic) {
            worker_ = std::jthread([this] { sweep_loop(stop_source_.get_token()); });
        }
    }

    Housekeeper::~Housekeeper() { stop(); }

    void Housekeeper::stop() {
        if (!worker_.joinable()) return;
        connection_->abort_busy_waits(true);
        stop_source_.request_stop();
        wake_.notify_all();
        worker_.join();
        connection_->abort_busy_waits(false);
    }

    void Housekeeper::sweep_loop(std::stop_token stop) {
        while (!stop.stop_requested()) {
            try {
                const int deleted = run_once();
                if (deleted > 0) log_->info("housekeeping removed {} rows", deleted);
            } catch (const std::exception& ex) {
                ++failed_sweeps_;
                log_->error("housekeeping sweep failed: {}", ex.what());
                if (on_failure_) {
                    try {
                        on_failure_({"housekeeping sweep", ex.what(), 0});
                    } catch (const std::exception& hook_error) {
                        log_->error("failure handler threw: {}", hook_error.what());
                    }
                }
            }
            std::unique_lock lock(wait_mutex_);
            wake_.wait_for(lock, stop, options_.sweep_interval, [] { return false; });
        }
    }

    int Housekeeper::execute_delete(const std::string& sql, const std::function<void(Statement&)>& bind) {
        for (int attempt = 0;; ++attempt) {
            try {
                const auto lease = connection_->acquire();
                Transaction tx(lease.db());
                int changes = 0;
                {
                    Statement stmt(lease.db(), sql);
                    if (bind) bind(stmt);
                    changes = stmt.execute();
                }
                tx.commit();
                return changes;
            } catch (const StorageError& ex) {
                if (!ex.transient() || attempt >= options_.max_retries || stop_source_.stop_requested()) throw;
                log_->warn("delete hit a locked database (attempt {}/{}): {}",
                           attempt + 1, options_.max_retries + 1, ex.what());
                std::unique_lock lock(wait_mutex_);
                wake_.wait_for(lock, stop_source_.get_token(), options_.retry_backoff * (attempt + 1), [] { return false; });
            }
        }
    }

    int Housekeeper::delete_all() {
        return execute_delete("DELETE FROM " + table(), {});
    }

    int Housekeeper::delete_older_than(const Timestamp threshold) {
        const auto cutoff = format_timestamp(storage_ceil(threshold));
        return execute_delete("DELETE FROM " + table() + " WHERE " + column(Column::Timestamp) + " < ?",
                              [&cutoff](Statement& stmt) { stmt.bind(1, cutoff); });
    }

    int Housekeeper::delete_exceeding_count(const std::int64_t max_rows) {
        if (max_rows < 0) throw std::invalid_argument("max_rows must not be negative");
        if (max_rows == 0) return delete_all();

        // Keeps the newest max_rows rows by DbId; the subquery is NULL when there are fewer.
        const auto id = column(Column::DbId);
        return execute_delete("DELETE FROM " + table() + " WHERE " + id + " <= (SELECT " + id + " FROM " +
                              table() + " ORDER BY " + id + " DESC LIMIT 1 OFFSET ?)",
                              [max_rows](Statement& stmt) { stmt.bind(1, max_rows); });
    }

    int Housekeeper::delete_by_ids(const std::vector<std::int64_t>& ids) {
        int total = 0;
        for (size_t start = 0; start < ids.size(); start += kIdChunkSize) {
            const size_t count = std::min(kIdChunkSize, ids.size() - start);
            std::string placeholders;
            for (size_t i = 0; i < count; ++i) placeholders += i ? ",?" : "?";
            total += execute_delete("DELETE FROM " + table() + " WHERE " + column(Column::DbId) +
                                    " IN (" + placeholders + ")",
                                    [&ids, start, count](Statement& stmt) {
                                        for (size_t i = 0; i < count; ++i) {
                                            stmt.bind(static_cast<int>(i + 1), ids[start + i]);
                                        }
                                    });
        }
        return total;
    }

    void Housekeeper::vacuum() {
        try {
            const auto lease = connection_->acquire();
            exec_sql(lease.db(), "VACUUM");
        } catch (const StorageError& ex) {
            log_->warn("VACUUM skipped: {}", ex.what());
        }
    }

    int Housekeeper::run_once() {
        int deleted = 0;
        if (options_.max_age) deleted += delete_older_than(now_() - *options_.max_age);
        if (options_.max_row_count) deleted += delete_exceeding_count(*options_.max_row_count);
        if (deleted > 0 && options_.vacuum_after_sweep) vacuum();
        ++sweeps_;
        return deleted;
    }

} // namespace SQLiteLogKit
