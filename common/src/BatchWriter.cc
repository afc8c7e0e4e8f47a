#include "SQLiteLogKit/BatchWriter.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"

namespace SQLiteLogKit {

    BatchWriter::BatchWriter(std::shared_ptr<ConnectionGuard> connection, BatchingOptions options,
                             std::shared_ptr<spdlog::logger> diagnostics, FailureHandler on_failure)
        : options_(std::move(options)),
          log_(resolve_diagnostics(std::move(diagnostics))),
          on_failure_(std::move(on_failure)),
          connection_(connection),
          writer_(std::move(connection)),
          buffer_(options_.queue_capacity, options_.overflow_policy) {
        options_.validate();
        running_ = true;
        worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    }

    BatchWriter::~BatchWriter() {
        stop(std::chrono::seconds(2));
    }

    bool BatchWriter::enqueue(LogEntry entry) {
        if (buffer_.enqueue(std::move(entry))) return true;
        if (!buffer_.closed() && !overflow_reported_.exchange(true)) {
            log_->warn("write queue full (capacity {}); discarding new entries", options_.queue_capacity);
        }
        return false;
    }

    void BatchWriter::run(std::stop_token stop) {
        while (!stop.stop_requested()) {
            auto batch = buffer_.take_batch(options_.max_batch_size, options_.max_wait_time, stop);
            if (batch.empty()) continue;
            write_with_retry(batch, stop);
            buffer_.complete(batch.size());
        }
        running_ = false;
    }

    void BatchWriter::write_with_retry(const std::vector<LogEntry>& batch, const std::stop_token& stop) {
        for (int attempt = 0;; ++attempt) {
            try {
                writer_.write_batch(batch);
                written_entries_ += batch.size();
                log_->debug("committed batch of {} entries", batch.size());
                return;
            } catch (const std::exception& ex) {
                if (attempt >= options_.max_retries || stop.stop_requested()) {
                    drop_batch(batch, attempt + 1, ex.what());
                    return;
                }
                log_->warn("batch insert failed (attempt {}/{}): {}",
                           attempt + 1, options_.max_retries + 1, ex.what());

                std::unique_lock lock(backoff_mutex_);
                backoff_.wait_for(lock, stop, options_.retry_backoff * (attempt + 1), [] { return false; });
            }
        }
    }

    void BatchWriter::drop_batch(const std::vector<LogEntry>& batch, const int attempts, const std::string& error) {
        ++failed_batches_;
        lost_entries_ += batch.size();
        log_->warn("dropping batch of {} entries after {} attempts: {}", batch.size(), attempts, error);
        if (on_failure_) {
            try {
                on_failure_({"batch insert", error, batch.size()});
            } catch (const std::exception& hook_error) {
                log_->error("failure handler threw: {}", hook_error.what());
            }
        }
    }

    bool BatchWriter::flush(const std::chrono::milliseconds timeout) {
        return buffer_.wait_drained(timeout);
    }

    bool BatchWriter::stop(const std::chrono::milliseconds timeout) {
        if (!worker_.joinable()) return buffer_.pending() == 0;

        buffer_.close();
        const bool drained = buffer_.wait_drained(timeout);
        if (!drained) {
            const size_t abandoned = buffer_.clear();
            abandoned_entries_ += abandoned;
            if (abandoned > 0) {
                log_->warn("shutdown timed out; abandoned {} unwritten entries", abandoned);
            }
        }
        // A batch still being written must not outlast the timeout: fail its lock waits and
        // skip its remaining retries.
        if (!drained) connection_->abort_busy_waits(true);
        worker_.request_stop();
        worker_.join();
        if (!drained) connection_->abort_busy_waits(false);
        return drained;
    }

} // namespace SQLiteLogKit
