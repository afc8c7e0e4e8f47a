#include "SQLiteLogKit/WriteBuffer.hxx"

#include <algorithm>

namespace SQLiteLogKit {

    WriteBuffer::WriteBuffer(const size_t capacity, const OverflowPolicy policy)
        : capacity_(capacity), policy_(policy) {}

    bool WriteBuffer::enqueue(LogEntry entry) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                if (policy_ == OverflowPolicy::Drop) {
                    ++discarded_;
                    return false;
                }
                not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
                if (closed_) return false;
            }
            queue_.emplace_back(std::move(entry), std::chrono::steady_clock::now());
        }
        not_empty_.notify_one();
        return true;
    }

    std::vector<LogEntry> WriteBuffer::pop_locked(const size_t max_batch) {
        std::vector<LogEntry> batch;
        const size_t n = std::min(max_batch, queue_.size());
        batch.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            batch.push_back(std::move(queue_.front().first));
            queue_.pop_front();
        }
        in_flight_ += batch.size();
        return batch;
    }

    std::vector<LogEntry> WriteBuffer::take_batch(const size_t max_batch, const std::chrono::milliseconds max_wait,
                                                  std::stop_token stop) {
        std::vector<LogEntry> batch;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) return batch;

            const auto deadline = queue_.front().second + max_wait;
            not_empty_.wait_until(lock, stop, deadline, [this, max_batch] {
                return queue_.size() >= max_batch || drain_requests_ > 0 || closed_;
            });
            batch = pop_locked(max_batch);
        }
        not_full_.notify_all();
        return batch;
    }

    std::vector<LogEntry> WriteBuffer::take_now(const size_t max_batch) {
        std::vector<LogEntry> batch;
        {
            std::lock_guard lock(mutex_);
            batch = pop_locked(max_batch);
        }
        not_full_.notify_all();
        return batch;
    }

    void WriteBuffer::complete(const size_t count) {
        {
            std::lock_guard lock(mutex_);
            in_flight_ -= std::min(count, in_flight_);
        }
        drained_.notify_all();
    }

    bool WriteBuffer::wait_drained(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        ++drain_requests_;
        not_empty_.notify_all();
        const bool drained = drained_.wait_for(lock, timeout, [this] {
            return queue_.empty() && in_flight_ == 0;
        });
        --drain_requests_;
        return drained;
    }

    void WriteBuffer::close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    size_t WriteBuffer::clear() {
        size_t removed = 0;
        {
            std::lock_guard lock(mutex_);
            removed = queue_.size();
            queue_.clear();
        }
        not_full_.notify_all();
        drained_.notify_all();
        return removed;
    }

    size_t WriteBuffer::pending() const {
        std::lock_guard lock(mutex_);
        return queue_.size() + in_flight_;
    }

    bool WriteBuffer::closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

} // namespace SQLiteLogKit
