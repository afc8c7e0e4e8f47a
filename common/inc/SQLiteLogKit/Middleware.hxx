#pragma once

#include "LogEntry.hxx"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace SQLiteLogKit {

    // Runs on the producer's thread before an entry is enqueued.
    class LogMiddleware {
    public:
        virtual ~LogMiddleware() = default;
        virtual void process(LogEntry& entry) = 0;
    };

    using MiddlewareList = std::vector<std::shared_ptr<LogMiddleware>>;

    // Adds shared key/values to every entry's properties; keys already present are left alone.
    class ContextMiddleware : public LogMiddleware {
    public:
        void set(const std::string& key, nlohmann::json value);
        bool remove(const std::string& key);
        void clear();

        void process(LogEntry& entry) override;

    private:
        mutable std::mutex mutex_;
        nlohmann::json context_ = nlohmann::json::object();
    };

} // namespace SQLiteLogKit
