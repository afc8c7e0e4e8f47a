#include "SQLiteLogKit/Middleware.hxx"

namespace SQLiteLogKit {

    void ContextMiddleware::set(const std::string& key, nlohmann::json value) {
        std::lock_guard lock(mutex_);
        context_[key] = std::move(value);
    }

    bool ContextMiddleware::remove(const std::string& key) {
        std::lock_guard lock(mutex_);
        return context_.erase(key) > 0;
    }

    void ContextMiddleware::clear() {
        std::lock_guard lock(mutex_);
        context_ = nlohmann::json::object();
    }

    void ContextMiddleware::process(LogEntry& entry) {
        if (!entry.properties.is_object()) entry.properties = nlohmann::json::object();
        std::lock_guard lock(mutex_);
        for (const auto& [key, value] : context_.items()) {
            if (!entry.properties.contains(key)) entry.properties[key] = value;
        }
    }

} // namespace SQLiteLogKit
