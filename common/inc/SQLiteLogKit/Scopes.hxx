#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SQLiteLogKit {

    class ScopeProvider;

    // Pops its scope from the owning provider when destroyed.
    class LogScope {
    public:
        LogScope() = default;
        LogScope(ScopeProvider* owner, std::thread::id thread, std::uint64_t token)
            : owner_(owner), thread_(thread), token_(token) {}
        ~LogScope();

        LogScope(LogScope&& other) noexcept;
        LogScope& operator=(LogScope&& other) noexcept;
        LogScope(const LogScope&) = delete;
        LogScope& operator=(const LogScope&) = delete;

        void end();

    private:
        ScopeProvider* owner_ = nullptr;
        std::thread::id thread_;
        std::uint64_t token_ = 0;
    };

    /// Per-thread stacks of scope states. The provider must outlive its LogScope objects.
    class ScopeProvider {
    public:
        [[nodiscard]] LogScope push(nlohmann::json state);

        /// Flattens the calling thread's scopes, outermost first. Object scopes contribute their
        /// keys (an outer value wins over an inner one); any other state becomes "scope_<n>".
        /// nullopt when the thread has no active scope.
        [[nodiscard]] std::optional<nlohmann::json> snapshot() const;

        [[nodiscard]] size_t depth() const;

    private:
        friend class LogScope;
        void pop(std::thread::id thread, std::uint64_t token);

        mutable std::mutex mutex_;
        std::unordered_map<std::thread::id, std::vector<std::pair<std::uint64_t, nlohmann::json>>> stacks_;
        std::uint64_t next_token_ = 1;
    };

} // namespace SQLiteLogKit
