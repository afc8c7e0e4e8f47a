#include "SQLiteLogKit/Scopes.hxx"

#include <algorithm>
#include <string>

namespace SQLiteLogKit {

    LogScope::~LogScope() { end(); }

    LogScope::LogScope(LogScope&& other) noexcept
        : owner_(std::exchange(other.owner_, nullptr)), thread_(other.thread_), token_(other.token_) {}

    LogScope& LogScope::operator=(LogScope&& other) noexcept {
        if (this != &other) {
            end();
            owner_ = std::exchange(other.owner_, nullptr);
            thread_ = other.thread_;
            token_ = other.token_;
        }
        return *this;
    }

    void LogScope::end() {
        if (owner_) {
            owner_->pop(thread_, token_);
            owner_ = nullptr;
        }
    }

    LogScope ScopeProvider::push(nlohmann::json state) {
        const auto thread = std::this_thread::get_id();
        std::lock_guard lock(mutex_);
        const auto token = next_token_++;
        stacks_[thread].emplace_back(token, std::move(state));
        return {this, thread, token};
    }

    void ScopeProvider::pop(const std::thread::id thread, const std::uint64_t token) {
        std::lock_guard lock(mutex_);
        const auto it = stacks_.find(thread);
        if (it == stacks_.end()) return;
        auto& stack = it->second;
        stack.erase(std::remove_if(stack.begin(), stack.end(),
                                   [token](const auto& item) { return item.first == token; }),
                    stack.end());
        if (stack.empty()) stacks_.erase(it);
    }

    std::optional<nlohmann::json> ScopeProvider::snapshot() const {
        std::lock_guard lock(mutex_);
        const auto it = stacks_.find(std::this_thread::get_id());
        if (it == stacks_.end() || it->second.empty()) return std::nullopt;

        nlohmann::json flat = nlohmann::json::object();
        int unnamed = 0;
        for (const auto& item : it->second) {
            const auto& state = item.second;
            if (state.is_object()) {
                for (const auto& [key, value] : state.items()) {
                    if (!flat.contains(key)) flat[key] = value;
                }
            } else {
                flat["scope_" + std::to_string(unnamed++)] =
                    state.is_string() ? state : nlohmann::json(state.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            }
        }
        return flat;
    }

    size_t ScopeProvider::depth() const {
        std::lock_guard lock(mutex_);
        const auto it = stacks_.find(std::this_thread::get_id());
        return it == stacks_.end() ? 0 : it->second.size();
    }

} // namespace SQLiteLogKit
