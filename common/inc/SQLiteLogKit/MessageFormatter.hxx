#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SQLiteLogKit {

    /// Renders message templates such as "User {Name} paid {Amount:F2}" from a JSON object.
    ///
    /// "{{" and "}}" are literal braces; a placeholder whose key is missing renders as
    /// kMissingParameter; an unterminated '{' is kept literally. The only format specifier
    /// understood is Fn (fixed, n decimals) for numbers; others are ignored.
    /// Parsed templates are cached per formatter instance.
    class MessageFormatter {
    public:
        static constexpr const char* kMissingParameter = "MissingMsgParam";

        std::string format(const std::string& message_template, const nlohmann::json& parameters);

        [[nodiscard]] size_t cached_templates() const;

    private:
        struct Segment {
            std::string text;                  // literal text, or placeholder key
            std::optional<std::string> format; // placeholder format specifier
            bool placeholder = false;
        };
        using Segments = std::vector<Segment>;

        static Segments parse(const std::string& message_template);
        static std::string render_value(const nlohmann::json& value, const std::optional<std::string>& format);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<const Segments>> cache_;
    };

} // namespace SQLiteLogKit
