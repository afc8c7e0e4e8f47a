#include "SQLiteLogKit/MessageFormatter.hxx"

#include <cctype>
#include <cstdio>
#include <string>

namespace SQLiteLogKit {

    namespace {
        // The cache is reset once it holds this many templates.
        constexpr size_t kMaxCachedTemplates = 1024;

        std::string trim(const std::string& s) {
            size_t b = 0, e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
            return s.substr(b, e - b);
        }
    }

    MessageFormatter::Segments MessageFormatter::parse(const std::string& tpl) {
        Segments segments;
        std::string literal;
        const auto flush_literal = [&] {
            if (!literal.empty()) {
                segments.push_back({std::move(literal), std::nullopt, false});
                literal.clear();
            }
        };

        size_t pos = 0;
        while (pos < tpl.size()) {
            const char c = tpl[pos];
            if (c == '{') {
                if (pos + 1 < tpl.size() && tpl[pos + 1] == '{') {
                    literal += '{';
                    pos += 2;
                    continue;
                }
                const auto end = tpl.find('}', pos + 1);
                if (end == std::string::npos) {
                    literal += tpl.substr(pos);
                    break;
                }
                flush_literal();
                const std::string content = tpl.substr(pos + 1, end - pos - 1);
                const auto colon = content.find(':');
                if (colon == std::string::npos) {
                    segments.push_back({trim(content), std::nullopt, true});
                } else {
                    segments.push_back({trim(content.substr(0, colon)), trim(content.substr(colon + 1)), true});
                }
                pos = end + 1;
            } else if (c == '}') {
                literal += '}';
                pos += (pos + 1 < tpl.size() && tpl[pos + 1] == '}') ? 2 : 1;
            } else {
                literal += c;
                ++pos;
            }
        }
        flush_literal();
        return segments;
    }

    std::string MessageFormatter::render_value(const nlohmann::json& value, const std::optional<std::string>& format) {
        if (value.is_string()) return value.get<std::string>();
        if (value.is_number() && format && format->size() >= 1 &&
            (format->front() == 'F' || format->front() == 'f')) {
            int precision = 2;
            if (format->size() > 1) {
                try {
                    precision = std::stoi(format->substr(1));
                } catch (const std::exception&) {
                    precision = 2;
                }
            }
            if (precision < 0 || precision > 17) precision = 2;
            char buffer[64];
            std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value.get<double>());
            return {buffer};
        }
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string MessageFormatter::format(const std::string& message_template, const nlohmann::json& parameters) {
        std::shared_ptr<const Segments> segments;
        {
            std::lock_guard lock(mutex_);
            if (const auto it = cache_.find(message_template); it != cache_.end()) segments = it->second;
        }
        if (!segments) {
            segments = std::make_shared<const Segments>(parse(message_template));
            std::lock_guard lock(mutex_);
            if (cache_.size() >= kMaxCachedTemplates) cache_.clear();
            cache_.emplace(message_template, segments);
        }

        std::string out;
        out.reserve(message_template.size() + 16);
        for (const auto& seg : *segments) {
            if (!seg.placeholder) {
                out += seg.text;
                continue;
            }
            const auto it = parameters.find(seg.text);
            out += it != parameters.end() ? render_value(*it, seg.format) : kMissingParameter;
        }
        return out;
    }

    size_t MessageFormatter::cached_templates() const {
        std::lock_guard lock(mutex_);
        return cache_.size();
    }

} // namespace SQLiteLogKit
