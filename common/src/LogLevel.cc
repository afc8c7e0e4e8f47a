#include "SQLiteLogKit/LogLevel.hxx"

#include <array>
#include <cctype>

namespace SQLiteLogKit {

    namespace {
        constexpr std::array<std::string_view, 7> kNames = {
            "Trace", "Debug", "Information", "Warning", "Error", "Critical", "None"
        };

        bool iequals(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i]))) return false;
            }
            return true;
        }
    }

    std::string_view to_string(const LogLevel level) {
        const auto idx = static_cast<size_t>(level);
        return idx < kNames.size() ? kNames[idx] : kNames.back();
    }

    LogLevel level_from_int(const long long value) {
        if (value < static_cast<long long>(LogLevel::Trace) ||
            value > static_cast<long long>(LogLevel::None)) {
            return LogLevel::None;
        }
        return static_cast<LogLevel>(value);
    }

    LogLevel level_from_string(std::string_view name) {
        for (size_t i = 0; i < kNames.size(); ++i) {
            if (iequals(kNames[i], name)) return static_cast<LogLevel>(i);
        }
        return LogLevel::None;
    }

} // namespace SQLiteLogKit
