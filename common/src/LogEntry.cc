#include "SQLiteLogKit/LogEntry.hxx"

#include <cstdio>
#include <functional>
#include <thread>

namespace SQLiteLogKit {

    using namespace std::chrono;

    std::int64_t current_thread_id() {
        return static_cast<std::int64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0x7fffffffffffffffULL);
    }

    Timestamp current_timestamp() {
        return time_point_cast<StoragePrecision>(Clock::now());
    }

    Timestamp storage_ceil(const Timestamp ts) {
        return std::chrono::ceil<StoragePrecision>(ts);
    }

    LogEntry LogEntry::make(const LogLevel level, std::string category, std::string message) {
        LogEntry entry;
        entry.level = level;
        entry.category = std::move(category);
        entry.rendered_message = message;
        entry.message_template = std::move(message);
        entry.thread_id = current_thread_id();
        return entry;
    }

    std::string LogEntry::to_string() const {
        std::string out = "[" + format_timestamp(timestamp) + "] ";
        out += SQLiteLogKit::to_string(level);
        if (!category.empty()) out += " " + category;
        out += ": " + rendered_message;
        return out;
    }

    std::string format_timestamp(const Timestamp ts) {
        const auto us = time_point_cast<microseconds>(ts);
        const auto midnight = std::chrono::floor<days>(us);
        const year_month_day ymd{midnight};
        const hh_mm_ss<microseconds> tod{us - midnight};

        char buffer[40];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(tod.hours().count()),
                      static_cast<int>(tod.minutes().count()),
                      static_cast<int>(tod.seconds().count()),
                      static_cast<long long>(tod.subseconds().count()));
        return {buffer};
    }

    std::optional<Timestamp> parse_timestamp(std::string_view text) {
        if (text.size() < 19) return std::nullopt;
        const std::string s(text);

        int y = 0;
        unsigned mo = 0, d = 0;
        int h = 0, mi = 0, sec = 0;
        int consumed = 0;
        if (std::sscanf(s.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &sec, &consumed) != 6 ||
            consumed != 19) {
            return std::nullopt;
        }

        const year_month_day ymd{year{y}, month{mo}, day{d}};
        if (!ymd.ok() || h > 23 || mi > 59 || sec > 60) return std::nullopt;

        long long micros = 0;
        size_t pos = 19;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 6) {
                    micros = micros * 10 + (s[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 6; ++digits) micros *= 10;
        }
        if (pos < s.size() && s[pos] == 'Z') ++pos;
        if (pos != s.size()) return std::nullopt;

        const auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec} + microseconds{micros};
        return time_point_cast<Clock::duration>(tp);
    }

} // namespace SQLiteLogKit
