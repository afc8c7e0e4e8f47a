#include "SQLiteLogKit/Diagnostics.hxx"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace SQLiteLogKit {

    std::shared_ptr<spdlog::logger> make_diagnostics_logger(const std::string& name,
                                                            const spdlog::level::level_enum level) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        return logger;
    }

    std::shared_ptr<spdlog::logger> resolve_diagnostics(std::shared_ptr<spdlog::logger> logger) {
        return logger ? std::move(logger) : spdlog::default_logger();
    }

} // namespace SQLiteLogKit
