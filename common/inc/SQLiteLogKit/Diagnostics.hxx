#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace SQLiteLogKit {

    // Unregistered stderr logger for the library's own diagnostics.
    std::shared_ptr<spdlog::logger> make_diagnostics_logger(const std::string& name,
                                                            spdlog::level::level_enum level = spdlog::level::warn);

    // logger, or spdlog's default logger when null.
    std::shared_ptr<spdlog::logger> resolve_diagnostics(std::shared_ptr<spdlog::logger> logger);

} // namespace SQLiteLogKit
