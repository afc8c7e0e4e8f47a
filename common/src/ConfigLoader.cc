#include "SQLiteLogKit/ConfigLoader.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"
#include "SQLiteLogKit/Errors.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace SQLiteLogKit {

    using nlohmann::json;

    namespace {

        const json* section(const json& config, const char* name) {
            const auto it = config.find(name);
            if (it == config.end() || it->is_null()) return nullptr;
            if (!it->is_object()) throw ConfigError(std::string("\"") + name + "\" must be an object");
            return &*it;
        }

        template <typename T>
        bool read(const json* from, const char* section_name, const char* key, T& out) {
            if (!from) return false;
            const auto it = from->find(key);
            if (it == from->end() || it->is_null()) return false;
            try {
                out = it->get<T>();
            } catch (const json::exception& ex) {
                throw ConfigError(std::string(section_name) + "." + key + ": " + ex.what());
            }
            return true;
        }

        // Keys that accept null to switch a limit off.
        bool is_explicit_null(const json* from, const char* key) {
            if (!from) return false;
            const auto it = from->find(key);
            return it != from->end() && it->is_null();
        }

        std::string lowercase(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        OverflowPolicy overflow_policy_from(const std::string& text) {
            const auto value = lowercase(text);
            if (value == "drop") return OverflowPolicy::Drop;
            if (value == "block") return OverflowPolicy::Block;
            throw ConfigError("batching.overflow_policy: unknown value \"" + text + "\"");
        }

        HousekeepingMode mode_from(const std::string& text) {
            const auto value = lowercase(text);
            if (value == "automatic") return HousekeepingMode::Automatic;
            if (value == "manual") return HousekeepingMode::Manual;
            throw ConfigError("housekeeping.mode: unknown value \"" + text + "\"");
        }

        spdlog::level::level_enum diagnostics_level_from(const std::string& text) {
            const auto value = lowercase(text);
            const auto level = spdlog::level::from_str(value);
            if (level == spdlog::level::off && value != "off") {
                throw ConfigError("diagnostics.level: unknown value \"" + text + "\"");
            }
            return level;
        }

    } // namespace

    ConfigLoader::ConfigLoader(std::filesystem::path config_path) : path_(std::move(config_path)) {}

    SinkOptions ConfigLoader::load() const {
        std::ifstream in(path_);
        if (!in) throw ConfigError("cannot open config file " + path_.string());

        json config;
        try {
            config = json::parse(in);
        } catch (const json::parse_error& ex) {
            throw ConfigError("malformed config file " + path_.string() + ": " + ex.what());
        }
        return parse(config);
    }

    SinkOptions ConfigLoader::parse(const json& config) {
        if (!config.is_object()) throw ConfigError("config root must be an object");

        SinkOptions options;

        const json* database = section(config, "database");
        std::string folder = ".";
        std::string stem = "Log";
        read(database, "database", "folder", folder);
        read(database, "database", "stem", stem);
        if (stem.empty()) throw ConfigError("database.stem must not be empty");
        options.database_path = std::filesystem::path(folder) / SchemaCatalog::versioned_file_name(stem);

        const json* batching = section(config, "batching");
        auto& b = options.batching;
        std::int64_t number = 0;
        if (read(batching, "batching", "max_batch_size", number)) {
            if (number <= 0) throw ConfigError("batching.max_batch_size must be positive");
            b.max_batch_size = static_cast<size_t>(number);
        }
        if (read(batching, "batching", "max_wait_ms", number)) b.max_wait_time = std::chrono::milliseconds(number);
        if (read(batching, "batching", "queue_capacity", number)) {
            if (number <= 0) throw ConfigError("batching.queue_capacity must be positive");
            b.queue_capacity = static_cast<size_t>(number);
        }
        std::string text;
        if (read(batching, "batching", "overflow_policy", text)) b.overflow_policy = overflow_policy_from(text);
        read(batching, "batching", "max_retries", b.max_retries);
        if (read(batching, "batching", "retry_backoff_ms", number)) b.retry_backoff = std::chrono::milliseconds(number);

        const json* housekeeping = section(config, "housekeeping");
        auto& h = options.housekeeping;
        if (read(housekeeping, "housekeeping", "mode", text)) h.mode = mode_from(text);
        if (read(housekeeping, "housekeeping", "max_age_seconds", number)) {
            h.max_age = std::chrono::seconds(number);
        } else if (is_explicit_null(housekeeping, "max_age_seconds")) {
            h.max_age.reset();
        }
        if (read(housekeeping, "housekeeping", "max_row_count", number)) {
            h.max_row_count = number;
        } else if (is_explicit_null(housekeeping, "max_row_count")) {
            h.max_row_count.reset();
        }
        if (read(housekeeping, "housekeeping", "sweep_interval_seconds", number)) {
            h.sweep_interval = std::chrono::seconds(number);
        }
        read(housekeeping, "housekeeping", "vacuum_after_sweep", h.vacuum_after_sweep);

        const json* diagnostics = section(config, "diagnostics");
        if (read(diagnostics, "diagnostics", "level", text)) {
            options.diagnostics = make_diagnostics_logger("sqlitelogkit", diagnostics_level_from(text));
        }

        b.validate();
        h.validate();
        return options;
    }

} // namespace SQLiteLogKit
