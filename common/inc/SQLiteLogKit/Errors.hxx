#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace SQLiteLogKit {

    // Invalid options or configuration file; raised while constructing, never while logging.
    class ConfigError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A failed SQLite call. code() is the primary SQLite result code.
    class StorageError : public std::runtime_error {
    public:
        StorageError(const std::string& what, int code);

        [[nodiscard]] int code() const noexcept { return code_; }

        // SQLITE_BUSY / SQLITE_LOCKED: another connection holds the file.
        [[nodiscard]] bool transient() const noexcept;

    private:
        int code_;
    };

    // Use of a sink, reader or connection after it has been disposed.
    class DisposedError : public std::logic_error {
    public:
        explicit DisposedError(const std::string& object_name);
    };

    // An exception that carries the extra context ExceptionCodec stores alongside type and message.
    class AnnotatedError : public std::runtime_error {
    public:
        explicit AnnotatedError(const std::string& message,
                                nlohmann::json data = nlohmann::json::object(),
                                std::optional<std::string> source = std::nullopt,
                                std::optional<std::string> stack_trace = std::nullopt);

        [[nodiscard]] const nlohmann::json& data() const noexcept { return data_; }
        [[nodiscard]] const std::optional<std::string>& source() const noexcept { return source_; }
        [[nodiscard]] const std::optional<std::string>& stack_trace() const noexcept { return stack_trace_; }

    private:
        nlohmann::json data_;
        std::optional<std::string> source_;
        std::optional<std::string> stack_trace_;
    };

} // namespace SQLiteLogKit
