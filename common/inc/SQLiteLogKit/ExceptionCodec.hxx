#pragma once

#include <nlohmann/json.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace SQLiteLogKit {

    // Language-neutral snapshot of an exception and its cause chain.
    struct SerializedException {
        std::string type;
        std::string message;
        std::optional<std::string> stack_trace;
        std::optional<std::string> source;
        nlohmann::json data = nlohmann::json::object();
        std::unique_ptr<SerializedException> inner;

        SerializedException() = default;
        SerializedException(const SerializedException& other);
        SerializedException& operator=(const SerializedException& other);
        SerializedException(SerializedException&&) noexcept = default;
        SerializedException& operator=(SerializedException&&) noexcept = default;
        ~SerializedException();

        // 1 for a node without a cause.
        [[nodiscard]] size_t depth() const;
    };

    class ExceptionCodec {
    public:
        // Decoding stops descending past this many nested causes.
        static constexpr size_t kMaxDepth = 64;

        // Walks std::nested_exception causes; AnnotatedError contributes data/source/stack trace.
        static SerializedException flatten(const std::exception& ex);
        static std::optional<SerializedException> flatten(const std::exception_ptr& ex);

        static std::string encode(const SerializedException& ex);
        static std::string encode(const std::exception& ex) { return encode(flatten(ex)); }

        // nullopt for empty/blank text, malformed JSON, or JSON without a "Type" string.
        static std::optional<SerializedException> decode(std::string_view text);

        static nlohmann::json to_json(const SerializedException& ex);
        static std::optional<SerializedException> from_json(const nlohmann::json& j);

        // Demangled dynamic type name of ex.
        static std::string type_name(const std::exception& ex);
    };

} // namespace SQLiteLogKit
