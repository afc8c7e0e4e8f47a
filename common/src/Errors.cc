#include "SQLiteLogKit/Errors.hxx"

#include <sqlite3.h>

namespace SQLiteLogKit {

    StorageError::StorageError(const std::string& what, const int code)
        : std::runtime_error(what), code_(code) {}

    bool StorageError::transient() const noexcept {
        const int primary = code_ & 0xff;
        return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
    }

    DisposedError::DisposedError(const std::string& object_name)
        : std::logic_error(object_name + " has been disposed") {}

    AnnotatedError::AnnotatedError(const std::string& message,
                                   nlohmann::json data,
                                   std::optional<std::string> source,
                                   std::optional<std::string> stack_trace)
        : std::runtime_error(message),
          data_(data.is_object() ? std::move(data) : nlohmann::json::object()),
          source_(std::move(source)),
          stack_trace_(std::move(stack_trace)) {}

} // namespace SQLiteLogKit
