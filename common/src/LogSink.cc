#include "SQLiteLogKit/LogSink.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"
#include "SQLiteLogKit/Errors.hxx"
#include "SQLiteLogKit/ExceptionCodec.hxx"

namespace SQLiteLogKit {

    namespace {
        SinkOptions validated(SinkOptions options) {
            if (options.database_path.empty()) throw ConfigError("database_path must not be empty");
            options.batching.validate();
            options.housekeeping.validate();
            return options;
        }
    }

    LogSink::LogSink(SinkOptions options)
        : options_(validated(std::move(options))),
          log_(resolve_diagnostics(options_.diagnostics)),
          connection_(std::make_shared<ConnectionGuard>(options_.database_path, log_)),
          reader_(connection_) {
        writer_ = std::make_unique<BatchWriter>(connection_, options_.batching, log_, options_.on_failure);
        housekeeper_ = std::make_unique<Housekeeper>(connection_, options_.housekeeping, log_,
                                                     options_.on_failure, options_.clock);
        log_->info("log sink opened at {}", options_.database_path.string());
    }

    LogSink::~LogSink() {
        dispose();
    }

    void LogSink::ensure_alive(const char* operation) const {
        if (disposed_) throw DisposedError(std::string("LogSink (") + operation + ")");
    }

    bool LogSink::add(LogEntry entry) {
        ensure_alive("add");
        for (const auto& middleware : options_.middlewares) {
            if (middleware) middleware->process(entry);
        }
        if (!options_.on_entry_received) return writer_->enqueue(std::move(entry));

        LogEntry observed = entry;
        if (!writer_->enqueue(std::move(entry))) return false;
        try {
            options_.on_entry_received(observed);
        } catch (const std::exception& ex) {
            log_->error("entry listener threw: {}", ex.what());
        }
        return true;
    }

    bool LogSink::log(const LogLevel level, std::string category, std::string message_template,
                      nlohmann::json properties, const std::exception* error, EventId event) {
        ensure_alive("log");
        if (properties.is_null()) {
            properties = nlohmann::json::object();
        } else if (!properties.is_object()) {
            properties = nlohmann::json{{"value", std::move(properties)}};
        }

        LogEntry entry = LogEntry::make(level, std::move(category), std::move(message_template));
        entry.rendered_message = formatter_.format(entry.message_template, properties);
        entry.properties = std::move(properties);
        entry.event_id = event.id;
        entry.event_name = std::move(event.name);
        entry.scopes = scopes_.snapshot();
        if (error) {
            entry.exception = std::make_shared<const SerializedException>(ExceptionCodec::flatten(*error));
        }
        return add(std::move(entry));
    }

    bool LogSink::flush(const std::chrono::milliseconds timeout) {
        ensure_alive("flush");
        return writer_->flush(timeout);
    }

    bool LogSink::dispose(const std::chrono::milliseconds timeout) {
        std::lock_guard lock(dispose_mutex_);
        if (disposed_) return true;
        disposed_ = true;

        const bool drained = writer_->stop(timeout);
        housekeeper_->stop();
        connection_->close();
        if (drained) {
            log_->info("log sink at {} closed", options_.database_path.string());
        } else {
            log_->warn("log sink at {} closed with {} entries abandoned",
                       options_.database_path.string(), writer_->abandoned_entry_count());
        }
        return drained;
    }

    std::uint64_t LogSink::discarded_count() const { return writer_->discarded_count(); }

    void LogSink::reset_discarded_count() { writer_->reset_discarded_count(); }

    size_t LogSink::pending_count() const { return writer_->pending_count(); }

    std::uint64_t LogSink::failed_batch_count() const { return writer_->failed_batch_count(); }

    std::uint64_t LogSink::lost_entry_count() const { return writer_->lost_entry_count(); }

    Housekeeper& LogSink::housekeeper() {
        ensure_alive("housekeeper");
        return *housekeeper_;
    }

    const LogReader& LogSink::reader() const {
        ensure_alive("reader");
        return reader_;
    }

} // namespace SQLiteLogKit
