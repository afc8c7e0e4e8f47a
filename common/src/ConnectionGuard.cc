#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Diagnostics.hxx"
#include "SQLiteLogKit/Errors.hxx"
#include "SQLiteLogKit/SchemaCatalog.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include <sqlite3.h>

#include <chrono>
#include <thread>

namespace SQLiteLogKit {

    namespace {
        constexpr int kBusyTimeoutMs = 5000;
        constexpr int kBusyPollMs = 10;

        sqlite3* open_connection(const std::filesystem::path& path, const int flags) {
            sqlite3* db = nullptr;
            const int rc = sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr);
            if (rc != SQLITE_OK) {
                std::string msg = "cannot open " + path.string() + ": ";
                msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
                sqlite3_close_v2(db);
                throw StorageError(msg, rc);
            }
            sqlite3_busy_timeout(db, kBusyTimeoutMs);
            return db;
        }
    }

    ConnectionGuard::ConnectionGuard(std::filesystem::path path, std::shared_ptr<spdlog::logger> diagnostics)
        : db_path_(std::move(path)), log_(resolve_diagnostics(std::move(diagnostics))) {
        if (db_path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(db_path_.parent_path(), ec);
            if (ec) {
                throw StorageError("cannot create directory " + db_path_.parent_path().string() + ": " +
                                   ec.message(), SQLITE_CANTOPEN);
            }
        }

        db_ = open_connection(db_path_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX);
        sqlite3_busy_handler(db_, &ConnectionGuard::busy_handler, this);
        try {
            exec_sql(db_, "PRAGMA journal_mode=WAL;");
            exec_sql(db_, "PRAGMA synchronous=NORMAL;");
        } catch (const StorageError&) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
            throw;
        }
        log_->debug("opened log database {}", db_path_.string());
    }

    ConnectionGuard::~ConnectionGuard() { close(); }

    // Same budget as sqlite3_busy_timeout, polled in 10 ms steps; abort_busy_waits() ends the wait.
    int ConnectionGuard::busy_handler(void* self, const int attempts) {
        const auto* guard = static_cast<const ConnectionGuard*>(self);
        if (guard->abort_busy_waits_ || attempts * kBusyPollMs >= kBusyTimeoutMs) return 0;
        std::this_thread::sleep_for(std::chrono::milliseconds(kBusyPollMs));
        return 1;
    }

    void ConnectionGuard::init_table(sqlite3* db) {
        exec_sql(db, SchemaCatalog::build_create_statement());
        table_ready_ = true;
        log_->debug("ensured table {} in {}", SchemaCatalog::kTableName, db_path_.string());
    }

    ConnectionGuard::Lease ConnectionGuard::acquire() {
        std::unique_lock lock(write_mutex_);
        if (closed_ || !db_) throw DisposedError("ConnectionGuard(" + db_path_.string() + ")");
        if (!table_ready_) init_table(db_);
        return {std::move(lock), db_};
    }

    ConnectionGuard::Lease ConnectionGuard::acquire_reader() {
        if (!table_ready_) {
            (void)acquire();
        }
        std::unique_lock lock(read_mutex_);
        if (closed_) throw DisposedError("ConnectionGuard(" + db_path_.string() + ")");
        if (!reader_) {
            reader_ = open_connection(db_path_, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
        }
        return {std::move(lock), reader_};
    }

    void ConnectionGuard::close() {
        std::scoped_lock lock(write_mutex_, read_mutex_);
        if (closed_.exchange(true)) return;
        if (reader_) {
            sqlite3_close_v2(reader_);
            reader_ = nullptr;
        }
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
        log_->debug("closed log database {}", db_path_.string());
    }

    std::uintmax_t ConnectionGuard::database_file_size() const {
        std::uintmax_t total = 0;
        std::error_code ec;
        const auto main = std::filesystem::file_size(db_path_, ec);
        if (!ec) total += main;
        auto wal = db_path_;
        wal += "-wal";
        const auto wal_size = std::filesystem::file_size(wal, ec);
        if (!ec) total += wal_size;
        return total;
    }

} // namespace SQLiteLogKit
