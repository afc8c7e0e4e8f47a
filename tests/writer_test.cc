#include "SQLiteLogKit/BatchWriter.hxx"
#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Errors.hxx"
#include "SQLiteLogKit/LogReader.hxx"
#include "SQLiteLogKit/LogWriter.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include "support/TempDatabase.hxx"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sqlite3.h>

#include <optional>
#include <thread>

using namespace SQLiteLogKit;
using namespace std::chrono_literals;
using SQLiteLogKit::test::TempDatabase;
using ::testing::Field;

namespace {

    LogEntry entry(const std::string& message) {
        return LogEntry::make(LogLevel::Information, "WriterTest", message);
    }

    // Makes every insert of a row whose template is "poison" fail.
    void install_poison_trigger(ConnectionGuard& guard) {
        { const auto lease = guard.acquire(); } // creates the table

        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(guard.get_db_path().string().c_str(), &db), SQLITE_OK);
        char* error = nullptr;
        const int rc = sqlite3_exec(db,
                                    "CREATE TRIGGER reject_poison BEFORE INSERT ON LogEntry "
                                    "WHEN NEW.MessageTemplate = 'poison' "
                                    "BEGIN SELECT RAISE(ABORT, 'injected failure'); END;",
                                    nullptr, nullptr, &error);
        sqlite3_free(error);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK);
    }

    std::vector<std::string> messages(const LogReader& reader) {
        std::vector<std::string> out;
        for (const auto& e : reader.all_entries()) out.push_back(e.message_template);
        return out;
    }

    BatchingOptions fast_options() {
        BatchingOptions options;
        options.max_batch_size = 10;
        options.max_wait_time = 20ms;
        options.retry_backoff = 1ms;
        return options;
    }

}

class writer_test : public ::testing::Test {
protected:
    TempDatabase temp_;
    std::shared_ptr<ConnectionGuard> guard_ = std::make_shared<ConnectionGuard>(temp_.path());
    LogReader reader_{guard_};
};

TEST_F(writer_test, guard_creates_directories_and_uses_wal) {
    const auto nested = temp_.dir() / "a" / "b" / SchemaCatalog::versioned_file_name("Nested");
    ConnectionGuard guard(nested);
    const auto lease = guard.acquire();
    EXPECT_TRUE(std::filesystem::exists(nested));

    Statement mode(lease.db(), "PRAGMA journal_mode;");
    ASSERT_TRUE(mode.step());
    EXPECT_EQ(mode.column_text(0), "wal");
}

TEST_F(writer_test, guard_rejects_use_after_close) {
    guard_->close();
    guard_->close();
    EXPECT_FALSE(guard_->is_open());
    EXPECT_THROW((void)guard_->acquire(), DisposedError);
    EXPECT_THROW((void)guard_->acquire_reader(), DisposedError);
}

TEST_F(writer_test, log_writer_commits_whole_batch) {
    LogWriter writer(guard_);
    writer.write_batch({entry("one"), entry("two"), entry("three")});
    EXPECT_EQ(reader_.entry_count(), 3);
    EXPECT_THAT(messages(reader_), ::testing::ElementsAre("one", "two", "three"));
}

TEST_F(writer_test, log_writer_failure_leaves_no_partial_batch) {
    install_poison_trigger(*guard_);
    LogWriter writer(guard_);
    EXPECT_THROW(writer.write_batch({entry("before"), entry("poison"), entry("after")}), StorageError);
    EXPECT_EQ(reader_.entry_count(), 0);

    writer.write_batch({entry("clean")});
    EXPECT_EQ(reader_.entry_count(), 1);
}

TEST_F(writer_test, batches_preserve_enqueue_order) {
    BatchWriter writer(guard_, fast_options());
    std::vector<std::string> expected;
    for (int i = 0; i < 57; ++i) {
        expected.push_back("m" + std::to_string(i));
        ASSERT_TRUE(writer.enqueue(entry(expected.back())));
    }
    ASSERT_TRUE(writer.flush(5s));
    EXPECT_EQ(messages(reader_), expected);
    EXPECT_EQ(writer.written_entry_count(), 57u);
    EXPECT_EQ(writer.pending_count(), 0u);
}

TEST_F(writer_test, flush_writes_a_partial_batch_without_waiting_for_max_wait) {
    auto options = fast_options();
    options.max_batch_size = 100;
    options.max_wait_time = 1h;
    BatchWriter writer(guard_, options);

    ASSERT_TRUE(writer.enqueue(entry("a")));
    ASSERT_TRUE(writer.enqueue(entry("b")));
    ASSERT_TRUE(writer.flush(5s));
    EXPECT_EQ(reader_.entry_count(), 2);
}

TEST_F(writer_test, max_wait_triggers_write_of_partial_batch) {
    auto options = fast_options();
    options.max_batch_size = 100;
    options.max_wait_time = 30ms;
    BatchWriter writer(guard_, options);

    ASSERT_TRUE(writer.enqueue(entry("lonely")));
    for (int i = 0; i < 200 && reader_.entry_count() == 0; ++i) std::this_thread::sleep_for(10ms);
    EXPECT_EQ(reader_.entry_count(), 1);
}

TEST_F(writer_test, drop_policy_counts_rejected_entries) {
    auto options = fast_options();
    options.queue_capacity = 2;
    options.max_batch_size = 100;
    options.max_wait_time = 1h;
    BatchWriter writer(guard_, options);

    int accepted = 0;
    for (int i = 0; i < 5; ++i) accepted += writer.enqueue(entry("e" + std::to_string(i))) ? 1 : 0;

    EXPECT_EQ(accepted, 2);
    EXPECT_EQ(writer.discarded_count(), 3u);
    EXPECT_EQ(writer.pending_count(), 2u);

    ASSERT_TRUE(writer.flush(5s));
    EXPECT_THAT(messages(reader_), ::testing::ElementsAre("e0", "e1"));

    writer.reset_discarded_count();
    EXPECT_EQ(writer.discarded_count(), 0u);
}

TEST_F(writer_test, block_policy_never_discards) {
    auto options = fast_options();
    options.queue_capacity = 1;
    options.max_batch_size = 1;
    options.max_wait_time = 5ms;
    options.overflow_policy = OverflowPolicy::Block;
    BatchWriter writer(guard_, options);

    std::vector<std::jthread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&writer, t] {
            for (int i = 0; i < 10; ++i) {
                EXPECT_TRUE(writer.enqueue(entry("t" + std::to_string(t) + "-" + std::to_string(i))));
            }
        });
    }
    producers.clear();

    ASSERT_TRUE(writer.flush(10s));
    EXPECT_EQ(reader_.entry_count(), 40);
    EXPECT_EQ(writer.discarded_count(), 0u);
}

TEST_F(writer_test, failing_batch_is_retried_then_dropped_and_reported) {
    install_poison_trigger(*guard_);

    ::testing::MockFunction<void(const StorageFailure&)> on_failure;
    EXPECT_CALL(on_failure, Call(::testing::AllOf(Field(&StorageFailure::operation, "batch insert"),
                                                  Field(&StorageFailure::entries_lost, 3u))))
        .Times(1);

    auto options = fast_options();
    options.max_batch_size = 3;
    options.max_wait_time = 1h;
    options.max_retries = 2;
    BatchWriter writer(guard_, options, nullptr, on_failure.AsStdFunction());

    ASSERT_TRUE(writer.enqueue(entry("ok-1")));
    ASSERT_TRUE(writer.enqueue(entry("poison")));
    ASSERT_TRUE(writer.enqueue(entry("ok-2")));
    ASSERT_TRUE(writer.flush(5s));

    EXPECT_EQ(reader_.entry_count(), 0);
    EXPECT_EQ(writer.failed_batch_count(), 1u);
    EXPECT_EQ(writer.lost_entry_count(), 3u);

    ASSERT_TRUE(writer.enqueue(entry("ok-3")));
    ASSERT_TRUE(writer.flush(5s));
    EXPECT_THAT(messages(reader_), ::testing::ElementsAre("ok-3"));
    EXPECT_EQ(writer.failed_batch_count(), 1u);
}

TEST_F(writer_test, stop_drains_and_rejects_later_entries) {
    auto options = fast_options();
    options.max_wait_time = 1h;
    BatchWriter writer(guard_, options);
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(writer.enqueue(entry("s" + std::to_string(i))));

    EXPECT_TRUE(writer.stop(5s));
    EXPECT_FALSE(writer.is_running());
    EXPECT_EQ(reader_.entry_count(), 5);
    EXPECT_FALSE(writer.enqueue(entry("late")));
    EXPECT_TRUE(writer.stop(5s));
}

TEST_F(writer_test, stop_timeout_abandons_queued_entries) {
    auto options = fast_options();
    options.max_batch_size = 1;
    options.max_wait_time = 1ms;
    BatchWriter writer(guard_, options);

    // Holding the writer lease stalls the worker on its first batch.
    std::optional<ConnectionGuard::Lease> held(guard_->acquire());
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(writer.enqueue(entry("x" + std::to_string(i))));

    bool drained = true;
    std::jthread stopper([&writer, &drained] { drained = writer.stop(50ms); });
    std::this_thread::sleep_for(300ms);
    held.reset();
    stopper.join();

    EXPECT_FALSE(drained);
    EXPECT_GE(writer.abandoned_entry_count(), 4u);
    EXPECT_EQ(writer.abandoned_entry_count() + writer.written_entry_count(), 5u);
}

TEST_F(writer_test, invalid_options_are_rejected) {
    auto options = fast_options();
    options.max_batch_size = 0;
    EXPECT_THROW(BatchWriter(guard_, options), ConfigError);

    options = fast_options();
    options.queue_capacity = 0;
    EXPECT_THROW(BatchWriter(guard_, options), ConfigError);
}

TEST_F(writer_test, invalid_utf8_in_exception_does_not_cost_the_batch) {
    auto options = fast_options();
    options.max_batch_size = 3;
    options.max_wait_time = 1h;
    BatchWriter writer(guard_, options);

    auto broken = entry("broken");
    SerializedException ex;
    ex.type = "DecodeError";
    ex.message = "unexpected byte \xff";
    broken.exception = std::make_shared<const SerializedException>(ex);

    ASSERT_TRUE(writer.enqueue(entry("good-1")));
    ASSERT_TRUE(writer.enqueue(std::move(broken)));
    ASSERT_TRUE(writer.enqueue(entry("good-2")));
    ASSERT_TRUE(writer.flush(5s));

    EXPECT_EQ(writer.lost_entry_count(), 0u);
    const auto all = reader_.all_entries();
    ASSERT_EQ(all.size(), 3u);
    ASSERT_NE(all[1].exception, nullptr);
    EXPECT_EQ(all[1].exception->message, "unexpected byte \xEF\xBF\xBD");
}

TEST_F(writer_test, stop_is_bounded_while_another_connection_holds_the_lock) {
    { const auto lease = guard_->acquire(); } // creates the table

    sqlite3* locker = nullptr;
    ASSERT_EQ(sqlite3_open(guard_->get_db_path().string().c_str(), &locker), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(locker, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);

    ::testing::MockFunction<void(const StorageFailure&)> on_failure;
    EXPECT_CALL(on_failure, Call(Field(&StorageFailure::entries_lost, 1u))).Times(1);

    auto options = fast_options();
    options.max_batch_size = 1;
    options.max_retries = 5;
    options.retry_backoff = 1s;
    BatchWriter writer(guard_, options, nullptr, on_failure.AsStdFunction());
    ASSERT_TRUE(writer.enqueue(entry("blocked")));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(writer.stop(100ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(elapsed, 1s);

    EXPECT_EQ(writer.failed_batch_count(), 1u);
    EXPECT_EQ(writer.lost_entry_count(), 1u);
    EXPECT_EQ(writer.written_entry_count(), 0u);

    sqlite3_exec(locker, "ROLLBACK", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    // The guard is usable again once the lock is gone.
    LogWriter direct(guard_);
    direct.write_batch({entry("after")});
    EXPECT_EQ(reader_.entry_count(), 1);
}
