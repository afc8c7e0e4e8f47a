#include "SQLiteLogKit/ConnectionGuard.hxx"
#include "SQLiteLogKit/Exporter.hxx"
#include "SQLiteLogKit/LogReader.hxx"
#include "SQLiteLogKit/LogWriter.hxx"
#include "SQLiteLogKit/Sqlite.hxx"

#include "support/TempDatabase.hxx"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sqlite3.h>

#include <stdexcept>

using namespace SQLiteLogKit;
using namespace std::chrono_literals;
using SQLiteLogKit::test::TempDatabase;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

    const Timestamp kBase = std::chrono::sys_days{std::chrono::year{2025} / 6 / 15};

    LogEntry make(LogLevel level, const std::string& category, const std::string& message, int offset_s) {
        auto e = LogEntry::make(level, category, message);
        e.timestamp = kBase + std::chrono::seconds(offset_s);
        return e;
    }

    std::vector<std::string> messages(const std::vector<LogEntry>& entries) {
        std::vector<std::string> out;
        for (const auto& e : entries) out.push_back(e.rendered_message);
        return out;
    }

}

class reader_test : public ::testing::Test {
protected:
    void SetUp() override {
        auto order = make(LogLevel::Information, "Orders", "order 42 placed", 0);
        order.properties = {{"OrderId", 42}, {"Customer", "ada"}, {"Vip", true}};
        order.event_id = 7;
        order.event_name = "OrderPlaced";

        auto failure = make(LogLevel::Error, "Payments", "card declined for order 42", 10);
        failure.properties = {{"OrderId", 42}, {"Amount", 19.5}};
        failure.scopes = nlohmann::json{{"RequestId", "r-1"}};
        SerializedException ex;
        ex.type = "PaymentError";
        ex.message = "declined";
        failure.exception = std::make_shared<const SerializedException>(ex);

        auto warning = make(LogLevel::Warning, "Orders", "order 43 delayed", 20);
        warning.properties = {{"OrderId", 43}, {"Customer", "bob"}, {"Vip", false}};

        auto trace = make(LogLevel::Trace, "Diagnostics", "cache warmed", 30);

        writer_.write_batch({order, failure, warning, trace});
    }

    // Inserts a row through a separate raw connection, bypassing LogWriter.
    void insert_raw(const std::string& values) {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(guard_->get_db_path().string().c_str(), &db), SQLITE_OK);
        sqlite3_busy_timeout(db, 5000);
        const std::string sql =
            "INSERT INTO LogEntry (Category, EventId, EventName, Timestamp, Level, ThreadId, MessageTemplate, "
            "Properties, RenderedMessage, ExceptionJson, ScopesJson) VALUES (" + values + ")";
        char* error = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
        const std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }

    TempDatabase temp_;
    std::shared_ptr<ConnectionGuard> guard_ = std::make_shared<ConnectionGuard>(temp_.path());
    LogWriter writer_{guard_};
    LogReader reader_{guard_};
};

TEST_F(reader_test, reads_back_every_field) {
    const auto all = reader_.all_entries();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(reader_.entry_count(), 4);

    const auto& order = all[0];
    EXPECT_GT(order.db_id, 0);
    EXPECT_EQ(order.category, "Orders");
    EXPECT_EQ(order.level, LogLevel::Information);
    EXPECT_EQ(order.timestamp, kBase);
    EXPECT_EQ(order.event_id, 7);
    EXPECT_EQ(order.event_name, "OrderPlaced");
    EXPECT_EQ(order.properties.at("Customer"), "ada");
    EXPECT_FALSE(order.scopes.has_value());
    EXPECT_EQ(order.exception, nullptr);
    EXPECT_EQ(order.thread_id, current_thread_id());

    const auto& failure = all[1];
    ASSERT_NE(failure.exception, nullptr);
    EXPECT_EQ(failure.exception->type, "PaymentError");
    ASSERT_TRUE(failure.scopes.has_value());
    EXPECT_EQ(failure.scopes->at("RequestId"), "r-1");
    EXPECT_FALSE(failure.event_name.has_value());
}

TEST_F(reader_test, filters_by_level_range_and_category) {
    LogFilter filter;
    filter.min_level = LogLevel::Warning;
    EXPECT_THAT(messages(reader_.entries(filter)), ElementsAre("card declined for order 42", "order 43 delayed"));

    filter = {};
    filter.max_level = LogLevel::Information;
    filter.category = "Orders";
    EXPECT_THAT(messages(reader_.entries(filter)), ElementsAre("order 42 placed"));
}

TEST_F(reader_test, filters_by_text_and_time_window) {
    LogFilter filter;
    filter.search_text = "order 4";
    EXPECT_EQ(reader_.entries(filter).size(), 3u);

    filter = {};
    filter.since = kBase + 10s;
    filter.until = kBase + 30s;
    EXPECT_THAT(messages(reader_.entries(filter)), ElementsAre("card declined for order 42", "order 43 delayed"));
}

TEST_F(reader_test, pages_in_insertion_order) {
    EXPECT_THAT(messages(reader_.entries({}, Page{1, 2})),
                ElementsAre("card declined for order 42", "order 43 delayed"));
    EXPECT_THAT(reader_.entries({}, Page{10, 5}), IsEmpty());
    EXPECT_EQ(reader_.entries({}, Page{0, -1}).size(), 4u);
}

TEST_F(reader_test, recent_entries_returns_newest_first) {
    EXPECT_THAT(messages(reader_.recent_entries(2)), ElementsAre("cache warmed", "order 43 delayed"));
    EXPECT_EQ(reader_.recent_entries(100).size(), 4u);
    EXPECT_THROW((void)reader_.recent_entries(0), std::invalid_argument);
}

TEST_F(reader_test, finds_entries_by_property_value) {
    EXPECT_EQ(reader_.entries_by_property("OrderId", 42).size(), 2u);
    EXPECT_THAT(messages(reader_.entries_by_property("Customer", "bob")), ElementsAre("order 43 delayed"));
    EXPECT_THAT(messages(reader_.entries_by_property("Vip", true)), ElementsAre("order 42 placed"));
    EXPECT_THAT(messages(reader_.entries_by_property("Amount", 19.5)), ElementsAre("card declined for order 42"));
    EXPECT_THAT(reader_.entries_by_property("Missing", 1), IsEmpty());
    EXPECT_THAT(reader_.entries_by_property("bad\"key", 1), IsEmpty());
}

TEST_F(reader_test, malformed_rows_decode_to_safe_defaults) {
    insert_raw("'Raw', 1, NULL, 'not a time', 'loud', 0, 'tpl', 'not json', 'msg', '{broken', '[1,2]'");
    insert_raw("NULL, 2, NULL, '2025-06-15T00:01:00.000000Z', 42, 0, 'tpl', '[\"array\"]', 'msg2', "
               "'{\"Message\":\"no type\"}', '{\"Scope\":1}'");

    const auto all = reader_.all_entries();
    ASSERT_EQ(all.size(), 6u);

    const auto& bad = all[4];
    EXPECT_EQ(bad.category, "Raw");
    EXPECT_EQ(bad.level, LogLevel::None);
    EXPECT_EQ(bad.timestamp, Timestamp{});
    EXPECT_TRUE(bad.properties.is_object());
    EXPECT_TRUE(bad.properties.empty());
    EXPECT_EQ(bad.exception, nullptr);
    EXPECT_FALSE(bad.scopes.has_value());

    const auto& odd = all[5];
    EXPECT_EQ(odd.category, "");
    EXPECT_EQ(odd.level, LogLevel::None);
    EXPECT_EQ(odd.timestamp, kBase + 60s);
    EXPECT_TRUE(odd.properties.empty());
    EXPECT_EQ(odd.exception, nullptr);
    ASSERT_TRUE(odd.scopes.has_value());
    EXPECT_EQ(odd.scopes->at("Scope"), 1);
}

TEST_F(reader_test, reports_file_size_including_wal) {
    EXPECT_GT(reader_.database_file_size(), 0u);
}

TEST_F(reader_test, exporter_copies_selected_rows) {
    const auto all = reader_.all_entries();
    const auto destination = temp_.path("Export");

    const auto copied = Exporter::export_entries(temp_.path(), destination,
                                                 {all[1].db_id, all[3].db_id, 12345});
    EXPECT_EQ(copied, 2u);

    auto dst = std::make_shared<ConnectionGuard>(destination);
    const LogReader exported(dst);
    const auto rows = exported.all_entries();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].rendered_message, "card declined for order 42");
    EXPECT_EQ(rows[0].properties, all[1].properties);
    ASSERT_NE(rows[0].exception, nullptr);
    EXPECT_EQ(rows[0].timestamp, all[1].timestamp);
    EXPECT_EQ(rows[1].category, "Diagnostics");

    EXPECT_EQ(reader_.entry_count(), 4);
}

TEST_F(reader_test, exporter_rejects_missing_source) {
    EXPECT_THROW(Exporter::export_entries(temp_.dir() / "absent.db", temp_.path("Export"), {1}),
                 std::invalid_argument);
}

TEST_F(reader_test, time_bounds_below_storage_precision_round_up) {
    LogFilter until;
    until.until = kBase + 500ns;
    EXPECT_THAT(messages(reader_.entries(until)), ElementsAre("order 42 placed"));

    LogFilter since;
    since.since = kBase + 500ns;
    since.until = kBase + 11s;
    EXPECT_THAT(messages(reader_.entries(since)), ElementsAre("card declined for order 42"));
}
