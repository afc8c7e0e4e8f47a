#pragma once

#include "SQLiteLogKit/SchemaCatalog.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace SQLiteLogKit::test {

    // Unique scratch directory per test; removed (with every file in it) on destruction.
    class TempDatabase {
    public:
        TempDatabase() {
            static std::atomic<int> counter{0};
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "sqlitelogkit";
            for (auto& c : name) {
                if (c == '/') c = '_';
            }
            dir_ = std::filesystem::temp_directory_path() /
                   (name + "_" + std::to_string(++counter) + "_" + std::to_string(::getpid()));
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
            std::filesystem::create_directories(dir_);
        }

        ~TempDatabase() {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        TempDatabase(const TempDatabase&) = delete;
        TempDatabase& operator=(const TempDatabase&) = delete;

        [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

        [[nodiscard]] std::filesystem::path path(const std::string& stem = "Log") const {
            return dir_ / SchemaCatalog::versioned_file_name(stem);
        }

    private:
        std::filesystem::path dir_;
    };

} // namespace SQLiteLogKit::test
