#include <gtest/gtest.h>

#include <sqlite3.h>

#include "profile/orchestrator.hpp"
#include "source/sqlite_source.hpp"
#include "test_helpers.hpp"

using namespace dprof;
using namespace dprof::testing;

namespace {

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    const std::string msg = err ? err : "";
    sqlite3_free(err);
    ASSERT_EQ(rc, SQLITE_OK) << msg;
}

class SqliteSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = (dir_.path() / "shop.db").string();
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
        exec_sql(db,
            "CREATE TABLE orders (id INTEGER, amount REAL, paid BOOLEAN, placed DATETIME, note TEXT);"
            "INSERT INTO orders VALUES (1, 9.5, 1, '2024-01-01 10:00:00', 'first');"
            "INSERT INTO orders VALUES (2, 12, 0, '2024-01-03 11:30:00', NULL);"
            "INSERT INTO orders VALUES (3, NULL, 1, NULL, 'third');"
            "CREATE TABLE \"odd \"\"name\"\"\" (x TEXT);"
            "INSERT INTO \"odd \"\"name\"\"\" VALUES ('a'), ('b');"
            "CREATE TABLE mixed (v);"
            "INSERT INTO mixed VALUES (1), ('two'), (3.5);");
        sqlite3_close(db);
    }

    temp_dir    dir_{"sqlite"};
    std::string db_path_;
};

}

TEST_F(SqliteSourceTest, ListsTablesWithColumns) {
    sqlite_source source(db_path_);
    const auto tables = source.list_tables();
    ASSERT_EQ(tables.size(), 3u);
    EXPECT_EQ(tables[0].name, "mixed");
    EXPECT_EQ(tables[1].name, "odd \"name\"");
    EXPECT_EQ(tables[2].name, "orders");
    EXPECT_EQ(tables[2].columns, (std::vector<std::string>{"id", "amount", "paid", "placed", "note"}));
}

TEST_F(SqliteSourceTest, FetchSettlesStorageTypes) {
    sqlite_source source(db_path_);
    const table t = source.fetch("orders", std::nullopt);
    ASSERT_EQ(t.columns.size(), 5u);
    EXPECT_EQ(t.rows(), 3u);
    EXPECT_EQ(t.columns[0].storage, storage_type::int64_);
    EXPECT_EQ(t.columns[1].storage, storage_type::float64_);
    EXPECT_EQ(t.columns[2].storage, storage_type::boolean_);
    EXPECT_EQ(t.columns[3].storage, storage_type::datetime_);
    EXPECT_EQ(t.columns[4].storage, storage_type::text_);
    EXPECT_DOUBLE_EQ(std::get<double>(t.columns[1].values[1]), 12.0);
    EXPECT_TRUE(is_null(t.columns[3].values[2]));
}

TEST_F(SqliteSourceTest, MixedColumnBecomesText) {
    sqlite_source source(db_path_);
    const table t = source.fetch("mixed", std::nullopt);
    EXPECT_EQ(t.columns[0].storage, storage_type::text_);
    EXPECT_EQ(std::get<std::string>(t.columns[0].values[0]), "1");
}

TEST_F(SqliteSourceTest, RowCapAndCount) {
    sqlite_source source(db_path_);
    EXPECT_EQ(source.fetch("orders", 2).rows(), 2u);
    EXPECT_EQ(source.count_records("orders"), 3u);
    EXPECT_EQ(source.count_records("odd \"name\""), 2u);
}

TEST_F(SqliteSourceTest, MissingTableThrows) {
    sqlite_source source(db_path_);
    EXPECT_THROW(source.fetch("nope", std::nullopt), data_source_error);
    EXPECT_THROW(source.count_records("nope; DROP TABLE orders"), data_source_error);
}

TEST_F(SqliteSourceTest, ProfilesThroughOrchestrator) {
    sqlite_source source(db_path_);
    settings cfg;
    cfg.max_threads = 2;
    profile_orchestrator orch(source, cfg);
    const auto report = orch.profile({"orders", "mixed", "nope"});
    ASSERT_EQ(report.size(), 3u);
    EXPECT_TRUE(is_error(*report.find("nope")));

    const auto& tp = std::get<table_profile>(*report.find("orders"));
    EXPECT_EQ(std::get<column_profile>(tp.columns[2].second).type, data_type::boolean_);
    const auto& placed = std::get<column_profile>(tp.columns[3].second);
    EXPECT_EQ(placed.type, data_type::datetime_);
    const auto& dt = std::get<datetime_stats>(placed.statistics);
    EXPECT_EQ(*dt.min_date, "2024-01-01T10:00:00");
    EXPECT_EQ(*dt.date_range_days, 2);
}

TEST(SqliteSource, MissingDatabaseThrows) {
    EXPECT_THROW(sqlite_source("/nonexistent/dprof.db"), data_source_error);
}
