#include <gtest/gtest.h>

#include <sstream>

#include "csv/csv_count.hpp"
#include "csv/tokenizer.hpp"
#include "profile/orchestrator.hpp"
#include "source/csv_source.hpp"
#include "test_helpers.hpp"

using namespace dprof;
using namespace dprof::testing;

namespace {

const char* people_csv =
    "id,name,score,active,joined\n"
    "1,alice,3.5,true,2024-01-01\n"
    "2,\"bob, jr\",NA,false,2024-02-01\r\n"
    "\n"
    "3,\"multi\nline \"\"quoted\"\"\",4.0,true,\n";

}

TEST(CsvTokenizer, QuotedFieldsSpanLinesAndEscapeQuotes) {
    std::istringstream in("a,\"b,c\",\"d\ne\"\r\nx,\"\"\"y\"\"\",z\n");
    csv_record_reader reader(in, csv_dialect{});
    std::vector<std::string> f;
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f, (std::vector<std::string>{"a", "b,c", "d\ne"}));
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f, (std::vector<std::string>{"x", "\"y\"", "z"}));
    EXPECT_FALSE(reader.next(f));
    EXPECT_EQ(reader.records_read(), 2u);
}

TEST(CsvTokenizer, CustomDelimiter) {
    std::istringstream in("a;b;c\n");
    csv_dialect d;
    d.delimiter = ';';
    csv_record_reader reader(in, d);
    std::vector<std::string> f;
    ASSERT_TRUE(reader.next(f));
    EXPECT_EQ(f.size(), 3u);
}

TEST(CsvCount, CountsLogicalRows) {
    temp_dir dir("count");
    const auto p = dir.write("t.csv", "h1,h2\r\n1,\"x\r\ny\"\r\n\r\n2,z\r\n");
    const auto c = csv_count_rows_cols(p, csv_dialect{});
    EXPECT_EQ(c.rows, 2u);
    EXPECT_EQ(c.columns, 2u);
}

TEST(CsvCount, MissingFileThrows) {
    EXPECT_THROW(csv_count_rows_cols("/nonexistent/dprof.csv", csv_dialect{}), data_source_error);
}

TEST(CsvSource, MaterializesNativeStorage) {
    temp_dir dir("people");
    csv_source source(dir.write("people.csv", people_csv));
    const table t = source.fetch("people", std::nullopt);

    EXPECT_EQ(t.name, "people");
    ASSERT_EQ(t.columns.size(), 5u);
    EXPECT_EQ(t.rows(), 3u);
    EXPECT_EQ(t.columns[0].storage, storage_type::int64_);
    EXPECT_EQ(t.columns[1].storage, storage_type::text_);
    EXPECT_EQ(t.columns[2].storage, storage_type::float64_);
    EXPECT_EQ(t.columns[3].storage, storage_type::boolean_);
    EXPECT_EQ(t.columns[4].storage, storage_type::text_);

    EXPECT_EQ(std::get<std::string>(t.columns[1].values[1]), "bob, jr");
    EXPECT_EQ(std::get<std::string>(t.columns[1].values[2]), "multi\nline \"quoted\"");
    EXPECT_TRUE(is_null(t.columns[2].values[1]));
    EXPECT_TRUE(is_null(t.columns[4].values[2]));
}

TEST(CsvSource, ProfilesEndToEnd) {
    temp_dir dir("e2e");
    csv_source source(dir.write("people.csv", people_csv));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"people"});
    const auto& tp = std::get<table_profile>(*report.find("people"));
    EXPECT_EQ(std::get<column_profile>(tp.columns[0].second).type, data_type::integer_);
    EXPECT_EQ(std::get<column_profile>(tp.columns[1].second).type, data_type::string_);
    EXPECT_EQ(std::get<column_profile>(tp.columns[2].second).type, data_type::float_);
    EXPECT_EQ(std::get<column_profile>(tp.columns[3].second).type, data_type::boolean_);
    EXPECT_EQ(std::get<column_profile>(tp.columns[4].second).type, data_type::datetime_);
}

TEST(CsvSource, RowCapAndCounts) {
    temp_dir dir("cap");
    csv_source source(dir.write("people.csv", people_csv));
    EXPECT_EQ(source.fetch("people", 2).rows(), 2u);
    EXPECT_EQ(source.count_records("people"), 3u);
}

TEST(CsvSource, HeaderNormalizationAndRaggedRows) {
    temp_dir dir("hdr");
    csv_source source(dir.write("h.csv", "a,a,,b\n1,2,3,4\n5,6\n7,8,9,10,11\n"));
    const table t = source.fetch("h", std::nullopt);
    ASSERT_EQ(t.columns.size(), 5u);
    EXPECT_EQ(t.columns[0].name, "a");
    EXPECT_EQ(t.columns[1].name, "a.1");
    EXPECT_EQ(t.columns[2].name, "col3");
    EXPECT_EQ(t.columns[3].name, "b");
    EXPECT_EQ(t.columns[4].name, "col5");
    EXPECT_TRUE(t.rectangular());
    EXPECT_TRUE(is_null(t.columns[2].values[1]));
    EXPECT_TRUE(is_null(t.columns[4].values[0]));
}

TEST(CsvSource, NoHeaderGeneratesNames) {
    temp_dir dir("nohdr");
    csv_dialect d;
    d.has_header = false;
    csv_source source(dir.write("n.csv", "1,x\n2,y\n"), d);
    const table t = source.fetch("n", std::nullopt);
    EXPECT_EQ(t.rows(), 2u);
    EXPECT_EQ(t.columns[0].name, "col1");
    EXPECT_EQ(t.columns[1].name, "col2");
}

TEST(CsvSource, DirectoryListsOneTablePerFile) {
    temp_dir dir("dir");
    dir.write("b.csv", "x\n1\n");
    dir.write("a.csv", "p,q\n1,2\n3,4\n");
    dir.write("notes.txt", "ignored");
    csv_source source(dir.path());
    const auto tables = source.list_tables();
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[0].name, "a");
    EXPECT_EQ(tables[0].columns, (std::vector<std::string>{"p", "q"}));
    EXPECT_EQ(tables[1].name, "b");
    EXPECT_EQ(source.count_records("a"), 2u);
}

TEST(CsvSource, MissingInputOrTableThrows) {
    EXPECT_THROW(csv_source("/nonexistent/dprof_dir"), data_source_error);
    temp_dir dir("missing");
    csv_source source(dir.write("t.csv", "a\n1\n"));
    EXPECT_THROW(source.fetch("other", std::nullopt), data_source_error);
}

TEST(CsvSource, DetectStoragePriority) {
    EXPECT_EQ(detect_storage({std::string("1"), std::nullopt, std::string("-2")}), storage_type::int64_);
    EXPECT_EQ(detect_storage({std::string("1"), std::string("2.5")}), storage_type::float64_);
    EXPECT_EQ(detect_storage({std::string("TRUE"), std::string("false")}), storage_type::boolean_);
    EXPECT_EQ(detect_storage({std::string("1"), std::string("x")}), storage_type::text_);
    EXPECT_EQ(detect_storage({std::nullopt}), storage_type::text_);
}
