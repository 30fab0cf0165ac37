// CsvTable parsing and serialization.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "tabular/csv_table.hpp"

namespace {

using safeintake::tabular::CsvTable;
using safeintake::tabular::ParseCsv;
using safeintake::tabular::ParseCsvRecords;
using safeintake::tabular::QuoteCsvField;
using safeintake::tabular::SerializeCsv;

TEST(CsvTableTest, HeaderAndRows) {
    CsvTable table = ParseCsv("name,email\nAlice,a@example.com\nBob,b@example.com\n");
    ASSERT_EQ(table.ColumnCount(), 2u);
    ASSERT_EQ(table.RowCount(), 2u);
    EXPECT_EQ(table.header[0], "name");
    EXPECT_EQ(table.header[1], "email");
    EXPECT_EQ(table.rows[1][0], "Bob");
    EXPECT_EQ(table.rows[1][1], "b@example.com");
}

TEST(CsvTableTest, QuotedFields) {
    CsvTable table = ParseCsv("name,note\n\"Doe, Jane\",\"said \"\"hi\"\"\"\n\"multi\nline\",x\n");
    ASSERT_EQ(table.RowCount(), 2u);
    EXPECT_EQ(table.rows[0][0], "Doe, Jane");
    EXPECT_EQ(table.rows[0][1], "said \"hi\"");
    EXPECT_EQ(table.rows[1][0], "multi\nline");
    EXPECT_EQ(table.rows[1][1], "x");
}

TEST(CsvTableTest, CrlfAndBlankLines) {
    CsvTable table = ParseCsv("a,b\r\n\r\n1,2\r\n\n3,4");
    ASSERT_EQ(table.RowCount(), 2u);
    EXPECT_EQ(table.rows[0][1], "2");
    EXPECT_EQ(table.rows[1][0], "3");
    EXPECT_EQ(table.rows[1][1], "4");
}

TEST(CsvTableTest, EmptyAndRaggedCellsAreKept) {
    auto records = ParseCsvRecords("a,b,c\n1,,3\n4,\n\"\"\n");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[1].size(), 3u);
    EXPECT_EQ(records[1][1], "");
    EXPECT_EQ(records[2].size(), 2u);
    EXPECT_EQ(records[2][1], "");
    ASSERT_EQ(records[3].size(), 1u);
    EXPECT_EQ(records[3][0], "");
}

TEST(CsvTableTest, QuoteInsideUnquotedFieldIsLiteral) {
    CsvTable table = ParseCsv("name,height,contact\nBob,6\" tall,415-555-2671\nAl,5\" 2,a@b.com\n");
    ASSERT_EQ(table.RowCount(), 2u);
    ASSERT_EQ(table.rows[0].size(), 3u);
    EXPECT_EQ(table.rows[0][1], "6\" tall");
    EXPECT_EQ(table.rows[0][2], "415-555-2671");
    ASSERT_EQ(table.rows[1].size(), 3u);
    EXPECT_EQ(table.rows[1][1], "5\" 2");
    EXPECT_EQ(table.rows[1][2], "a@b.com");
}

TEST(CsvTableTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(ParseCsv("a,b\n\"oops,1\n2,3\n"), std::runtime_error);
}

TEST(CsvTableTest, EmptyInput) {
    CsvTable table = ParseCsv("");
    EXPECT_TRUE(table.Empty());
    EXPECT_EQ(SerializeCsv(table), "");
}

TEST(CsvTableTest, QuoteOnlyWhenNeeded) {
    EXPECT_EQ(QuoteCsvField("plain"), "plain");
    EXPECT_EQ(QuoteCsvField("a,b"), "\"a,b\"");
    EXPECT_EQ(QuoteCsvField("say \"x\""), "\"say \"\"x\"\"\"");
    EXPECT_EQ(QuoteCsvField("two\nlines"), "\"two\nlines\"");
}

TEST(CsvTableTest, SerializeKeepsLayout) {
    CsvTable table;
    table.header = {"name", "note"};
    table.rows = {{"Doe, Jane", "said \"hi\""}, {"Bob", ""}, {"Eve"}};
    EXPECT_EQ(SerializeCsv(table), "name,note\n\"Doe, Jane\",\"said \"\"hi\"\"\"\nBob,\nEve\n");

    CsvTable reparsed = ParseCsv(SerializeCsv(table));
    EXPECT_EQ(reparsed.header, table.header);
    EXPECT_EQ(reparsed.rows, table.rows);
}

} // namespace
