// TableRedactor: per-cell redaction, layout preservation and pool fan-out.

#include <gtest/gtest.h>
#include <string>

#include "redaction/table_redactor.hpp"
#include "tabular/csv_table.hpp"
#include "util/thread_pool.hpp"

namespace {

using safeintake::redaction::PatternCategory;
using safeintake::redaction::Redactor;
using safeintake::redaction::TableRedactionStats;
using safeintake::redaction::TableRedactor;
using safeintake::tabular::CsvTable;
using safeintake::tabular::ParseCsv;
using safeintake::tabular::SerializeCsv;

CsvTable makeLargeTable(std::size_t rows) {
    CsvTable table;
    table.header = {"id", "email", "phone", "note"};
    for (std::size_t i = 0; i < rows; ++i) {
        table.rows.push_back({std::to_string(i), "user" + std::to_string(i) + "@example.org",
                              std::to_string(4155550000ULL + i), i % 3 == 0 ? "" : "no pii here"});
    }
    return table;
}

TEST(TableRedactorTest, RedactsOnlyCellsWithPii) {
    CsvTable table = ParseCsv("name,contact\nAlice,alice.smith@example.org\nBob,415-555-2671\n");
    Redactor redactor;
    TableRedactor tableRedactor(redactor);

    TableRedactionStats stats = tableRedactor.RedactTable(table);

    EXPECT_EQ(table.header, (std::vector<std::string>{"name", "contact"}));
    ASSERT_EQ(table.RowCount(), 2u);
    EXPECT_EQ(table.rows[0][0], "Alice");
    EXPECT_EQ(table.rows[0][1], "[REDACTED_EMAIL]");
    EXPECT_EQ(table.rows[1][0], "Bob");
    EXPECT_EQ(table.rows[1][1], "[REDACTED_PHONE]");
    EXPECT_EQ(stats.cellsScanned, 4u);
    EXPECT_EQ(stats.cellsChanged, 2u);
    EXPECT_EQ(stats.replacements[PatternCategory::Email], 1u);
    EXPECT_EQ(stats.replacements[PatternCategory::PhoneNumber], 1u);
    EXPECT_EQ(SerializeCsv(table), "name,contact\nAlice,[REDACTED_EMAIL]\nBob,[REDACTED_PHONE]\n");
}

TEST(TableRedactorTest, LiteralQuotesSurviveRedaction) {
    CsvTable table = ParseCsv("name,height,contact\nBob,6\" tall,415-555-2671\nAl,5\" 2,a@b.com\n");
    Redactor redactor;
    TableRedactor tableRedactor(redactor);

    tableRedactor.RedactTable(table);

    EXPECT_EQ(SerializeCsv(table),
              "name,height,contact\nBob,\"6\"\" tall\",[REDACTED_PHONE]\nAl,\"5\"\" 2\",[REDACTED_EMAIL]\n");
}

TEST(TableRedactorTest, EmptyCellsAndRaggedRowsPassThrough) {
    CsvTable table;
    table.header = {"a", "b", "c"};
    table.rows = {{"", "x@example.com"}, {"keep", "", "", "extra 4155552671"}};
    Redactor redactor;
    TableRedactor tableRedactor(redactor);

    TableRedactionStats stats = tableRedactor.RedactTable(table);

    EXPECT_EQ(stats.cellsScanned, 3u);
    ASSERT_EQ(table.rows[0].size(), 2u);
    ASSERT_EQ(table.rows[1].size(), 4u);
    EXPECT_EQ(table.rows[0][0], "");
    EXPECT_EQ(table.rows[0][1], "[REDACTED_EMAIL]");
    EXPECT_EQ(table.rows[1][0], "keep");
    EXPECT_EQ(table.rows[1][3], "extra [REDACTED_PHONE]");
}

TEST(TableRedactorTest, DetectOnlyCellsAreCountedButUnchanged) {
    CsvTable table;
    table.header = {"ssn"};
    table.rows = {{"123-45-6789"}};
    Redactor redactor;
    TableRedactionStats stats = TableRedactor(redactor).RedactTable(table);
    EXPECT_EQ(table.rows[0][0], "123-45-6789");
    EXPECT_EQ(stats.cellsChanged, 0u);
    EXPECT_EQ(stats.detections[PatternCategory::SocialSecurityNumber], 1u);
}

TEST(TableRedactorTest, PoolGivesSameResultAsSingleThread) {
    Redactor redactor;
    CsvTable sequential = makeLargeTable(1000);
    CsvTable parallel = sequential;

    TableRedactionStats seqStats = TableRedactor(redactor).RedactTable(sequential);

    safeintake::util::ThreadPool pool(4);
    TableRedactionStats parStats = TableRedactor(redactor, &pool, 10).RedactTable(parallel);

    EXPECT_EQ(parallel.header, sequential.header);
    EXPECT_EQ(parallel.rows, sequential.rows);
    EXPECT_EQ(parStats.cellsScanned, seqStats.cellsScanned);
    EXPECT_EQ(parStats.cellsChanged, seqStats.cellsChanged);
    EXPECT_EQ(parStats.replacements, seqStats.replacements);
    EXPECT_EQ(parallel.rows[7][1], "[REDACTED_EMAIL]");
    EXPECT_EQ(parallel.rows[7][2], "[REDACTED_PHONE]");
    EXPECT_EQ(parallel.rows[7][0], "7");
}

TEST(TableRedactorTest, EmptyTable) {
    CsvTable table;
    safeintake::util::ThreadPool pool(2);
    TableRedactionStats stats = TableRedactor(Redactor{}, &pool, 1).RedactTable(table);
    EXPECT_EQ(stats.cellsScanned, 0u);
    EXPECT_TRUE(table.Empty());
}

} // namespace
