#include <gtest/gtest.h>
#include "text/csv_reader.hpp"

namespace {

using docgate::text::CsvRow;
using docgate::text::parse_csv;

TEST(CsvReaderTest, ParsesPlainRows) {
    const auto rows = parse_csv("name,qty\napple,3\r\npear,5\n", 100);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (CsvRow{"name", "qty"}));
    EXPECT_EQ(rows[1], (CsvRow{"apple", "3"}));
    EXPECT_EQ(rows[2], (CsvRow{"pear", "5"}));
}

TEST(CsvReaderTest, QuotedFieldsKeepSeparatorsQuotesAndNewlines) {
    const auto rows = parse_csv("\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\"\n", 100);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CsvRow{"a,b", "say \"hi\"", "two\nlines"}));
}

TEST(CsvReaderTest, EmptyFieldsArePreserved) {
    const auto rows = parse_csv(",x,\n", 100);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CsvRow{"", "x", ""}));
}

TEST(CsvReaderTest, BlankLinesAreSkipped) {
    const auto rows = parse_csv("a\n\n\nb", 100);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"b"}));
}

TEST(CsvReaderTest, StopsAtRowLimit) {
    const auto rows = parse_csv("1\n2\n3\n4\n", 2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"2"}));
}

TEST(CsvReaderTest, AlternateSeparator) {
    const auto rows = parse_csv("a;b\n", 10, ';');
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CsvRow{"a", "b"}));
}

}  // namespace
