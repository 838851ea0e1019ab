#include <cmath>
#include <sstream>
#include <gtest/gtest.h>

#include "csv.h"

namespace {

std::string ToCsv(const Table& table) {
  std::ostringstream ss;
  WriteCsv(ss, table);
  return ss.str();
}

TEST(CsvTest, WritesPandasConventions) {
  Table table;
  table.columns = {"name", "score", "ok", "note"};
  table.index = {int64_t(0), int64_t(1)};
  table.rows = {
    {std::string("alice"), 1.5, true, std::monostate()},
    {std::string("bob, jr."), 2.0, false, std::string("said \"hi\"")},
  };
  EXPECT_EQ(ToCsv(table),
            "name,score,ok,note\n"
            "alice,1.5,True,\n"
            "\"bob, jr.\",2.0,False,\"said \"\"hi\"\"\"\n");
}

TEST(CsvTest, FieldFormatting) {
  EXPECT_EQ(CellToCsvField(std::string("")), "\"\"");
  EXPECT_EQ(CellToCsvField(std::string(" pad")), "\" pad\"");
  EXPECT_EQ(CellToCsvField(std::string("two\nlines")), "\"two\nlines\"");
  EXPECT_EQ(CellToCsvField(int64_t(-7)), "-7");
  EXPECT_EQ(CellToCsvField(std::nan("")), "");
  EXPECT_EQ(CellToCsvField(-HUGE_VAL), "-inf");
}

TEST(CsvTest, ReadTypesCells) {
  std::istringstream in("a,b,c,d\n1,2.5,True,x\n,\"\",\"3\",-4\n");
  Table table;
  std::string error;
  ASSERT_TRUE(ReadCsv(in, table, error)) << error;
  EXPECT_EQ(table.columns, (std::vector<std::string>{"a", "b", "c", "d"}));
  ASSERT_EQ(table.NumRows(), 2u);
  EXPECT_EQ(table.index, (std::vector<Cell>{int64_t(0), int64_t(1)}));
  EXPECT_EQ(table.rows[0], (std::vector<Cell>{int64_t(1), 2.5, true, std::string("x")}));
  // quoted fields stay strings
  EXPECT_EQ(table.rows[1], (std::vector<Cell>{std::monostate(), std::string(""), std::string("3"), int64_t(-4)}));
  EXPECT_EQ(table.ColumnIndex("c"), 2);
  EXPECT_EQ(table.ColumnIndex("e"), -1);
}

TEST(CsvTest, ReadQuotedNewlinesAndCrlf) {
  std::istringstream in("text,n\r\n\"multi\nline\",1\r\n\r\n\"q\"\"x\",2\r\n");
  Table table;
  std::string error;
  ASSERT_TRUE(ReadCsv(in, table, error)) << error;
  ASSERT_EQ(table.NumRows(), 2u);
  EXPECT_EQ(table.rows[0][0], Cell(std::string("multi\nline")));
  EXPECT_EQ(table.rows[1][0], Cell(std::string("q\"x")));
  EXPECT_EQ(table.rows[1][1], Cell(int64_t(2)));
}

TEST(CsvTest, WriteThenReadKeepsTable) {
  Table table;
  table.columns = {"city", "population", "share"};
  table.index = {int64_t(0), int64_t(1), int64_t(2)};
  table.rows = {
    {std::string("Taipei"), int64_t(2500000), 0.25},
    {std::string("New York, NY"), int64_t(8300000), 0.5},
    {std::string(""), std::monostate(), 1.0},
  };
  std::istringstream in(ToCsv(table));
  Table back;
  std::string error;
  ASSERT_TRUE(ReadCsv(in, back, error)) << error;
  EXPECT_EQ(back, table);
}

TEST(CsvTest, ReadErrors) {
  Table table;
  std::string error;
  std::istringstream ragged("a,b\n1,2\n3\n");
  EXPECT_FALSE(ReadCsv(ragged, table, error));
  EXPECT_NE(error.find("record 3"), std::string::npos) << error;
  std::istringstream open_quote("a\n\"never closed\n");
  EXPECT_FALSE(ReadCsv(open_quote, table, error));
  std::istringstream empty("");
  EXPECT_TRUE(ReadCsv(empty, table, error));
  EXPECT_EQ(table.NumColumns(), 0u);
}

} // namespace
