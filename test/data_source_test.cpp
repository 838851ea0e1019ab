#include <fstream>
#include <gtest/gtest.h>

#include <dsbox/paths.h>
#include <dsbox/data_source.h>

namespace {

class CountingDataSource : public DataSource {
  Table table_;
  bool fail_;
 public:
  mutable int calls = 0;
  CountingDataSource(Table table, bool fail) : table_(std::move(table)), fail_(fail) {}
  Table GetFull() const override {
    calls++;
    if (fail_) throw DataSourceError("unavailable");
    return table_;
  }
  std::string Name() const override { return fail_ ? "broken" : "counting"; }
};

Table OneColumn(int64_t value) {
  Table table;
  table.columns = {"x"};
  table.index = {int64_t(0)};
  table.rows = {{value}};
  return table;
}

TEST(DataSourceTest, TableSourceReturnsSnapshot) {
  TableDataSource source(OneColumn(7));
  EXPECT_EQ(source.GetFull(), OneColumn(7));
  EXPECT_EQ(source.GetFullAsync().get(), OneColumn(7));
}

TEST(DataSourceTest, CsvSource) {
  fs::create_directories(kWorkspaceRoot);
  fs::path path = kWorkspaceRoot / "source.csv";
  {
    std::ofstream fout(path);
    fout << "x\n7\n";
  }
  CsvDataSource source(path);
  EXPECT_EQ(source.GetFull(), OneColumn(7));
  EXPECT_NE(source.Name().find("source.csv"), std::string::npos);

  CsvDataSource missing(kWorkspaceRoot / "missing.csv");
  EXPECT_THROW(missing.GetFull(), DataSourceError);
  EXPECT_THROW(missing.GetFullAsync().get(), DataSourceError);
}

TEST(DataSourceTest, FallbackUsesFirstWorkingProvider) {
  auto broken = std::make_shared<CountingDataSource>(Table(), true);
  auto first = std::make_shared<CountingDataSource>(OneColumn(1), false);
  auto second = std::make_shared<CountingDataSource>(OneColumn(2), false);
  FallbackDataSource source({broken, first, second});
  EXPECT_EQ(source.GetFull(), OneColumn(1));
  EXPECT_EQ(broken->calls, 1);
  EXPECT_EQ(first->calls, 1);
  EXPECT_EQ(second->calls, 0);
}

TEST(DataSourceTest, FallbackRethrowsLastError) {
  auto a = std::make_shared<CountingDataSource>(Table(), true);
  auto b = std::make_shared<CountingDataSource>(Table(), true);
  FallbackDataSource source({a, b});
  EXPECT_THROW(source.GetFull(), DataSourceError);
  EXPECT_EQ(a->calls, 1);
  EXPECT_EQ(b->calls, 1);
  FallbackDataSource empty(std::vector<std::shared_ptr<const DataSource>>{});
  EXPECT_THROW(empty.GetFull(), DataSourceError);
}

} // namespace
