#include <dsbox/data_source.h>

#include <fstream>

#include <spdlog/spdlog.h>
#include "csv.h"

std::future<Table> DataSource::GetFullAsync() const {
  return std::async(std::launch::async, [this]() { return GetFull(); });
}

std::string TableDataSource::Name() const {
  return "table(" + std::to_string(table_.NumRows()) + "x" + std::to_string(table_.NumColumns()) + ")";
}

Table CsvDataSource::GetFull() const {
  std::ifstream fin(path_, std::ios::binary);
  if (!fin) throw DataSourceError("cannot open " + path_.string());
  Table table;
  std::string error;
  if (!ReadCsv(fin, table, error)) {
    throw DataSourceError(path_.string() + ": " + error);
  }
  spdlog::debug("Loaded {}x{} table from {}", table.NumRows(), table.NumColumns(), path_.c_str());
  return table;
}

std::string CsvDataSource::Name() const {
  return "csv(" + path_.string() + ")";
}

Table FallbackDataSource::GetFull() const {
  if (providers_.empty()) throw DataSourceError("no data source provider configured");
  for (size_t i = 0; i < providers_.size(); i++) {
    try {
      return providers_[i]->GetFull();
    } catch (const DataSourceError& err) {
      if (i + 1 == providers_.size()) throw;
      spdlog::warn("Data source {} failed, trying the next one: {}", providers_[i]->Name(), err.what());
    }
  }
  __builtin_unreachable();
}

std::string FallbackDataSource::Name() const {
  std::string ret = "fallback(";
  for (size_t i = 0; i < providers_.size(); i++) {
    if (i) ret += ", ";
    ret += providers_[i]->Name();
  }
  return ret + ")";
}
