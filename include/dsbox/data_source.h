#ifndef INCLUDE_DSBOX_DATA_SOURCE_H_
#define INCLUDE_DSBOX_DATA_SOURCE_H_

#include <vector>
#include <memory>
#include <string>
#include <future>
#include <stdexcept>
#include <filesystem>

#include "result.h"

class DataSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Read-only from the engine's point of view; GetFull() is called once per
// started sandbox and the returned snapshot is staged as-is.
class DataSource {
 public:
  virtual ~DataSource() = default;
  // throws DataSourceError
  virtual Table GetFull() const = 0;
  virtual std::future<Table> GetFullAsync() const;
  // logging
  virtual std::string Name() const = 0;
};

class TableDataSource : public DataSource {
  Table table_;
 public:
  explicit TableDataSource(Table table) : table_(std::move(table)) {}
  Table GetFull() const override { return table_; }
  std::string Name() const override;
};

class CsvDataSource : public DataSource {
  std::filesystem::path path_;
 public:
  explicit CsvDataSource(std::filesystem::path path) : path_(std::move(path)) {}
  Table GetFull() const override;
  std::string Name() const override;
};

// Providers are tried in order; the first one that does not throw wins.
// If all of them fail, the error of the last one is rethrown.
class FallbackDataSource : public DataSource {
  std::vector<std::shared_ptr<const DataSource>> providers_;
 public:
  explicit FallbackDataSource(std::vector<std::shared_ptr<const DataSource>> providers) :
      providers_(std::move(providers)) {}
  Table GetFull() const override;
  std::string Name() const override;
};

#endif  // INCLUDE_DSBOX_DATA_SOURCE_H_
