#ifndef INCLUDE_DSBOX_RESULT_H_
#define INCLUDE_DSBOX_RESULT_H_

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>

#define ENUM_RESULT_TYPE_ \
  X(DATAFRAME, "dataframe") \
  X(SERIES, "series") \
  X(ARRAY, "array") \
  X(OTHER, "other")
enum class ResultType {
#define X(name, tag) name,
  ENUM_RESULT_TYPE_
#undef X
};

// null / bool / integer / float / string
using Cell = std::variant<std::monostate, bool, int64_t, double, std::string>;

struct Table {
  std::vector<std::string> columns;
  std::vector<Cell> index; // one label per row
  std::vector<std::vector<Cell>> rows; // rows[i].size() == columns.size()

  size_t NumRows() const { return rows.size(); }
  size_t NumColumns() const { return columns.size(); }
  // -1 if not found
  long ColumnIndex(const std::string& name) const;
  bool operator==(const Table& x) const {
    return columns == x.columns && index == x.index && rows == x.rows;
  }
  bool operator!=(const Table& x) const { return !(*this == x); }
};

extern const char kDefaultSeriesName[];

struct NamedSeries {
  std::string name = kDefaultSeriesName;
  std::vector<Cell> index;
  std::vector<Cell> values;

  bool operator==(const NamedSeries& x) const {
    return name == x.name && index == x.index && values == x.values;
  }
  bool operator!=(const NamedSeries& x) const { return !(*this == x); }
};

// Row-major storage; an empty shape is a 0-d array holding exactly one value.
struct NumericArray {
  std::vector<size_t> shape;
  std::vector<double> values;

  bool operator==(const NumericArray& x) const {
    return shape == x.shape && values == x.values;
  }
  bool operator!=(const NumericArray& x) const { return !(*this == x); }
};

// Stringified fallback; not reversible
struct OtherValue {
  std::string text;

  bool operator==(const OtherValue& x) const { return text == x.text; }
  bool operator!=(const OtherValue& x) const { return !(*this == x); }
};

// alternative order must follow ResultType
using ResultValue = std::variant<Table, NamedSeries, NumericArray, OtherValue>;

inline ResultType GetResultType(const ResultValue& val) {
  return (ResultType)val.index();
}

class ExecuteResult {
 public:
  bool success;
  std::string output;
  std::string error; // empty on success
  std::optional<ResultValue> result;
  std::optional<std::string> figure; // PNG bytes

  ExecuteResult() : success(false) {}

  static ExecuteResult Failure(std::string error) {
    ExecuteResult ret;
    ret.error = std::move(error);
    return ret;
  }
};

#endif  // INCLUDE_DSBOX_RESULT_H_
