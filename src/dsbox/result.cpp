#include <dsbox/result.h>

const char kDefaultSeriesName[] = "result";

long Table::ColumnIndex(const std::string& name) const {
  for (size_t i = 0; i < columns.size(); i++) {
    if (columns[i] == name) return i;
  }
  return -1;
}
