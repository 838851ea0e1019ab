#include "csv.h"

#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <vector>
#include <utility>

#include <fmt/core.h>

namespace {

bool NeedsQuote(const std::string& str) {
  return str.find_first_of(",\"\r\n") != std::string::npos ||
      (!str.empty() && (str.front() == ' ' || str.back() == ' '));
}

std::string Quote(const std::string& str) {
  std::string ret = "\"";
  for (char c : str) {
    if (c == '"') ret.push_back('"');
    ret.push_back(c);
  }
  ret.push_back('"');
  return ret;
}

std::string FormatDouble(double x) {
  if (std::isnan(x)) return "";
  if (std::isinf(x)) return x > 0 ? "inf" : "-inf";
  std::string ret = fmt::format("{}", x);
  // keep floats distinguishable from integers
  if (ret.find_first_of(".eE") == std::string::npos) ret += ".0";
  return ret;
}

// one record; return false if the input ended inside quotes
bool ReadRecord(std::istream& in, std::vector<std::pair<std::string, bool>>& fields, bool& eof) {
  fields.clear();
  eof = false;
  std::string cur;
  bool quoted = false, in_quotes = false, any = false;
  int c;
  while ((c = in.get()) != EOF) {
    any = true;
    if (in_quotes) {
      if (c == '"') {
        if (in.peek() == '"') {
          in.get();
          cur.push_back('"');
        } else {
          in_quotes = false;
        }
      } else {
        cur.push_back((char)c);
      }
      continue;
    }
    if (c == '"') {
      in_quotes = quoted = true;
    } else if (c == ',') {
      fields.emplace_back(std::move(cur), quoted);
      cur.clear();
      quoted = false;
    } else if (c == '\n') {
      fields.emplace_back(std::move(cur), quoted);
      return true;
    } else if (c != '\r') {
      cur.push_back((char)c);
    }
  }
  if (in_quotes) return false;
  if (!any) {
    eof = true;
    return true;
  }
  fields.emplace_back(std::move(cur), quoted);
  return true;
}

} // namespace

std::string CellToCsvField(const Cell& cell) {
  switch (cell.index()) {
    case 0: return "";
    case 1: return std::get<bool>(cell) ? "True" : "False";
    case 2: return std::to_string(std::get<int64_t>(cell));
    case 3: return FormatDouble(std::get<double>(cell));
    case 4: {
      const std::string& str = std::get<std::string>(cell);
      // an empty string would read back as null
      return str.empty() || NeedsQuote(str) ? Quote(str) : str;
    }
  }
  __builtin_unreachable();
}

void WriteCsv(std::ostream& out, const Table& table) {
  for (size_t i = 0; i < table.columns.size(); i++) {
    if (i) out << ',';
    const std::string& name = table.columns[i];
    out << (NeedsQuote(name) ? Quote(name) : name);
  }
  out << '\n';
  for (auto& row : table.rows) {
    for (size_t i = 0; i < row.size(); i++) {
      if (i) out << ',';
      out << CellToCsvField(row[i]);
    }
    out << '\n';
  }
}

Cell ParseCsvField(const std::string& field, bool quoted) {
  if (quoted) return field;
  if (field.empty()) return std::monostate();
  if (field == "True") return true;
  if (field == "False") return false;
  const char* begin = field.c_str();
  char* end = nullptr;
  errno = 0;
  long long ival = strtoll(begin, &end, 10);
  if (errno == 0 && *end == '\0' && end != begin) return (int64_t)ival;
  errno = 0;
  double dval = strtod(begin, &end);
  if (errno == 0 && *end == '\0' && end != begin) return dval;
  return field;
}

bool ReadCsv(std::istream& in, Table& table, std::string& error) {
  table = Table();
  std::vector<std::pair<std::string, bool>> fields;
  bool eof;
  if (!ReadRecord(in, fields, eof)) {
    error = "unterminated quoted field in header";
    return false;
  }
  if (eof) return true; // empty file: empty table
  for (auto& i : fields) table.columns.push_back(std::move(i.first));
  for (size_t line = 2;; line++) {
    if (!ReadRecord(in, fields, eof)) {
      error = fmt::format("unterminated quoted field at record {}", line);
      return false;
    }
    if (eof) break;
    if (fields.size() == 1 && fields[0].first.empty() && !fields[0].second) continue; // blank line
    if (fields.size() != table.columns.size()) {
      error = fmt::format("record {} has {} fields, expected {}", line, fields.size(), table.columns.size());
      return false;
    }
    std::vector<Cell> row;
    row.reserve(fields.size());
    for (auto& i : fields) row.push_back(ParseCsvField(i.first, i.second));
    table.index.push_back((int64_t)table.rows.size());
    table.rows.push_back(std::move(row));
  }
  return true;
}
