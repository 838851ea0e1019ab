#include <dsbox/result_codec.h>

#include <cmath>
#include <limits>
#include <algorithm>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include "utils.h"
#include "base64.h"

using nlohmann::json;

namespace {

/// --- cells ---
json CellToJson(const Cell& cell) {
  switch (cell.index()) {
    case 0: return nullptr;
    case 1: return std::get<bool>(cell);
    case 2: return std::get<int64_t>(cell);
    case 3: return std::get<double>(cell); // NaN is dumped as null
    case 4: return std::get<std::string>(cell);
  }
  __builtin_unreachable();
}

Cell CellFromJson(const json& val) {
  switch (val.type()) {
    case json::value_t::null: return std::monostate();
    case json::value_t::boolean: return val.get<bool>();
    case json::value_t::number_integer: return val.get<int64_t>();
    case json::value_t::number_unsigned: {
      uint64_t x = val.get<uint64_t>();
      if (x > (uint64_t)std::numeric_limits<int64_t>::max()) return (double)x;
      return (int64_t)x;
    }
    case json::value_t::number_float: return val.get<double>();
    case json::value_t::string: return val.get<std::string>();
    default: return val.dump(); // nested values inside object columns
  }
}

std::vector<Cell> CellsFromJson(const json& arr, const char* what) {
  if (!arr.is_array()) throw ResultCodecError(fmt::format("'{}' is not an array", what));
  std::vector<Cell> ret;
  ret.reserve(arr.size());
  for (auto& i : arr) ret.push_back(CellFromJson(i));
  return ret;
}

json CellsToJson(const std::vector<Cell>& cells) {
  json ret = json::array();
  for (auto& i : cells) ret.push_back(CellToJson(i));
  return ret;
}

std::vector<Cell> RangeIndex(size_t n) {
  std::vector<Cell> ret;
  ret.reserve(n);
  for (size_t i = 0; i < n; i++) ret.emplace_back((int64_t)i);
  return ret;
}

// pandas' own to_json output embeds the split object as a string
const json& MaybeParsed(const json& val, json& storage) {
  if (!val.is_string()) return val;
  try {
    storage = json::parse(val.get<std::string>());
  } catch (const json::parse_error& err) {
    throw ResultCodecError(std::string("embedded result is not JSON: ") + err.what());
  }
  return storage;
}

/// --- arrays ---
json ArrayToJson(const NumericArray& arr, size_t dim, size_t& pos) {
  if (dim == arr.shape.size()) return arr.values[pos++];
  json ret = json::array();
  for (size_t i = 0; i < arr.shape[dim]; i++) ret.push_back(ArrayToJson(arr, dim + 1, pos));
  return ret;
}

void ArrayShape(const json& val, std::vector<size_t>& shape) {
  const json* cur = &val;
  while (cur->is_array()) {
    shape.push_back(cur->size());
    if (cur->empty()) break;
    cur = &cur->front();
  }
}

void ArrayValues(const json& val, const std::vector<size_t>& shape, size_t dim,
                 std::vector<double>& values) {
  if (dim == shape.size()) {
    if (val.is_null()) { // NaN
      values.push_back(std::numeric_limits<double>::quiet_NaN());
    } else if (val.is_number()) {
      values.push_back(val.get<double>());
    } else {
      throw ResultCodecError("array element is not a number: " + val.dump());
    }
    return;
  }
  if (!val.is_array() || val.size() != shape[dim]) {
    throw ResultCodecError(fmt::format("ragged array at depth {}", dim));
  }
  for (auto& i : val) ArrayValues(i, shape, dim + 1, values);
}

/// --- text rendering ---
std::string CellText(const Cell& cell) {
  switch (cell.index()) {
    case 0: return "NaN";
    case 1: return std::get<bool>(cell) ? "True" : "False";
    case 2: return std::to_string(std::get<int64_t>(cell));
    case 3: return fmt::format("{}", std::get<double>(cell));
    case 4: return std::get<std::string>(cell);
  }
  __builtin_unreachable();
}

std::string FormatTable(const Table& table) {
  size_t ncol = table.columns.size() + 1;
  std::vector<std::vector<std::string>> grid(table.rows.size() + 1, std::vector<std::string>(ncol));
  for (size_t j = 0; j < table.columns.size(); j++) grid[0][j + 1] = table.columns[j];
  for (size_t i = 0; i < table.rows.size(); i++) {
    if (i < table.index.size()) grid[i + 1][0] = CellText(table.index[i]);
    for (size_t j = 0; j < table.rows[i].size() && j + 1 < ncol; j++) {
      grid[i + 1][j + 1] = CellText(table.rows[i][j]);
    }
  }
  std::vector<size_t> width(ncol);
  for (auto& row : grid) {
    for (size_t j = 0; j < ncol; j++) width[j] = std::max(width[j], row[j].size());
  }
  std::string ret;
  for (auto& row : grid) {
    std::string line;
    for (size_t j = 0; j < ncol; j++) {
      if (j) line += "  ";
      line += std::string(width[j] - row[j].size(), ' ') + row[j];
    }
    while (!line.empty() && line.back() == ' ') line.pop_back();
    ret += line + '\n';
  }
  ret += fmt::format("[{} rows x {} columns]", table.rows.size(), table.columns.size());
  return ret;
}

std::string FormatSeries(const NamedSeries& series) {
  size_t width = 0;
  for (auto& i : series.index) width = std::max(width, CellText(i).size());
  std::string ret;
  for (size_t i = 0; i < series.values.size(); i++) {
    std::string label = i < series.index.size() ? CellText(series.index[i]) : "";
    ret += label + std::string(width - label.size() + 4, ' ') + CellText(series.values[i]) + '\n';
  }
  ret += "Name: " + series.name;
  return ret;
}

} // namespace

/// --- typed values ---
Table TableFromJson(const json& val) {
  if (!val.is_object()) throw ResultCodecError("dataframe result is not an object");
  auto columns = val.find("columns");
  auto data = val.find("data");
  if (columns == val.end() || data == val.end()) {
    throw ResultCodecError("dataframe result lacks 'columns' or 'data'");
  }
  Table ret;
  for (auto& i : CellsFromJson(*columns, "columns")) {
    // non-string labels (e.g. integer column names) keep their text form
    ret.columns.push_back(i.index() == 4 ? std::get<std::string>(i) : CellText(i));
  }
  if (!data->is_array()) throw ResultCodecError("'data' is not an array");
  ret.rows.reserve(data->size());
  for (auto& row : *data) {
    ret.rows.push_back(CellsFromJson(row, "data row"));
    if (ret.rows.back().size() != ret.columns.size()) {
      throw ResultCodecError(fmt::format("row {} has {} cells, expected {}",
          ret.rows.size() - 1, ret.rows.back().size(), ret.columns.size()));
    }
  }
  if (auto index = val.find("index"); index != val.end()) {
    ret.index = CellsFromJson(*index, "index");
    if (ret.index.size() != ret.rows.size()) {
      throw ResultCodecError("index length does not match the number of rows");
    }
  } else {
    ret.index = RangeIndex(ret.rows.size());
  }
  return ret;
}

NamedSeries SeriesFromJson(const json& val, const std::string& name) {
  if (!val.is_object()) throw ResultCodecError("series result is not an object");
  NamedSeries ret;
  ret.name = name;
  auto data = val.find("data");
  if (data != val.end() && data->is_array()) {
    ret.values = CellsFromJson(*data, "data");
    if (auto index = val.find("index"); index != val.end()) {
      ret.index = CellsFromJson(*index, "index");
      if (ret.index.size() != ret.values.size()) {
        throw ResultCodecError("index length does not match the number of values");
      }
    } else {
      ret.index = RangeIndex(ret.values.size());
    }
  } else {
    // index orientation: {"label": value, ...}
    for (auto& item : val.items()) {
      ret.index.push_back(Cell(std::string(item.key())));
      ret.values.push_back(CellFromJson(item.value()));
    }
  }
  return ret;
}

NumericArray ArrayFromJson(const json& val) {
  NumericArray ret;
  ArrayShape(val, ret.shape);
  ArrayValues(val, ret.shape, 0, ret.values);
  return ret;
}

void EncodeResultValue(const ResultValue& value, json& envelope) {
  envelope["result_type"] = ResultTypeName(GetResultType(value));
  switch (GetResultType(value)) {
    case ResultType::DATAFRAME: {
      auto& table = std::get<Table>(value);
      json data = json::array();
      for (auto& row : table.rows) data.push_back(CellsToJson(row));
      envelope["result"] = {
        {"columns", table.columns},
        {"index", CellsToJson(table.index)},
        {"data", std::move(data)},
      };
      break;
    }
    case ResultType::SERIES: {
      auto& series = std::get<NamedSeries>(value);
      envelope["result"] = {
        {"index", CellsToJson(series.index)},
        {"data", CellsToJson(series.values)},
      };
      envelope["series_name"] = series.name;
      break;
    }
    case ResultType::ARRAY: {
      auto& arr = std::get<NumericArray>(value);
      size_t expected = 1;
      for (size_t i : arr.shape) expected *= i;
      if (expected != arr.values.size()) {
        // inconsistent shape; fall back to the flat values
        NumericArray flat{{arr.values.size()}, arr.values};
        size_t pos = 0;
        envelope["result"] = ArrayToJson(flat, 0, pos);
      } else {
        size_t pos = 0;
        envelope["result"] = ArrayToJson(arr, 0, pos);
      }
      break;
    }
    case ResultType::OTHER: {
      envelope["result"] = std::get<OtherValue>(value).text;
      break;
    }
  }
}

ResultValue DecodeResultValue(ResultType type, const json& result, const json& envelope) {
  json storage;
  switch (type) {
    case ResultType::DATAFRAME:
      return TableFromJson(MaybeParsed(result, storage));
    case ResultType::SERIES: {
      std::string name = kDefaultSeriesName;
      if (auto it = envelope.find("series_name"); it != envelope.end() && it->is_string()) {
        name = it->get<std::string>();
      }
      return SeriesFromJson(MaybeParsed(result, storage), name);
    }
    case ResultType::ARRAY:
      return ArrayFromJson(result);
    case ResultType::OTHER:
      return OtherValue{result.is_string() ? result.get<std::string>() : result.dump()};
  }
  __builtin_unreachable();
}

/// --- envelope ---
json SerializeResult(const ExecuteResult& res) {
  json ret{
    {"success", res.success},
    {"output", res.output},
    {"error", res.error},
    {"has_figure", res.figure.has_value()},
    {"figure_data", nullptr},
  };
  if (res.result) EncodeResultValue(*res.result, ret);
  if (res.figure) ret["figure_data"] = Base64Encode(*res.figure);
  return ret;
}

ExecuteResult DeserializeResult(const json& data) {
  if (!data.is_object()) throw ResultCodecError("response is not a JSON object");
  ExecuteResult ret;
  ret.success = data.value("success", false);
  ret.output = data.value("output", "");
  ret.error = data.value("error", "");
  if (auto result = data.find("result"); result != data.end() && !result->is_null()) {
    ResultType type = ResultType::OTHER;
    if (auto it = data.find("result_type"); it != data.end() && it->is_string()) {
      // unknown tags are treated as text
      if (!GetResultType(it->get<std::string>(), type)) type = ResultType::OTHER;
    }
    ret.result = DecodeResultValue(type, *result, data);
  }
  if (data.value("has_figure", false)) {
    auto figure = data.find("figure_data");
    if (figure != data.end() && figure->is_string() && !figure->get_ref<const std::string&>().empty()) {
      std::string bytes;
      if (!Base64Decode(figure->get<std::string>(), bytes)) {
        throw ResultCodecError("figure_data is not valid base64");
      }
      ret.figure = std::move(bytes);
    }
  }
  return ret;
}

std::string DumpResult(const ExecuteResult& res) {
  // captured output is not guaranteed to be valid UTF-8
  return SerializeResult(res).dump(-1, ' ', false, json::error_handler_t::replace);
}

ExecuteResult ParseResult(const std::string& payload) {
  if (payload.empty()) return ExecuteResult::Failure("failed to parse result: empty response");
  try {
    return DeserializeResult(json::parse(payload));
  } catch (const json::exception& err) {
    return ExecuteResult::Failure(std::string("failed to parse result: ") + err.what());
  } catch (const ResultCodecError& err) {
    return ExecuteResult::Failure(std::string("failed to parse result: ") + err.what());
  }
}

/// --- rendering ---
std::string FormatResultValue(const ResultValue& value) {
  switch (GetResultType(value)) {
    case ResultType::DATAFRAME: return FormatTable(std::get<Table>(value));
    case ResultType::SERIES: return FormatSeries(std::get<NamedSeries>(value));
    case ResultType::ARRAY: {
      auto& arr = std::get<NumericArray>(value);
      json tmp;
      EncodeResultValue(arr, tmp);
      return tmp["result"].dump();
    }
    case ResultType::OTHER: return std::get<OtherValue>(value).text;
  }
  __builtin_unreachable();
}

std::string FormatResult(const ExecuteResult& res) {
  if (!res.success) return "Execution failed: " + res.error;
  std::vector<std::string> parts;
  if (!res.output.empty()) parts.push_back("Output:\n" + res.output);
  if (res.result) parts.push_back("Result:\n" + FormatResultValue(*res.result));
  if (res.figure) parts.push_back("[figure attached]");
  std::string ret;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) ret += '\n';
    ret += parts[i];
  }
  return ret;
}
