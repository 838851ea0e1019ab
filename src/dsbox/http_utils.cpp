#include "http_utils.h"

#include <vector>
#include <algorithm>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

namespace {

constexpr size_t kMaxLoggedBody = 256;

std::string Truncate(const std::string& str) {
  if (str.size() <= kMaxLoggedBody) return str;
  return str.substr(0, kMaxLoggedBody) + "...";
}

} // namespace

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return Truncate(str);
}
std::string FormatOneParam(const std::string& str) {
  return Truncate(str);
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  std::vector<std::string> names;
  for (auto& i : headers) names.push_back(i.first);
  return fmt::format("headers {}", names);
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res, std::initializer_list<int> also_accepted) {
  if (!res) return false;
  if (http_utils::IsSuccess(res->status)) return true;
  return std::find(also_accepted.begin(), also_accepted.end(), res->status) != also_accepted.end();
}

std::string ErrorMessage(const httplib::Result& res) {
  if (!res) return "request failed: " + httplib::to_string(res.error());
  // JSON APIs (docker among them) put the reason in "message"
  std::string message;
  try {
    auto body = nlohmann::json::parse(res->body);
    if (body.is_object()) message = body.value("message", "");
  } catch (const nlohmann::json::exception&) {
    // not JSON; the raw body is used below
  }
  if (message.empty()) message = Truncate(res->body);
  return "status " + std::to_string(res->status) + ": " + message;
}
