#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::Headers& headers) {
  // names only; values may carry credentials
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

std::optional<SplitUrl> Split(const std::string& url) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) return std::nullopt;
  std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") return std::nullopt;
  size_t host_begin = scheme_end + 3;
  size_t path_begin = url.find_first_of("/?#", host_begin);
  SplitUrl ret;
  if (path_begin == std::string::npos) {
    ret.origin = url;
    ret.path = "/";
  } else {
    ret.origin = url.substr(0, path_begin);
    ret.path = url.substr(path_begin);
    if (ret.path[0] != '/') ret.path = '/' + ret.path;
  }
  // fragments are never sent
  if (size_t pos = ret.path.find('#'); pos != std::string::npos) ret.path.erase(pos);
  if (ret.path.empty()) ret.path = "/";
  if (ret.origin.size() == host_begin) return std::nullopt;
  return ret;
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}
