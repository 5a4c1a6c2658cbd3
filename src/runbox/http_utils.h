#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <optional>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

// "https://host:8443/a/b?c" -> {"https://host:8443", "/a/b?c"}
struct SplitUrl {
  std::string origin, path;
};
std::optional<SplitUrl> Split(const std::string& url);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint, std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

bool IsSuccess(const httplib::Result& res);

#endif  // HTTP_UTILS_H_
