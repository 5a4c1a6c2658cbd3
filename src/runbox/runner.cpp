#include <runbox/runner.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <runbox/config.h>
#include "http_utils.h"
#include "python_utils.h"

FetchResponse HttpFetcher::Fetch(
    const std::string& url, const HeaderMap& headers, std::chrono::seconds timeout) {
  auto split = http_utils::Split(url);
  if (!split) throw InvocationError(ErrorKind::FETCH, fmt::format("Invalid URL: {}", url));
  httplib::Client cli(split->origin);
  if (!cli.is_valid()) {
    throw InvocationError(ErrorKind::FETCH, fmt::format("Unsupported URL: {}", url));
  }
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);
  cli.set_follow_location(false);
  httplib::Headers req_headers(headers.begin(), headers.end());
  auto res = HTTPRequest<HTTPGet>(cli, split->path, req_headers);
  if (!res) {
    throw InvocationError(ErrorKind::FETCH,
        fmt::format("Failed to fetch app code from {}: {}", url, httplib::to_string(res.error())));
  }
  return {res->status, res->body};
}

std::string CodeRunner::Fetch(const std::string& url, const HeaderMap& headers) {
  spdlog::info("Fetching app code from URL: {}", url);
  FetchResponse res = fetcher_.Fetch(url, headers, kFetchTimeout);
  spdlog::info("Response status: {}, {} bytes", res.status, res.body.size());
  if (res.status != 200) {
    throw InvocationError(ErrorKind::FETCH,
        fmt::format("Failed to fetch app code (status {}): {}", res.status, res.body));
  }
  return std::move(res.body);
}

py::dict CodeRunner::Load(const std::string& source, const std::string& filename) const {
  py::dict ns;
  try {
    py::module_ builtins = py::module_::import("builtins");
    ns["__builtins__"] = builtins;
    py::object code = builtins.attr("compile")(py::bytes(source), filename, "exec");
    builtins.attr("exec")(code, ns);
  } catch (py::error_already_set& err) {
    spdlog::error("Loading {} failed: {}", filename, err.what());
    throw InvocationError(ErrorKind::LOAD, ExceptionMessage(err));
  }
  spdlog::debug("Loaded {}: {} names defined", filename, py::len(ns));
  return ns;
}

py::object CodeRunner::Invoke(const py::dict& ns, const nlohmann::json& inputs) const {
  if (!ns.contains(kEntryPoint)) {
    throw InvocationError(ErrorKind::CONTRACT, fmt::format("'def {}(inputs):' is not defined", kEntryPoint));
  }
  py::object entry = ns[kEntryPoint];
  if (!PyCallable_Check(entry.ptr())) {
    throw InvocationError(ErrorKind::CONTRACT, fmt::format("'{}' is not callable", kEntryPoint));
  }
  try {
    return entry(JsonToPython(inputs));
  } catch (py::error_already_set& err) {
    spdlog::error("{} raised {}: {}", kEntryPoint, ExceptionTypeName(err), err.what());
    throw InvocationError(ErrorKind::RUNTIME, ExceptionMessage(err));
  }
}
