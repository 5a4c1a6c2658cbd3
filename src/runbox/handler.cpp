#include <runbox/handler.h>

#include <vector>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/utils.h>
#include <runbox/config.h>
#include <runbox/environment.h>
#include "python_utils.h"

namespace {

void LogRequest(const std::string& request_id, const InvocationRequest& req) {
  if (!spdlog::should_log(spdlog::level::info)) return;
  // header values may carry credentials
  std::vector<std::string> header_names;
  for (auto& i : req.headers) header_names.push_back(i.first);
  spdlog::info("Received event {}: url {}, headers {}, inputs {}", request_id, req.url, header_names,
               req.inputs.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace

InvocationResult Handler::Invoke(const nlohmann::json& event, const std::string& request_id) {
  InvocationResult result;
  result.request_id = request_id;
  try {
    // validated (depth included) before anything walks the event recursively
    InvocationRequest req = InvocationRequest::FromEvent(event);
    LogRequest(request_id, req);
    ScopedEnvironment env(kScratchDir, MirrorPythonEnvironment, WaitWithoutGil);
    CodeRunner runner(fetcher_);
    std::string source = runner.Fetch(req.url, req.headers);
    // all Python objects are released before env restores the process state
    py::dict ns = runner.Load(source, req.url);
    py::object outputs = runner.Invoke(ns, req.inputs);
    result.outputs = sanitizer_.Normalize(outputs);
    result.success = true;
  } catch (const InvocationError& err) {
    result.error_kind = err.Kind();
    result.error_message = err.what();
  } catch (const std::exception& err) {
    // anything the components did not classify, e.g. a conversion failure in pybind11
    result.error_kind = ErrorKind::RUNTIME;
    result.error_message = err.what();
  }
  if (!result.success) {
    spdlog::error("Invocation {} failed with {}: {}", request_id,
                  ErrorKindName(result.error_kind), result.error_message);
  }
  return result;
}
