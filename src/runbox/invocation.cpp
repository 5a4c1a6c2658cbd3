#include <runbox/invocation.h>

#include <vector>
#include <utility>
#include <fmt/format.h>
#include <runbox/utils.h>
#include <runbox/config.h>

bool ExceedsDepth(const nlohmann::json& value, size_t max_depth) {
  std::vector<std::pair<const nlohmann::json*, size_t>> stack{{&value, 1}};
  while (stack.size()) {
    auto [node, depth] = stack.back();
    stack.pop_back();
    if (!node->is_structured()) continue;
    if (depth > max_depth) return true;
    for (auto& child : *node) stack.emplace_back(&child, depth + 1);
  }
  return false;
}

InvocationRequest InvocationRequest::FromEvent(const nlohmann::json& event) {
  if (!event.is_object()) {
    throw InvocationError(ErrorKind::REQUEST, "Event must be a JSON object");
  }
  if (ExceedsDepth(event, kMaxEventDepth)) {
    throw InvocationError(ErrorKind::REQUEST,
        fmt::format("Event is nested deeper than {} levels", kMaxEventDepth));
  }
  InvocationRequest req;
  auto inputs = event.find("inputs");
  if (inputs == event.end()) throw InvocationError(ErrorKind::REQUEST, "Missing field 'inputs'");
  req.inputs = *inputs;
  auto url = event.find("url");
  if (url == event.end()) throw InvocationError(ErrorKind::REQUEST, "Missing field 'url'");
  if (!url->is_string()) throw InvocationError(ErrorKind::REQUEST, "Field 'url' must be a string");
  req.url = url->get<std::string>();
  auto headers = event.find("headers");
  if (headers == event.end() || headers->is_null()) {
    req.headers = {{"Authorization", "Token " + kAccessKey}};
  } else {
    if (!headers->is_object()) {
      throw InvocationError(ErrorKind::REQUEST, "Field 'headers' must be an object");
    }
    for (auto& [name, value] : headers->items()) {
      if (!value.is_string()) {
        throw InvocationError(ErrorKind::REQUEST, "Header '" + name + "' must be a string");
      }
      req.headers[name] = value.get<std::string>();
    }
  }
  return req;
}

nlohmann::json InvocationResult::ToResponse() const {
  if (success) return {{"statusCode", 200}, {"body", outputs}};
  return {
    {"statusCode", 400},
    {"body", {
      {"errorMessage", error_message},
      {"errorType", ErrorKindName(error_kind)},
      // never exposed to the caller
      {"stackTrace", nlohmann::json::array()},
      {"requestId", request_id},
    }},
  };
}
