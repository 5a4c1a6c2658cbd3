#ifndef INCLUDE_RUNBOX_INVOCATION_H_
#define INCLUDE_RUNBOX_INVOCATION_H_

#include <map>
#include <string>
#include <cstddef>
#include <stdexcept>

#include <nlohmann/json.hpp>

// errorType reported to the caller is the second column
#define ENUM_ERROR_KIND_ \
  X(REQUEST, "RequestError") /* malformed event */ \
  X(ENVIRONMENT, "EnvironmentError") /* isolation could not be set up */ \
  X(FETCH, "FetchError") \
  X(LOAD, "LoadError") \
  X(CONTRACT, "ContractError") /* entry point missing */ \
  X(RUNTIME, "RuntimeError") \
  X(SERIALIZATION, "SerializationError")
enum class ErrorKind {
#define X(name, type_name) name,
  ENUM_ERROR_KIND_
#undef X
};

class InvocationError : public std::runtime_error {
  ErrorKind kind_;
 public:
  InvocationError(ErrorKind kind, const std::string& message) :
      std::runtime_error(message), kind_(kind) {}
  ErrorKind Kind() const { return kind_; }
};

using HeaderMap = std::map<std::string, std::string>;

// true if some array or object lies deeper than max_depth (the root is depth 1);
//   does not recurse
bool ExceedsDepth(const nlohmann::json& value, size_t max_depth);

class InvocationRequest {
 public:
  nlohmann::json inputs;
  std::string url;
  HeaderMap headers;

  // throws InvocationError(REQUEST) on a malformed event
  static InvocationRequest FromEvent(const nlohmann::json& event);
};

class InvocationResult {
 public:
  bool success;
  nlohmann::json outputs;
  // failure
  ErrorKind error_kind;
  std::string error_message;
  std::string request_id;

  InvocationResult() : success(false), error_kind(ErrorKind::RUNTIME) {}

  // {statusCode, body} as returned to the host
  nlohmann::json ToResponse() const;
};

#endif  // INCLUDE_RUNBOX_INVOCATION_H_
