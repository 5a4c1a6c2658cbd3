#ifndef RUNTIME_IO_H_
#define RUNTIME_IO_H_

#include <string>
#include <nlohmann/json.hpp>
#include <runbox/handler.h>

// host:port of the Lambda-style runtime API
extern std::string kRuntimeApi;

constexpr char kRuntimeApiEnv[] = "AWS_LAMBDA_RUNTIME_API";
constexpr char kRequestIdHeader[] = "Lambda-Runtime-Aws-Request-Id";

// Report a failed startup to the runtime API
void SendInitError(const std::string& error_type, const std::string& message);

// Poll the runtime API for events one at a time and post every response back.
// It will not return.
void RuntimeWorkLoop(Handler&);

// Handle a single event read from path ("-" for stdin) and write the response to stdout.
// Returns false if the event file cannot be read; a malformed event still gets a response.
bool InvokeOnce(Handler&, const std::string& path, const std::string& request_id);

#endif  // RUNTIME_IO_H_
