#ifndef INCLUDE_RUNBOX_HANDLER_H_
#define INCLUDE_RUNBOX_HANDLER_H_

#include <string>
#include <nlohmann/json.hpp>

#include "runner.h"
#include "sanitizer.h"
#include "invocation.h"

class Handler {
  Fetcher& fetcher_;
  OutputSanitizer sanitizer_;
 public:
  explicit Handler(Fetcher& fetcher) : fetcher_(fetcher) {}

  OutputSanitizer& Sanitizer() { return sanitizer_; }

  // Never throws; every failure becomes a 400 result
  InvocationResult Invoke(const nlohmann::json& event, const std::string& request_id);
  nlohmann::json Handle(const nlohmann::json& event, const std::string& request_id) {
    return Invoke(event, request_id).ToResponse();
  }
};

#endif  // INCLUDE_RUNBOX_HANDLER_H_
