#ifndef INCLUDE_RUNBOX_RUNNER_H_
#define INCLUDE_RUNBOX_RUNNER_H_

#include <chrono>
#include <string>

#include <pybind11/pybind11.h>
#include <nlohmann/json.hpp>

#include "invocation.h"

struct FetchResponse {
  int status;
  std::string body;
};

class Fetcher {
 public:
  virtual ~Fetcher() = default;
  // throws InvocationError(FETCH) on transport failure; any HTTP status is returned
  virtual FetchResponse Fetch(const std::string& url, const HeaderMap& headers,
                              std::chrono::seconds timeout) = 0;
};

// single GET per call, no retries and no redirect following
class HttpFetcher : public Fetcher {
 public:
  FetchResponse Fetch(const std::string& url, const HeaderMap& headers,
                      std::chrono::seconds timeout) override;
};

// Requires a live interpreter (pybind11::scoped_interpreter) and the GIL
class CodeRunner {
  Fetcher& fetcher_;
 public:
  explicit CodeRunner(Fetcher& fetcher) : fetcher_(fetcher) {}

  std::string Fetch(const std::string& url, const HeaderMap& headers);
  // returns a new namespace populated by the script
  pybind11::dict Load(const std::string& source, const std::string& filename = "<remote>") const;
  pybind11::object Invoke(const pybind11::dict& ns, const nlohmann::json& inputs) const;
};

#endif  // INCLUDE_RUNBOX_RUNNER_H_
