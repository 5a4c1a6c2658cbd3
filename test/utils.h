#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <gtest/gtest.h>
#include <runbox/runner.h>
#include <runbox/invocation.h>

// Serves fixed responses by URL and remembers every request
class FakeFetcher : public Fetcher {
 public:
  struct Call {
    std::string url;
    HeaderMap headers;
    std::chrono::seconds timeout;
  };
  std::map<std::string, FetchResponse> responses;
  std::vector<Call> calls;

  void Serve(const std::string& url, const std::string& body, int status = 200) {
    responses[url] = {status, body};
  }
  FetchResponse Fetch(const std::string& url, const HeaderMap& headers,
                      std::chrono::seconds timeout) override {
    calls.push_back({url, headers, timeout});
    auto it = responses.find(url);
    if (it == responses.end()) return {404, "Not Found"};
    return it->second;
  }
};

// mkdtemp directory, removed on destruction
class TempDirectory {
  std::filesystem::path path_;
 public:
  TempDirectory();
  ~TempDirectory();
  const std::filesystem::path& Path() const { return path_; }
};

// Fixture that points the handler at a private scratch directory
class ScratchTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path orig_scratch_;
  std::unique_ptr<TempDirectory> scratch_;
};

// Sets a variable for the lifetime of the object
class EnvVarGuard {
  std::string name_;
 public:
  EnvVarGuard(const std::string& name, const std::string& value);
  ~EnvVarGuard();
};

void WriteFile(const std::filesystem::path&, const std::string& content);

#endif // TEST_UTILS_H_
