#include <gtest/gtest.h>
#include <pybind11/eval.h>
#include <runbox/config.h>
#include <runbox/runner.h>

#include "utils.h"

namespace py = pybind11;

namespace {

const std::string kUrl = "https://code.example/app.py";

ErrorKind KindOf(const std::function<void()>& func) {
  try {
    func();
  } catch (const InvocationError& err) {
    return err.Kind();
  }
  ADD_FAILURE() << "no InvocationError thrown";
  return ErrorKind::REQUEST;
}

} // namespace

TEST(CodeRunner, FetchPassesHeadersAndTimeout) {
  FakeFetcher fetcher;
  fetcher.Serve(kUrl, "def main(inputs):\n  return inputs\n");
  CodeRunner runner(fetcher);
  EXPECT_EQ(runner.Fetch(kUrl, {{"Authorization", "Token abc"}}), "def main(inputs):\n  return inputs\n");
  ASSERT_EQ(fetcher.calls.size(), 1u);
  EXPECT_EQ(fetcher.calls[0].url, kUrl);
  EXPECT_EQ(fetcher.calls[0].headers, (HeaderMap{{"Authorization", "Token abc"}}));
  EXPECT_EQ(fetcher.calls[0].timeout, std::chrono::seconds(60));
}

TEST(CodeRunner, FetchNon200IsFetchErrorWithStatusAndBody) {
  FakeFetcher fetcher;
  fetcher.Serve(kUrl, "{\"detail\":\"Invalid token.\"}", 401);
  CodeRunner runner(fetcher);
  try {
    runner.Fetch(kUrl, {});
    FAIL() << "fetch should fail";
  } catch (const InvocationError& err) {
    EXPECT_EQ(err.Kind(), ErrorKind::FETCH);
    EXPECT_NE(std::string(err.what()).find("401"), std::string::npos);
    EXPECT_NE(std::string(err.what()).find("Invalid token."), std::string::npos);
  }
  // no retry
  EXPECT_EQ(fetcher.calls.size(), 1u);
}

TEST(CodeRunner, OnlyStatus200Succeeds) {
  FakeFetcher fetcher;
  fetcher.Serve(kUrl, "", 204);
  CodeRunner runner(fetcher);
  EXPECT_EQ(KindOf([&]() { runner.Fetch(kUrl, {}); }), ErrorKind::FETCH);
}

TEST(HttpFetcher, MalformedUrlIsFetchError) {
  HttpFetcher fetcher;
  EXPECT_EQ(KindOf([&]() { fetcher.Fetch("not a url", {}, kFetchTimeout); }), ErrorKind::FETCH);
  EXPECT_EQ(KindOf([&]() { fetcher.Fetch("ftp://host/file", {}, kFetchTimeout); }), ErrorKind::FETCH);
}

TEST(HttpFetcher, ConnectionFailureIsFetchError) {
  HttpFetcher fetcher;
  // nothing listens on port 1
  EXPECT_EQ(KindOf([&]() { fetcher.Fetch("http://127.0.0.1:1/a.py", {}, std::chrono::seconds(2)); }),
            ErrorKind::FETCH);
}

TEST(CodeRunner, LoadDefinesNamesInFreshNamespace) {
  FakeFetcher fetcher;
  CodeRunner runner(fetcher);
  py::dict first = runner.Load("leaked = 1\ndef main(inputs):\n  return leaked\n");
  EXPECT_TRUE(first.contains("leaked"));
  EXPECT_TRUE(first.contains("main"));
  py::dict second = runner.Load("def main(inputs):\n  return 0\n");
  EXPECT_FALSE(second.contains("leaked"));
  // handler internals are not visible either
  py::dict probe = runner.Load("names = sorted(k for k in globals() if k != '__builtins__')\n");
  EXPECT_EQ(probe["names"].cast<std::vector<std::string>>(), std::vector<std::string>{});
}

TEST(CodeRunner, LoadErrors) {
  FakeFetcher fetcher;
  CodeRunner runner(fetcher);
  EXPECT_EQ(KindOf([&]() { runner.Load("def main(inputs)\n  return 1\n"); }), ErrorKind::LOAD);
  EXPECT_EQ(KindOf([&]() { runner.Load("raise ValueError('top level')\n"); }), ErrorKind::LOAD);
  EXPECT_EQ(KindOf([&]() { runner.Load("import sys\nsys.exit(3)\n"); }), ErrorKind::LOAD);
  try {
    runner.Load("raise ValueError('top level')\n");
  } catch (const InvocationError& err) {
    EXPECT_STREQ(err.what(), "top level");
  }
}

TEST(CodeRunner, MissingEntryPointIsContractError) {
  FakeFetcher fetcher;
  CodeRunner runner(fetcher);
  py::dict ns = runner.Load("def helper(inputs):\n  return 1\n");
  for (auto inputs : {nlohmann::json(nullptr), nlohmann::json(1), nlohmann::json{{"x", 1}}}) {
    EXPECT_EQ(KindOf([&]() { runner.Invoke(ns, inputs); }), ErrorKind::CONTRACT);
  }
  py::dict not_callable = runner.Load("main = 42\n");
  EXPECT_EQ(KindOf([&]() { runner.Invoke(not_callable, nullptr); }), ErrorKind::CONTRACT);
}

TEST(CodeRunner, InvokePassesInputsAsNativeValues) {
  FakeFetcher fetcher;
  CodeRunner runner(fetcher);
  py::dict ns = runner.Load(R"(
def main(inputs):
    return [type(inputs).__name__, type(inputs["i"]).__name__, type(inputs["f"]).__name__,
            type(inputs["s"]).__name__, type(inputs["l"]).__name__, inputs["n"] is None,
            inputs["b"] is True, inputs["big"]]
)");
  nlohmann::json inputs{{"i", 1}, {"f", 1.5}, {"s", "x"}, {"l", {1, 2}}, {"n", nullptr}, {"b", true},
                        {"big", 18446744073709551615ull}};
  py::object res = runner.Invoke(ns, inputs);
  py::list list = res;
  EXPECT_EQ(list[0].cast<std::string>(), "dict");
  EXPECT_EQ(list[1].cast<std::string>(), "int");
  EXPECT_EQ(list[2].cast<std::string>(), "float");
  EXPECT_EQ(list[3].cast<std::string>(), "str");
  EXPECT_EQ(list[4].cast<std::string>(), "list");
  EXPECT_TRUE(list[5].cast<bool>());
  EXPECT_TRUE(list[6].cast<bool>());
  EXPECT_EQ(list[7].cast<uint64_t>(), 18446744073709551615ull);
}

TEST(CodeRunner, ExceptionInEntryPointIsRuntimeError) {
  FakeFetcher fetcher;
  CodeRunner runner(fetcher);
  py::dict ns = runner.Load("def main(inputs):\n  raise KeyError('missing thing')\n");
  try {
    runner.Invoke(ns, nlohmann::json::object());
    FAIL() << "invoke should fail";
  } catch (const InvocationError& err) {
    EXPECT_EQ(err.Kind(), ErrorKind::RUNTIME);
    EXPECT_STREQ(err.what(), "'missing thing'");
  }
  py::dict wrong_arity = runner.Load("def main():\n  return 1\n");
  EXPECT_EQ(KindOf([&]() { runner.Invoke(wrong_arity, 1); }), ErrorKind::RUNTIME);
}
