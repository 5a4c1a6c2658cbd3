#include "runtime_io.h"

#include <chrono>
#include <thread>
#include <fstream>
#include <iostream>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "runbox/http_utils.h"

std::string kRuntimeApi = "";

namespace {

const std::string kApiVersion = "/2018-06-01";

// the next event may take arbitrarily long to arrive
constexpr std::chrono::hours kPollTimeout{24};

httplib::Client RuntimeClient() {
  httplib::Client cli("http://" + kRuntimeApi);
  cli.set_read_timeout(kPollTimeout);
  cli.set_keep_alive(true);
  return cli;
}

struct NextEvent {
  std::string request_id;
  std::string body;
};

bool FetchNextEvent(httplib::Client& cli, NextEvent& event) {
  auto res = HTTPRequest<HTTPGet>(cli, kApiVersion + "/runtime/invocation/next");
  if (!IsSuccess(res)) {
    spdlog::warn("Failed fetching next event: error={} status={}",
                 httplib::to_string(res.error()), res ? res->status : -1);
    return false;
  }
  event.request_id = res->get_header_value(kRequestIdHeader);
  event.body = std::move(res->body);
  if (event.request_id.empty()) {
    spdlog::warn("Event without {} header", kRequestIdHeader);
    return false;
  }
  return true;
}

nlohmann::json HandleRaw(Handler& handler, const std::string& body, const std::string& request_id) {
  using nlohmann::json;
  // an unparsable body is still answered through the handler, which reports a RequestError
  json event = json::parse(body, nullptr, false);
  return handler.Handle(event, request_id);
}

bool SendResponse(httplib::Client& cli, const std::string& request_id, const nlohmann::json& response) {
  using nlohmann::json;
  auto res = HTTPRequest<HTTPPost>(cli, kApiVersion + "/runtime/invocation/" + request_id + "/response",
      response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
  if (!IsSuccess(res)) {
    spdlog::warn("Failed posting response of {}: error={} status={}", request_id,
                 httplib::to_string(res.error()), res ? res->status : -1);
    return false;
  }
  return true;
}

} // namespace

void SendInitError(const std::string& error_type, const std::string& message) {
  using nlohmann::json;
  if (kRuntimeApi.empty()) return;
  httplib::Client cli = RuntimeClient();
  json body{{"errorMessage", message}, {"errorType", error_type}, {"stackTrace", json::array()}};
  auto res = HTTPRequest<HTTPPost>(cli, kApiVersion + "/runtime/init/error",
      httplib::Headers{{"Lambda-Runtime-Function-Error-Type", error_type}},
      body.dump(), "application/json");
  if (!IsSuccess(res)) spdlog::warn("Failed reporting init error");
}

void RuntimeWorkLoop(Handler& handler) {
  spdlog::info("Polling runtime API at {}", kRuntimeApi);
  httplib::Client cli = RuntimeClient();
  while (true) {
    NextEvent event;
    if (!FetchNextEvent(cli, event)) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      continue;
    }
    SendResponse(cli, event.request_id, HandleRaw(handler, event.body, event.request_id));
  }
}

bool InvokeOnce(Handler& handler, const std::string& path, const std::string& request_id) {
  std::string body;
  if (path == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream fin(path);
    if (!fin) {
      spdlog::error("Failed to open event file {}", path);
      return false;
    }
    body.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  }
  std::cout << HandleRaw(handler, body, request_id).dump(-1, ' ', false,
      nlohmann::json::error_handler_t::replace) << std::endl;
  return true;
}
