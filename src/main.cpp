#include <cstdlib>
#include <memory>
#include <fstream>
#include <iostream>
#include <optional>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <pybind11/embed.h>
#include <runbox/config.h>
#include <runbox/logger.h>
#include <runbox/handler.h>
#include "runbox/utils.h"
#include "runtime_io.h"

namespace {

constexpr char kDefaultConfig[] = "/etc/runbox.conf";

std::optional<std::string> event_path;
std::string request_id = "local";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string scratch_dir = ini[""]["scratch_dir"] | "";
  if (scratch_dir.size()) kScratchDir = scratch_dir;
  kRuntimeApi = ini[""]["runtime_api"] | kRuntimeApi;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox-handler", RUNBOX_VERSION,
                                  argparse::default_arguments::help);
  parser.add_argument("--version")
    .default_value(false)
    .implicit_value(true)
    .help("Print version and exit");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfig) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--scratch-dir")
    .help("Directory emptied after every invocation");
  parser.add_argument("--runtime-api")
    .help("host:port of the runtime API (default: $" + std::string(kRuntimeApiEnv) + ")");
  parser.add_argument("--event")
    .help("Handle one event from this file (\"-\" for stdin) and print the response");
  parser.add_argument("--request-id")
    .default_value(std::string("local"))
    .help("Request id used with --event");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  if (parser["--version"] == true) {
    std::cout << RUNBOX_VERSION << std::endl;
    exit(0);
  }

  InitLogger(verbosity);
  if (auto config_file = parser.present<std::string>("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(1);
    }
  } else if (fs::exists(kDefaultConfig) && !ParseConfig(kDefaultConfig)) {
    spdlog::error("Failed to parse configuration file {}", kDefaultConfig);
    exit(1);
  }
  if (auto val = parser.present<std::string>("--scratch-dir")) {
    kScratchDir = val.value();
  }
  if (auto val = parser.present<std::string>("--runtime-api")) {
    kRuntimeApi = val.value();
  }
  event_path = parser.present<std::string>("--event");
  request_id = parser.get<std::string>("--request-id");
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  // both are hidden from scripts once the first invocation filters the environment
  LoadAccessKey();
  if (const char* api = getenv(kRuntimeApiEnv)) kRuntimeApi = api;
  ParseArgs(argc, argv);
  if (!CreateDirs(kScratchDir)) {
    spdlog::error("Scratch directory {} is not usable", kScratchDir.c_str());
    return 1;
  }

  std::unique_ptr<pybind11::scoped_interpreter> interpreter;
  try {
    interpreter = std::make_unique<pybind11::scoped_interpreter>();
  } catch (const std::exception& err) {
    spdlog::error("Failed to start the Python interpreter: {}", err.what());
    SendInitError("Runtime.InitError", err.what());
    return 1;
  }

  HttpFetcher fetcher;
  Handler handler(fetcher);
  if (event_path) return InvokeOnce(handler, *event_path, request_id) ? 0 : 1;
  if (kRuntimeApi.empty()) {
    spdlog::error("No runtime API configured; set {} or pass --runtime-api", kRuntimeApiEnv);
    return 1;
  }
  RuntimeWorkLoop(handler);
}
