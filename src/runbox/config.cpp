#include <runbox/config.h>

#include <cstdlib>
#include <spdlog/spdlog.h>

fs::path kScratchDir = "/tmp";
std::string kAccessKey = "";

void LoadAccessKey() {
  const char* key = getenv(kAccessKeyEnv);
  kAccessKey = key ? key : "";
  if (kAccessKey.empty()) spdlog::info("{} is not set; default token is empty", kAccessKeyEnv);
}
