#ifndef INCLUDE_RUNBOX_CONFIG_H_
#define INCLUDE_RUNBOX_CONFIG_H_

#include <array>
#include <cstddef>
#include <chrono>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// emptied after every invocation
extern fs::path kScratchDir;
// default "Authorization: Token ..." value; read once at process start
extern std::string kAccessKey;

constexpr char kAccessKeyEnv[] = "API_ACCESS_KEY";
constexpr char kEntryPoint[] = "main";
constexpr std::chrono::seconds kFetchTimeout{60};
// events nested deeper than this are rejected before anything walks them recursively
constexpr size_t kMaxEventDepth = 1000;
// environment variables whose name contains any of these (case-insensitive)
//   are hidden from the script
constexpr std::array<const char*, 2> kExcludePatterns = {"AWS", "KEY"};

// Call before the first invocation, while the environment is still untouched
void LoadAccessKey();

#endif  // INCLUDE_RUNBOX_CONFIG_H_
