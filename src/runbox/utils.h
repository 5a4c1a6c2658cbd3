#ifndef UTILS_H_
#define UTILS_H_

#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

#endif  // UTILS_H_
