#include <runbox/environment.h>

#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>
#include <runbox/config.h>
#include <runbox/invocation.h>
#include "utils.h"

namespace {

// environment and scratch directory are process-wide; one invocation at a time
std::mutex invocation_mtx;

std::unique_lock<std::mutex> AcquireInvocationLock(const LockWaiter& wait) {
  std::unique_lock<std::mutex> lock(invocation_mtx, std::try_to_lock);
  if (lock.owns_lock()) return lock;
  spdlog::info("Waiting for the running invocation to finish");
  if (wait) {
    wait(lock);
  } else {
    lock.lock();
  }
  return lock;
}

} // namespace

EnvMap ReadEnvironment() {
  EnvMap ret;
  for (char** ptr = environ; ptr && *ptr; ptr++) {
    const char* entry = *ptr;
    const char* eq = strchr(entry, '=');
    if (!eq || eq == entry) continue;
    // first occurrence wins, as with getenv
    ret.emplace(std::string(entry, eq - entry), std::string(eq + 1));
  }
  return ret;
}

bool ReplaceEnvironment(const EnvMap& env) {
  if (clearenv() != 0) {
    spdlog::warn("clearenv failed: {}", strerror(errno));
    return false;
  }
  for (auto& [key, value] : env) {
    if (setenv(key.c_str(), value.c_str(), 1) != 0) {
      spdlog::warn("setenv {} failed: {}", key, strerror(errno));
      return false;
    }
  }
  return true;
}

EnvMap FilterEnvironment(const EnvMap& env, const std::vector<std::string>& exclude_patterns) {
  EnvMap ret;
  for (auto& [key, value] : env) {
    bool excluded = false;
    for (auto& pattern : exclude_patterns) {
      if (ContainsIgnoreCase(key, pattern)) {
        excluded = true;
        break;
      }
    }
    if (!excluded) ret.emplace(key, value);
  }
  return ret;
}

void CleanDirectory(const fs::path& dir) {
  std::error_code ec;
  std::vector<fs::path> entries;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) spdlog::warn("Failed listing {}: {}", dir.c_str(), ec.message());
  // RemoveAll logs its own failures
  for (auto& path : entries) RemoveAll(path);
}

std::vector<std::string> DefaultExcludePatterns() {
  return std::vector<std::string>(kExcludePatterns.begin(), kExcludePatterns.end());
}

bool ScopedEnvironment::Install_(const EnvMap& env) const {
  if (!ReplaceEnvironment(env)) return false;
  if (!mirror_) return true;
  try {
    mirror_(env);
  } catch (std::exception& err) {
    spdlog::warn("Failed mirroring environment: {}", err.what());
    return false;
  }
  return true;
}

ScopedEnvironment::ScopedEnvironment(
    fs::path scratch_dir, EnvironmentMirror mirror, const LockWaiter& wait,
    const std::vector<std::string>& exclude_patterns) :
    lock_(AcquireInvocationLock(wait)),
    snapshot_(ReadEnvironment()),
    scratch_dir_(std::move(scratch_dir)),
    mirror_(std::move(mirror)) {
  if (!lock_.owns_lock()) {
    throw InvocationError(ErrorKind::ENVIRONMENT, "Failed to acquire the invocation lock");
  }
  EnvMap filtered = FilterEnvironment(snapshot_, exclude_patterns);
  if (!Install_(filtered)) {
    // put back what was there; the caller never runs anything
    if (!Install_(snapshot_)) spdlog::error("Failed rolling back environment");
    throw InvocationError(ErrorKind::ENVIRONMENT, "Failed to set up a clean environment");
  }
  spdlog::debug("Environment filtered: kept {} of {} variables", filtered.size(), snapshot_.size());
}

ScopedEnvironment::~ScopedEnvironment() {
  if (!Install_(snapshot_)) {
    spdlog::error("Failed restoring environment ({} variables)", snapshot_.size());
  }
  CleanDirectory(scratch_dir_);
  spdlog::info("Cleaned up {} and restored environment variables", scratch_dir_.c_str());
}
