#ifndef INCLUDE_RUNBOX_ENVIRONMENT_H_
#define INCLUDE_RUNBOX_ENVIRONMENT_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

using EnvMap = std::map<std::string, std::string>;
// Rebuilds an interpreter-side copy of the environment (e.g. os.environ)
//   after the process table has been replaced
using EnvironmentMirror = std::function<void(const EnvMap&)>;
// Called instead of lock() when another invocation holds the process-wide lock,
//   e.g. to let other threads run the interpreter while this one waits
using LockWaiter = std::function<void(std::unique_lock<std::mutex>&)>;

EnvMap ReadEnvironment();
// full clear + repopulate
bool ReplaceEnvironment(const EnvMap&);
EnvMap FilterEnvironment(const EnvMap&, const std::vector<std::string>& exclude_patterns);
// delete everything under dir but keep dir itself; errors are logged and skipped
void CleanDirectory(const std::filesystem::path& dir);

std::vector<std::string> DefaultExcludePatterns();

// Holds the process-wide invocation lock and the filtered environment for its lifetime.
// The destructor restores the snapshot and empties the scratch directory.
// The constructor throws InvocationError(ENVIRONMENT) if isolation cannot be set up;
//   nothing is cleaned in that case.
class ScopedEnvironment {
  std::unique_lock<std::mutex> lock_;
  const EnvMap snapshot_;
  std::filesystem::path scratch_dir_;
  EnvironmentMirror mirror_;

  bool Install_(const EnvMap&) const;
 public:
  ScopedEnvironment(std::filesystem::path scratch_dir, EnvironmentMirror mirror = {},
                    const LockWaiter& wait = {},
                    const std::vector<std::string>& exclude_patterns = DefaultExcludePatterns());
  ~ScopedEnvironment();
  ScopedEnvironment(const ScopedEnvironment&) = delete;
  ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

  const EnvMap& Snapshot() const { return snapshot_; }
};

#endif  // INCLUDE_RUNBOX_ENVIRONMENT_H_
