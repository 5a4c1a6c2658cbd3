#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <runbox/config.h>

TempDirectory::TempDirectory() {
  char path[] = "/tmp/runbox_test_XXXXXX";
  if (!mkdtemp(path)) throw std::runtime_error("Failed to create temp directory");
  path_ = path;
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

void ScratchTest::SetUp() {
  scratch_ = std::make_unique<TempDirectory>();
  orig_scratch_ = kScratchDir;
  kScratchDir = scratch_->Path();
}

void ScratchTest::TearDown() {
  kScratchDir = orig_scratch_;
  scratch_.reset();
}

EnvVarGuard::EnvVarGuard(const std::string& name, const std::string& value) : name_(name) {
  setenv(name.c_str(), value.c_str(), 1);
}

EnvVarGuard::~EnvVarGuard() {
  unsetenv(name_.c_str());
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path);
  fout << content;
}
