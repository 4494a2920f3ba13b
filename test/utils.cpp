#include "utils.h"

#include <random>
#include <fstream>

namespace fs = std::filesystem;

TempDirectory::TempDirectory() {
  std::random_device rd;
  path_ = fs::temp_directory_path() / ("codebox-test-" + std::to_string(rd()));
  fs::create_directories(path_);
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

void TempDirectory::WriteFile(const std::string& rel, const std::string& content) const {
  fs::path target = path_ / rel;
  fs::create_directories(target.parent_path());
  std::ofstream(target, std::ios::binary) << content;
}
