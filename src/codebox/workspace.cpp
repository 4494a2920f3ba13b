#include "workspace.h"

#include <spdlog/spdlog.h>
#include <codebox/errors.h>

#include "tar.h"
#include "utils.h"

bool IsSafeRelativePath(const fs::path& path) {
  if (path.empty() || path.is_absolute() || path.has_root_name() || path.has_root_directory()) return false;
  for (auto& i : path) {
    if (i == "." || i == "..") return false;
  }
  return true;
}

std::string BuildTreeArchive(const fs::path& host_dir) {
  std::error_code ec;
  fs::path root = fs::canonical(host_dir, ec);
  if (ec || !fs::is_directory(root, ec)) {
    throw SandboxError(ErrorCode::DIRECTORY_NOT_FOUND, host_dir.string());
  }
  spdlog::debug("Packing directory {}", root.c_str());
  TarWriter tar;
  size_t files = 0;
  for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    const auto& entry = *it;
    std::error_code entry_ec;
    if (entry.is_symlink(entry_ec)) {
      spdlog::warn("Skipping symlink {}", entry.path().c_str());
      continue;
    }
    if (!entry.is_regular_file(entry_ec)) continue;
    fs::path rel = entry.path().lexically_relative(root);
    if (!IsSafeRelativePath(rel)) {
      throw SandboxError(ErrorCode::UPLOAD_ERROR, "unsafe path " + entry.path().string());
    }
    std::string content;
    if (!ReadFile(entry.path(), content)) {
      throw SandboxError(ErrorCode::UPLOAD_ERROR, "cannot read " + entry.path().string());
    }
    if (!tar.AddFile(rel.generic_string(), content)) {
      throw SandboxError(ErrorCode::UPLOAD_ERROR, "cannot archive " + entry.path().string());
    }
    files++;
  }
  if (ec) {
    spdlog::warn("Failed walking {}: {}", root.c_str(), ec.message());
    throw SandboxError(ErrorCode::UPLOAD_ERROR, "cannot list " + root.string());
  }
  spdlog::debug("Packed {} files from {}", files, root.c_str());
  return tar.Finish();
}

std::string BuildFileArchive(const std::string& name, const std::string& content) {
  if (!IsSafeRelativePath(name)) {
    throw SandboxError(ErrorCode::UPLOAD_ERROR, "unsafe file name " + name);
  }
  TarWriter tar;
  if (!tar.AddFile(name, content)) {
    throw SandboxError(ErrorCode::UPLOAD_ERROR, "cannot archive " + name);
  }
  return tar.Finish();
}
