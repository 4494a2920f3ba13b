#ifndef CODEBOX_WORKSPACE_H_
#define CODEBOX_WORKSPACE_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Stateless helpers turning host files into archives for SandboxSession::UploadTree/UploadFile.
// Entry names are always relative and never contain "..", so extraction cannot leave the target directory.

// true if path is non-empty, relative, and has no "." / ".." components
bool IsSafeRelativePath(const fs::path&);

// Regular files under host_dir, recursively, keyed by their path relative to host_dir.
// Symlinks are skipped (they may point outside host_dir).
// throws SandboxError(DIRECTORY_NOT_FOUND) if host_dir is missing or not a directory,
//   SandboxError(UPLOAD_ERROR) if a file cannot be read or represented
std::string BuildTreeArchive(const fs::path& host_dir);
// throws SandboxError(UPLOAD_ERROR) if name is not a safe relative path
std::string BuildFileArchive(const std::string& name, const std::string& content);

#endif  // CODEBOX_WORKSPACE_H_
