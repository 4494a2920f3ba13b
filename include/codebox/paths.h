#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// engine endpoint
extern fs::path kEngineSocket;
extern std::string kEngineApiVersion;

// inside the container
extern std::string kContainerDir;
extern std::string kContainerTmpDir;
extern std::string kContainerCommand;

// KiB, per stream
extern long kMaxOutput;

// a fresh name for staged code, e.g. /tmp/codebox-<hex>.py
std::string ContainerCodeFile(const std::string& extension);

#endif  // INCLUDE_CODEBOX_PATHS_H_
