#include <codebox/paths.h>

#include "utils.h"

fs::path kEngineSocket = "/var/run/docker.sock";
std::string kEngineApiVersion = "v1.41";

std::string kContainerDir = "/home/app/";
std::string kContainerTmpDir = "/tmp";
std::string kContainerCommand = "tail -f /dev/null";

long kMaxOutput = 1024; // 1M

std::string ContainerCodeFile(const std::string& extension) {
  return (fs::path(kContainerTmpDir) / ("codebox-" + RandomHex(16) + extension)).string();
}

