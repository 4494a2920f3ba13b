#ifndef INCLUDE_CODEBOX_LIMITS_H_
#define INCLUDE_CODEBOX_LIMITS_H_

#include <string>
#include <cstdint>
#include <optional>

// used when the caller omits a field; engine notation ("512m", "1.0")
extern std::string kDefaultMemory;
extern std::string kDefaultCpus;
extern int kDefaultPids;
extern int kDefaultTimeout; // seconds

struct ResourceLimits {
  int64_t memory_bytes;
  double cpu_share;
  int max_processes;
  int timeout_seconds;

  // filled from the k-defaults above
  ResourceLimits();
  ResourceLimits(int64_t memory_bytes, double cpu_share, int max_processes, int timeout_seconds) :
      memory_bytes(memory_bytes),
      cpu_share(cpu_share),
      max_processes(max_processes),
      timeout_seconds(timeout_seconds) {}
};

// "512m", "1g", "65536", "64k"; binary multiples
std::optional<int64_t> ParseMemorySize(const std::string&);
// whole string must be a finite number > 0
std::optional<double> ParseCpuShare(const std::string&);

// throws SandboxError(INVALID_LIMITS)
ResourceLimits MakeLimits(const std::string& memory, const std::string& cpus, int pids, int timeout);
void ValidateLimits(const ResourceLimits&);

#endif  // INCLUDE_CODEBOX_LIMITS_H_
