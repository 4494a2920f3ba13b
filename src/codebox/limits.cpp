#include <codebox/limits.h>

#include <cmath>
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <climits>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>

std::string kDefaultMemory = "512m";
std::string kDefaultCpus = "1.0";
int kDefaultPids = 64;
int kDefaultTimeout = 20;

ResourceLimits::ResourceLimits() :
    memory_bytes(ParseMemorySize(kDefaultMemory).value_or(512L << 20)),
    cpu_share(ParseCpuShare(kDefaultCpus).value_or(1.0)),
    max_processes(kDefaultPids),
    timeout_seconds(kDefaultTimeout) {}

std::optional<int64_t> ParseMemorySize(const std::string& str) {
  if (str.empty() || !isdigit((unsigned char)str[0])) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  long long val = strtoll(str.c_str(), &end, 10);
  if (errno == ERANGE || val <= 0) return std::nullopt;
  int shift = 0;
  if (*end) {
    switch (tolower((unsigned char)*end)) {
      case 'b': shift = 0; break;
      case 'k': shift = 10; break;
      case 'm': shift = 20; break;
      case 'g': shift = 30; break;
      default: return std::nullopt;
    }
    // allow "512mb"-style suffixes as the engine does
    end++;
    if (*end && !(tolower((unsigned char)*end) == 'b' && shift > 0 && !end[1])) return std::nullopt;
  }
  if (val > (LLONG_MAX >> shift)) return std::nullopt;
  return (int64_t)val << shift;
}

std::optional<double> ParseCpuShare(const std::string& str) {
  if (str.empty() || isspace((unsigned char)str[0])) return std::nullopt;
  char* end = nullptr;
  double val = strtod(str.c_str(), &end);
  if (*end || !std::isfinite(val) || val <= 0) return std::nullopt;
  return val;
}

ResourceLimits MakeLimits(const std::string& memory, const std::string& cpus, int pids, int timeout) {
  auto memory_bytes = ParseMemorySize(memory);
  if (!memory_bytes) throw SandboxError(ErrorCode::INVALID_LIMITS, "memory " + memory);
  auto cpu_share = ParseCpuShare(cpus);
  if (!cpu_share) throw SandboxError(ErrorCode::INVALID_LIMITS, "cpus " + cpus);
  ResourceLimits ret(*memory_bytes, *cpu_share, pids, timeout);
  ValidateLimits(ret);
  return ret;
}

void ValidateLimits(const ResourceLimits& lim) {
  std::string field;
  if (lim.memory_bytes <= 0) {
    field = "memory";
  } else if (!std::isfinite(lim.cpu_share) || lim.cpu_share <= 0) {
    field = "cpus";
  } else if (lim.max_processes <= 0) {
    field = "pids";
  } else if (lim.timeout_seconds <= 0) {
    field = "timeout";
  } else {
    return;
  }
  spdlog::info("Rejected limits: memory={} cpus={} pids={} timeout={}",
               lim.memory_bytes, lim.cpu_share, lim.max_processes, lim.timeout_seconds);
  throw SandboxError(ErrorCode::INVALID_LIMITS, field);
}
