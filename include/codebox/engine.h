#ifndef INCLUDE_CODEBOX_ENGINE_H_
#define INCLUDE_CODEBOX_ENGINE_H_

#include <map>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

struct ContainerSpec {
  std::string image;
  std::vector<std::string> command;
  std::string workdir;
  // enforced by the engine at creation time; 0 = unlimited
  int64_t memory_bytes;
  int64_t nano_cpus;
  int64_t pids_limit;
  bool gpu;
  std::map<std::string, std::string> labels;

  ContainerSpec() : memory_bytes(0), nano_cpus(0), pids_limit(0), gpu(false) {}
};

struct ExecSpec {
  std::vector<std::string> command;
  std::vector<std::string> env; // KEY=VALUE
  std::string workdir;
};

struct ExecOutput {
  std::string stdout_text, stderr_text;
  bool truncated;
  ExecOutput() : truncated(false) {}
};

// Minimal view of a container engine. Every call may be issued from any thread;
//   in particular KillContainer may run while StartExec is blocked on the same container.
// Failures are logged by the implementation and reported as false / nullopt.
class ContainerEngine {
 public:
  virtual ~ContainerEngine() = default;

  virtual bool Ping() = 0;
  virtual bool ImageExists(const std::string& image) = 0;
  virtual bool PullImage(const std::string& image) = 0;

  // returns container id
  virtual std::optional<std::string> CreateContainer(const ContainerSpec&) = 0;
  virtual bool StartContainer(const std::string& id) = 0;
  virtual bool KillContainer(const std::string& id) = 0;
  // true also if the container is already gone
  virtual bool RemoveContainer(const std::string& id) = 0;
  virtual std::optional<bool> IsRunning(const std::string& id) = 0;

  // extract a tar archive into dir
  virtual bool PutArchive(const std::string& id, const std::string& dir, const std::string& tar) = 0;

  // returns exec id
  virtual std::optional<std::string> CreateExec(const std::string& id, const ExecSpec&) = 0;
  // blocks until the exec's output stream is closed
  virtual bool StartExec(const std::string& exec_id, std::chrono::seconds stream_timeout, ExecOutput&) = 0;
  // nullopt if still running or unknown
  virtual std::optional<int> ExecExitCode(const std::string& exec_id) = 0;
};

// Docker Engine API on kEngineSocket
std::shared_ptr<ContainerEngine> MakeDockerEngine();

#endif  // INCLUDE_CODEBOX_ENGINE_H_
