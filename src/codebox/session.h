#ifndef CODEBOX_SESSION_H_
#define CODEBOX_SESSION_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <codebox/limits.h>
#include <codebox/engine.h>
#include <codebox/runtimes.h>

#define ENUM_SESSION_STATE_ \
  X(UNINITIALIZED) \
  X(STARTING) \
  X(RUNNING) \
  X(TERMINATED)
enum class SessionState {
#define X(name) name,
  ENUM_SESSION_STATE_
#undef X
};

struct RunOutput {
  std::string stdout_text, stderr_text;
  int exit_code; // -1 if the engine did not report one
  bool truncated;
  bool interrupted; // Interrupt() hit this run
  // the output stream broke before the exec finished; exit_code is -1 and the output is partial
  bool stream_failed;
  RunOutput() : exit_code(-1), truncated(false), interrupted(false), stream_failed(false) {}
};

// Owns exactly one long-lived idle container. Nothing else addresses the container.
// Resource limits are bound at creation and never change.
class SandboxSession {
  std::shared_ptr<ContainerEngine> engine_;
  const ResourceLimits limits_;
  std::string container_id_;
  std::atomic<SessionState> state_;
  std::atomic_bool running_, interrupted_;

  bool QuietExec(const std::vector<std::string>& command);
 public:
  // extra time allowed for the exec stream beyond the wall-clock limit before the read gives up
  static constexpr std::chrono::seconds kStreamGrace{30};

  SandboxSession(std::shared_ptr<ContainerEngine> engine, const ResourceLimits& limits);
  // last-resort cleanup; Terminate() is the primary path
  ~SandboxSession();
  SandboxSession(const SandboxSession&) = delete;
  SandboxSession& operator=(const SandboxSession&) = delete;

  // Validates limits (no engine call if invalid), checks the engine, pulls the image if absent,
  //   then creates and starts the container. Throws SandboxError; on failure nothing is left behind.
  void Start(const RuntimeSpec&);

  // Runs a command in the container and waits for it. No timeout here (see Supervise).
  // throws SandboxError(CONTAINER_ERROR) if the exec cannot be created;
  //   a broken output stream is reported through RunOutput::stream_failed
  RunOutput Run(const std::vector<std::string>& command, const std::vector<std::string>& env = {});
  // Kills every process in the container except its init process, ending the in-flight Run.
  bool Interrupt();
  // Hard kill of the whole container; Restart() brings it back with its filesystem intact.
  bool Kill();
  bool Restart();
  // throws SandboxError(ENGINE_UNAVAILABLE / CONTAINER_ERROR) if the container is not usable
  void CheckAlive();

  // archive-based transfer; throws SandboxError(UPLOAD_ERROR) if not running or rejected
  void UploadArchive(const std::string& container_dir, const std::string& tar);
  void UploadTree(const std::filesystem::path& host_dir, const std::string& container_dir);
  // returns the path inside the container
  std::string UploadFile(const std::string& name, const std::string& content);
  // best-effort; failures are logged
  bool RemoveFiles(const std::vector<std::string>& paths);

  // force-removes the container; idempotent
  void Terminate();

  SessionState GetState() const { return state_; }
  const ResourceLimits& GetLimits() const { return limits_; }
  const std::string& GetContainerId() const { return container_id_; }
};

const char* SessionStateName(SessionState);
// whitespace-separated words
std::vector<std::string> SplitCommand(const std::string&);

#endif  // CODEBOX_SESSION_H_
