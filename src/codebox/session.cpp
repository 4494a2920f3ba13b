#include "session.h"

#include <thread>
#include <sstream>
#include <unistd.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codebox/paths.h>
#include <codebox/errors.h>

#include "utils.h"
#include "workspace.h"

namespace {

using namespace std::chrono_literals;

// the engine may report an exec as running for a moment after its stream closes
constexpr int kExitCodePolls = 20;
constexpr auto kExitCodePollInterval = 50ms;

inline std::string ShortId(const std::string& id) {
  return id.substr(0, 12);
}

} // namespace

#define X(name) case SessionState::name: return #name;
const char* SessionStateName(SessionState state) {
  switch (state) {
    ENUM_SESSION_STATE_
  }
  __builtin_unreachable();
}
#undef X

std::vector<std::string> SplitCommand(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string word; sin >> word;) ret.push_back(word);
  return ret;
}

SandboxSession::SandboxSession(std::shared_ptr<ContainerEngine> engine, const ResourceLimits& limits) :
    engine_(std::move(engine)),
    limits_(limits),
    state_(SessionState::UNINITIALIZED),
    running_(false),
    interrupted_(false) {}

SandboxSession::~SandboxSession() {
  if (state_ != SessionState::TERMINATED && !container_id_.empty()) {
    spdlog::warn("Session {} was not terminated explicitly; removing container", ShortId(container_id_));
  }
  Terminate();
}

void SandboxSession::Start(const RuntimeSpec& spec) {
  if (state_ != SessionState::UNINITIALIZED) {
    throw SandboxError(ErrorCode::CONTAINER_ERROR, "session already started");
  }
  ValidateLimits(limits_);
  state_ = SessionState::STARTING;
  try {
    if (!engine_->Ping()) {
      throw SandboxError(ErrorCode::ENGINE_UNAVAILABLE, kEngineSocket.string());
    }
    if (!engine_->ImageExists(spec.image) && !engine_->PullImage(spec.image)) {
      throw SandboxError(ErrorCode::IMAGE_PULL_ERROR, spec.image);
    }
    ContainerSpec container;
    container.image = spec.image;
    container.command = SplitCommand(kContainerCommand);
    container.workdir = kContainerDir;
    container.memory_bytes = limits_.memory_bytes;
    container.nano_cpus = (int64_t)(limits_.cpu_share * 1e9);
    container.pids_limit = limits_.max_processes;
    container.gpu = spec.gpu;
    container.labels = {
      {"codebox.runtime", RuntimeName(spec.runtime)},
      {"codebox.owner-pid", std::to_string(getpid())},
    };
    auto id = engine_->CreateContainer(container);
    if (!id) throw SandboxError(ErrorCode::CONTAINER_ERROR, "cannot create container from " + spec.image);
    container_id_ = *id;
    if (!engine_->StartContainer(container_id_)) {
      throw SandboxError(ErrorCode::CONTAINER_ERROR, "cannot start container " + ShortId(container_id_));
    }
  } catch (const SandboxError& err) {
    spdlog::error("Session start failed: {}", err.what());
    Terminate();
    throw;
  }
  state_ = SessionState::RUNNING;
  spdlog::info("Session started: container={} image={} memory={} cpus={} pids={}",
               ShortId(container_id_), spec.image, limits_.memory_bytes, limits_.cpu_share,
               limits_.max_processes);
}

RunOutput SandboxSession::Run(const std::vector<std::string>& command, const std::vector<std::string>& env) {
  if (state_ == SessionState::TERMINATED) throw SandboxError(ErrorCode::SESSION_CLOSED, "");
  if (state_ != SessionState::RUNNING) throw SandboxError(ErrorCode::CONTAINER_ERROR, "session not running");
  spdlog::debug("Run in {}: {}", ShortId(container_id_), fmt::format("{}", command));

  ExecSpec exec;
  exec.command = command;
  exec.env = env;
  auto exec_id = engine_->CreateExec(container_id_, exec);
  if (!exec_id) throw SandboxError(ErrorCode::CONTAINER_ERROR, "cannot create exec");

  RunOutput ret;
  ExecOutput output;
  interrupted_ = false;
  running_ = true;
  bool ok = engine_->StartExec(*exec_id, std::chrono::seconds(limits_.timeout_seconds) + kStreamGrace, output);
  running_ = false;
  ret.interrupted = interrupted_;
  ret.stdout_text = std::move(output.stdout_text);
  ret.stderr_text = std::move(output.stderr_text);
  ret.truncated = output.truncated;
  if (!ok) {
    // a killed container may reset the stream; the caller decides whether that is an error
    ret.stream_failed = true;
    spdlog::debug("Exec stream of {} ended abnormally after {}B/{}B", ShortId(*exec_id),
                  ret.stdout_text.size(), ret.stderr_text.size());
    return ret;
  }

  for (int i = 0; i < kExitCodePolls; i++) {
    if (auto code = engine_->ExecExitCode(*exec_id)) {
      ret.exit_code = *code;
      break;
    }
    std::this_thread::sleep_for(kExitCodePollInterval);
  }
  if (ret.exit_code == -1) spdlog::warn("No exit code reported for exec {}", ShortId(*exec_id));
  spdlog::debug("Run finished in {}: exit_code={} stdout={}B stderr={}B", ShortId(container_id_),
                ret.exit_code, ret.stdout_text.size(), ret.stderr_text.size());
  return ret;
}

bool SandboxSession::QuietExec(const std::vector<std::string>& command) {
  if (state_ != SessionState::RUNNING) return false;
  ExecSpec exec;
  exec.command = command;
  auto exec_id = engine_->CreateExec(container_id_, exec);
  if (!exec_id) return false;
  ExecOutput output;
  if (!engine_->StartExec(*exec_id, kStreamGrace, output)) return false;
  std::optional<int> code;
  for (int i = 0; i < kExitCodePolls && !(code = engine_->ExecExitCode(*exec_id)); i++) {
    std::this_thread::sleep_for(kExitCodePollInterval);
  }
  if (code != 0) {
    spdlog::debug("{} exited with {}: {}", fmt::format("{}", command), code.value_or(-1), output.stderr_text);
    return false;
  }
  return true;
}

bool SandboxSession::Interrupt() {
  if (!running_) return false;
  spdlog::info("Interrupting run in {}", ShortId(container_id_));
  interrupted_ = true;
  // kill(-1) spares the caller and PID 1, which is the idle command keeping the container up
  bool ret = QuietExec({"/bin/sh", "-c", "kill -9 -1"});
  if (!ret) spdlog::warn("Failed to interrupt run in {}", ShortId(container_id_));
  return ret;
}

bool SandboxSession::Kill() {
  if (container_id_.empty()) return false;
  spdlog::info("Killing container {}", ShortId(container_id_));
  return engine_->KillContainer(container_id_);
}

bool SandboxSession::Restart() {
  if (state_ != SessionState::RUNNING) return false;
  spdlog::info("Restarting container {}", ShortId(container_id_));
  return engine_->StartContainer(container_id_);
}

void SandboxSession::CheckAlive() {
  if (state_ == SessionState::TERMINATED) throw SandboxError(ErrorCode::SESSION_CLOSED, "");
  if (state_ != SessionState::RUNNING) throw SandboxError(ErrorCode::CONTAINER_ERROR, "session not running");
  auto running = engine_->IsRunning(container_id_);
  if (!running) throw SandboxError(ErrorCode::ENGINE_UNAVAILABLE, "cannot inspect container");
  if (!*running) {
    throw SandboxError(ErrorCode::CONTAINER_ERROR, "container " + ShortId(container_id_) + " is not running");
  }
}

void SandboxSession::UploadArchive(const std::string& container_dir, const std::string& tar) {
  if (state_ != SessionState::RUNNING) throw SandboxError(ErrorCode::UPLOAD_ERROR, "session not running");
  spdlog::debug("Upload {} bytes to {}:{}", tar.size(), ShortId(container_id_), container_dir);
  if (!engine_->PutArchive(container_id_, container_dir, tar)) {
    throw SandboxError(ErrorCode::UPLOAD_ERROR, container_dir);
  }
}

void SandboxSession::UploadTree(const std::filesystem::path& host_dir, const std::string& container_dir) {
  UploadArchive(container_dir, BuildTreeArchive(host_dir));
  spdlog::info("Workspace {} staged into {}", host_dir.c_str(), container_dir);
}

std::string SandboxSession::UploadFile(const std::string& name, const std::string& content) {
  UploadArchive(kContainerTmpDir, BuildFileArchive(name, content));
  return (fs::path(kContainerTmpDir) / name).string();
}

bool SandboxSession::RemoveFiles(const std::vector<std::string>& paths) {
  if (paths.empty()) return true;
  std::vector<std::string> command = {"rm", "-f", "--"};
  command.insert(command.end(), paths.begin(), paths.end());
  bool ret = QuietExec(command);
  if (!ret) spdlog::warn("Failed to remove {} in {}", fmt::format("{}", paths), ShortId(container_id_));
  return ret;
}

void SandboxSession::Terminate() {
  if (state_.exchange(SessionState::TERMINATED) == SessionState::TERMINATED) return;
  if (container_id_.empty()) return;
  if (engine_->RemoveContainer(container_id_)) {
    spdlog::info("Container {} removed", ShortId(container_id_));
  } else {
    spdlog::warn("Failed to remove container {}", ShortId(container_id_));
  }
}
