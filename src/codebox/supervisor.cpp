#include "supervisor.h"

#include <future>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include <codebox/utils.h>

Outcome ClassifyExitCode(int exit_code) {
  if (exit_code == 0) return Outcome::NORMAL;
  if (exit_code == kOomExitCode) return Outcome::OUT_OF_MEMORY;
  return Outcome::NONZERO_EXIT;
}

namespace {

void MoveOutput(RunOutput& out, ExecutionResult& res) {
  res.stdout_text = std::move(out.stdout_text);
  res.stderr_text = std::move(out.stderr_text);
  res.truncated = out.truncated;
}

} // namespace

ExecutionResult Supervise(SandboxSession& session, const std::vector<std::string>& command,
                          const std::vector<std::string>& env, std::chrono::seconds timeout) {
  auto start = std::chrono::steady_clock::now();
  auto elapsed = [&start]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  };
  std::future<RunOutput> run = std::async(std::launch::async, [&session, &command, &env]() {
    return session.Run(command, env);
  });

  ExecutionResult ret;
  if (run.wait_for(timeout) == std::future_status::ready) {
    RunOutput out = run.get(); // rethrows SandboxError from the run
    if (out.stream_failed && !out.interrupted) {
      throw SandboxError(ErrorCode::CONTAINER_ERROR, "exec stream failed");
    }
    ret.wall_seconds = elapsed();
    ret.exit_code = out.exit_code;
    ret.outcome = out.interrupted ? Outcome::INTERRUPTED : ClassifyExitCode(out.exit_code);
    MoveOutput(out, ret);
    spdlog::debug("Run finished: outcome={} exit_code={} wall={:.3f}s",
                  OutcomeName(ret.outcome), ret.exit_code, ret.wall_seconds);
    return ret;
  }

  spdlog::info("Wall-clock limit of {}s exceeded; killing container {}",
               timeout.count(), session.GetContainerId().substr(0, 12));
  if (!session.Kill()) spdlog::warn("Kill request failed; waiting for the exec stream to close");
  try {
    RunOutput out = run.get();
    if (out.stream_failed) spdlog::debug("Exec stream broke on kill; keeping partial output");
    MoveOutput(out, ret);
  } catch (const SandboxError& err) {
    spdlog::warn("Timed-out run ended with error: {}", err.what());
  }
  ret.wall_seconds = elapsed();
  ret.outcome = Outcome::TIMED_OUT;
  ret.exit_code = -1;
  if (!session.Restart()) {
    spdlog::error("Failed to restart container {} after timeout", session.GetContainerId().substr(0, 12));
  }
  return ret;
}
