#include <codebox/interpreter.h>

#include <spdlog/spdlog.h>
#include <codebox/paths.h>
#include <codebox/utils.h>
#include <codebox/errors.h>

#include "utils.h"
#include "session.h"
#include "supervisor.h"

namespace {

bool IsBlank(const std::string& code) {
  return code.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

std::vector<std::string> SearchPathEnv(LanguageFamily family) {
  switch (family) {
    case LanguageFamily::PYTHON: return {"PYTHONPATH=" + kContainerDir};
    case LanguageFamily::NODE: return {"NODE_PATH=" + kContainerDir};
  }
  __builtin_unreachable();
}

} // namespace

Interpreter::Interpreter(const std::string& runtime_id, const ResourceLimits& limits,
                         const fs::path& host_dir, std::shared_ptr<ContainerEngine> engine) :
    spec_(ResolveRuntime(runtime_id)),
    limits_(limits),
    has_workspace_(!host_dir.empty()) {
  ValidateLimits(limits_);
  if (!engine) engine = MakeDockerEngine();
  session_ = std::make_unique<SandboxSession>(std::move(engine), limits_);
  session_->Start(spec_);
  if (has_workspace_) {
    try {
      session_->UploadTree(host_dir, kContainerDir);
    } catch (const SandboxError& err) {
      spdlog::error("Failed to stage workspace {}: {}", host_dir.c_str(), err.what());
      session_->Terminate();
      throw;
    }
  }
}

Interpreter::~Interpreter() {
  Dispose();
}

ExecutionResult Interpreter::Execute(const std::string& code, const std::string& language) {
  std::lock_guard lck(mtx_);
  if (session_->GetState() == SessionState::TERMINATED) {
    throw SandboxError(ErrorCode::SESSION_CLOSED, "interpreter disposed");
  }
  if (IsBlank(code)) throw SandboxError(ErrorCode::EMPTY_CODE, "");
  auto family = GetLanguageFamily(language);
  if (!family || *family != spec_.family) {
    throw SandboxError(ErrorCode::UNSUPPORTED_LANGUAGE,
        fmt::format("{} (runtime {} runs {})", language, RuntimeName(spec_.runtime),
                    LanguageFamilyName(spec_.family)));
  }
  if (confirm_ && !confirm_(*family, code)) {
    spdlog::info("Execution declined by confirmation hook");
    throw SandboxError(ErrorCode::EXECUTION_ABORTED, "declined by caller");
  }
  session_->CheckAlive();

  long id = GetUniqueExecutionId();
  fs::path file = ContainerCodeFile(SourceExtension(*family));
  std::string container_file = session_->UploadFile(file.filename(), code);
  std::vector<std::string> env;
  if (has_workspace_) env = SearchPathEnv(*family);
  spdlog::info("Execution {} started: runtime={} file={}", id, RuntimeName(spec_.runtime), container_file);

  ExecutionResult ret = Supervise(*session_, RunCommand(spec_, container_file), env,
                                  std::chrono::seconds(limits_.timeout_seconds));
  spdlog::info("Execution {} finished: outcome={} exit_code={} wall={:.3f}s", id,
               OutcomeName(ret.outcome), ret.exit_code, ret.wall_seconds);
  // the container may have been restarted after a timeout; the file is still there
  IGNORE_RETURN(session_->RemoveFiles({container_file}));
  return ret;
}

ExecutionResult Interpreter::Run(const std::string& code) {
  return Execute(code, LanguageFamilyName(spec_.family));
}

ExecutionResult Interpreter::ExecuteScript(const fs::path& file, const std::string& language) {
  std::string lang = language;
  if (lang.empty()) {
    auto family = LanguageFamilyFromExtension(file.extension());
    if (!family) {
      throw SandboxError(ErrorCode::UNSUPPORTED_LANGUAGE, "cannot deduce language of " + file.string());
    }
    lang = LanguageFamilyName(*family);
  }
  if (!IsRegularFile(file)) throw SandboxError(ErrorCode::FILE_NOT_FOUND, file.string());
  std::string code;
  if (!ReadFile(file, code)) throw SandboxError(ErrorCode::FILE_NOT_FOUND, file.string());
  return Execute(code, lang);
}

void Interpreter::Interrupt() {
  // no lock: Execute holds it for the whole run
  if (!session_->Interrupt()) spdlog::debug("Nothing to interrupt");
}

void Interpreter::Dispose() {
  std::lock_guard lck(mtx_);
  session_->Terminate();
}

bool Interpreter::IsDisposed() const {
  return session_->GetState() == SessionState::TERMINATED;
}

void Interpreter::SetConfirmHook(ConfirmHook hook) {
  std::lock_guard lck(mtx_);
  confirm_ = std::move(hook);
}
