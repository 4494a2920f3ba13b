#ifndef INCLUDE_CODEBOX_INTERPRETER_H_
#define INCLUDE_CODEBOX_INTERPRETER_H_

#include <mutex>
#include <memory>
#include <string>
#include <filesystem>
#include <functional>

#include "limits.h"
#include "engine.h"
#include "runtimes.h"
#include "execution.h"

class SandboxSession;

// Public entry point. One instance owns one container for its whole lifetime:
//   Ready --Execute()--> Ready --Dispose()--> Disposed
// Execute calls on one instance are serialized and see the files left by previous calls;
//   use separate instances for isolation.
// Construction and Execute throw SandboxError; per-run outcomes are values on ExecutionResult.
class Interpreter {
 public:
  // return false to abort; called before the code is staged
  using ConfirmHook = std::function<bool(LanguageFamily, const std::string& code)>;

  // Starts the container eagerly. host_dir (if not empty) is uploaded to kContainerDir once.
  // engine = nullptr uses MakeDockerEngine()
  Interpreter(const std::string& runtime_id,
              const ResourceLimits& limits = ResourceLimits(),
              const std::filesystem::path& host_dir = {},
              std::shared_ptr<ContainerEngine> engine = nullptr);
  ~Interpreter();
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  ExecutionResult Execute(const std::string& code, const std::string& language);
  // in the runtime's own language
  ExecutionResult Run(const std::string& code);
  // language is deduced from the file extension if empty
  ExecutionResult ExecuteScript(const std::filesystem::path& file, const std::string& language = "");

  // Kills the in-flight program (if any) without touching the container.
  // Safe to call from another thread; the running Execute returns Outcome::INTERRUPTED.
  void Interrupt();

  // idempotent; also called by the destructor
  void Dispose();
  bool IsDisposed() const;

  void SetConfirmHook(ConfirmHook hook);

  const RuntimeSpec& GetRuntimeSpec() const { return spec_; }
  const ResourceLimits& GetLimits() const { return limits_; }

 private:
  const RuntimeSpec spec_;
  const ResourceLimits limits_;
  bool has_workspace_;
  ConfirmHook confirm_;
  std::unique_ptr<SandboxSession> session_;
  // serializes Execute/Dispose
  mutable std::mutex mtx_;
};

#endif  // INCLUDE_CODEBOX_INTERPRETER_H_
