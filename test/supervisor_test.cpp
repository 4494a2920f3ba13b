#include <set>
#include <mutex>
#include <thread>

#include <gtest/gtest.h>
#include <codebox/paths.h>
#include <codebox/utils.h>
#include <codebox/runtimes.h>
#include <codebox/execution.h>

#include "utils.h"
#include "codebox/session.h"
#include "codebox/supervisor.h"

namespace {

using namespace std::chrono_literals;

struct ExitParam {
  int exit_code;
  Outcome outcome;
};

std::string ExitName(const ::testing::TestParamInfo<ExitParam>& info) {
  return std::string(OutcomeToAbr(info.param.outcome)) + "_" + std::to_string(info.param.exit_code);
}

// Program streams end with an error after the output has been delivered,
// like a daemon resetting the connection when the container goes away.
class BrokenStreamEngine : public FakeEngine {
 public:
  std::optional<std::string> CreateExec(const std::string& id, const ExecSpec& spec) override {
    auto ret = FakeEngine::CreateExec(id, spec);
    if (ret && spec.command.size() == 2) {
      std::lock_guard lck(broken_mtx_);
      broken_.insert(*ret);
    }
    return ret;
  }
  bool StartExec(const std::string& exec_id, std::chrono::seconds timeout, ExecOutput& output) override {
    bool ok = FakeEngine::StartExec(exec_id, timeout, output);
    std::lock_guard lck(broken_mtx_);
    return ok && !broken_.count(exec_id);
  }
 private:
  std::mutex broken_mtx_;
  std::set<std::string> broken_;
};

} // namespace

class ExitClassification : public testing::TestWithParam<ExitParam> {};
TEST_P(ExitClassification, Classify) {
  EXPECT_EQ(ClassifyExitCode(GetParam().exit_code), GetParam().outcome);
}
INSTANTIATE_TEST_SUITE_P(Supervisor, ExitClassification,
    testing::Values(
      (ExitParam){0, Outcome::NORMAL},
      (ExitParam){1, Outcome::NONZERO_EXIT},
      (ExitParam){2, Outcome::NONZERO_EXIT},
      (ExitParam){139, Outcome::NONZERO_EXIT},
      (ExitParam){137, Outcome::OUT_OF_MEMORY}
    ),
    ExitName);

class SupervisorTest : public FakeEngineTest {
 protected:
  void SetUp() override {
    FakeEngineTest::SetUp();
    session = std::make_unique<SandboxSession>(engine, QuickLimits());
    session->Start(ResolveRuntime("python:3.11"));
  }
  ExecutionResult RunProgram(const std::string& program, std::chrono::seconds timeout = 5s) {
    std::string path = session->UploadFile("prog.py", program);
    return Supervise(*session, {"python", path}, {}, timeout);
  }
  std::unique_ptr<SandboxSession> session;
};

TEST_F(SupervisorTest, Normal) {
  ExecutionResult res = RunProgram("print:2\n");
  EXPECT_EQ(res.outcome, Outcome::NORMAL);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_text, "2\n");
  EXPECT_LT(res.wall_seconds, 5);
}

TEST_F(SupervisorTest, NonZeroExit) {
  ExecutionResult res = RunProgram("err:Traceback\nexit:1\n");
  EXPECT_EQ(res.outcome, Outcome::NONZERO_EXIT);
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_EQ(res.stderr_text, "Traceback\n");
}

TEST_F(SupervisorTest, OutOfMemory) {
  ExecutionResult res = RunProgram("exit:137\n");
  EXPECT_EQ(res.outcome, Outcome::OUT_OF_MEMORY);
  EXPECT_EQ(res.exit_code, kOomExitCode);
}

TEST_F(SupervisorTest, TimeoutKillsAndRestarts) {
  auto start = std::chrono::steady_clock::now();
  ExecutionResult res = RunProgram("print:partial\nhang\n", 1s);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.outcome, Outcome::TIMED_OUT);
  EXPECT_EQ(res.stdout_text, "partial\n");
  EXPECT_GE(res.wall_seconds, 1.0);
  EXPECT_LT(elapsed, 4s);
  EXPECT_EQ(engine->kills, 1);
  // restarted in place: same container, files kept
  EXPECT_NO_THROW(session->CheckAlive());
  EXPECT_EQ(engine->LiveContainers(), 1u);
  EXPECT_TRUE(engine->GetFile(kContainerTmpDir + "/prog.py"));
  ExecutionResult next = RunProgram("print:again\n");
  EXPECT_EQ(next.outcome, Outcome::NORMAL);
  EXPECT_EQ(next.stdout_text, "again\n");
}

TEST_F(SupervisorTest, Interrupted) {
  std::thread thr([&]() {
    engine->WaitForHang();
    session->Interrupt();
  });
  ExecutionResult res = RunProgram("hang\n");
  thr.join();
  EXPECT_EQ(res.outcome, Outcome::INTERRUPTED);
  EXPECT_EQ(engine->kills, 0);
}

TEST_F(SupervisorTest, RunErrorPropagates) {
  engine->exec_ok = false;
  EXPECT_SANDBOX_ERROR(Supervise(*session, {"python", "/tmp/x.py"}, {}, 5s), CONTAINER_ERROR);
}

class BrokenStreamTest : public FakeEngineTest {
 protected:
  void SetUp() override {
    engine = std::make_shared<BrokenStreamEngine>();
    session = std::make_unique<SandboxSession>(engine, QuickLimits());
    session->Start(ResolveRuntime("python:3.11"));
  }
  ExecutionResult RunProgram(const std::string& program, std::chrono::seconds timeout = 5s) {
    std::string path = session->UploadFile("prog.py", program);
    return Supervise(*session, {"python", path}, {}, timeout);
  }
  std::unique_ptr<SandboxSession> session;
};

TEST_F(BrokenStreamTest, TimeoutKeepsPartialOutput) {
  ExecutionResult res = RunProgram("print:partial\nerr:warn\nhang\n", 1s);
  EXPECT_EQ(res.outcome, Outcome::TIMED_OUT);
  EXPECT_EQ(res.exit_code, -1);
  EXPECT_EQ(res.stdout_text, "partial\n");
  EXPECT_EQ(res.stderr_text, "warn\n");
  EXPECT_EQ(engine->kills, 1);
  EXPECT_NO_THROW(session->CheckAlive());
}

TEST_F(BrokenStreamTest, InterruptKeepsPartialOutput) {
  std::thread thr([&]() {
    engine->WaitForHang();
    session->Interrupt();
  });
  ExecutionResult res = RunProgram("print:before\nhang\n");
  thr.join();
  EXPECT_EQ(res.outcome, Outcome::INTERRUPTED);
  EXPECT_EQ(res.stdout_text, "before\n");
  EXPECT_EQ(engine->kills, 0);
}

TEST_F(BrokenStreamTest, UncancelledRunFails) {
  EXPECT_SANDBOX_ERROR(RunProgram("print:x\n"), CONTAINER_ERROR);
  EXPECT_EQ(engine->kills, 0);
}
