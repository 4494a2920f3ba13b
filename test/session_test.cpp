#include <thread>

#include <gtest/gtest.h>
#include <codebox/paths.h>
#include <codebox/runtimes.h>

#include "utils.h"
#include "codebox/session.h"

class SessionTest : public FakeEngineTest {
 protected:
  RuntimeSpec spec = ResolveRuntime("python:3.11");
};

TEST_F(SessionTest, StartAppliesLimits) {
  SandboxSession session(engine, ResourceLimits(256L << 20, 1.5, 32, 5));
  session.Start(spec);
  EXPECT_EQ(session.GetState(), SessionState::RUNNING);
  EXPECT_EQ(engine->LiveContainers(), 1u);
  const ContainerSpec& created = engine->last_container;
  EXPECT_EQ(created.image, "python:3.11-slim");
  EXPECT_EQ(created.memory_bytes, 256L << 20);
  EXPECT_EQ(created.nano_cpus, 1500000000);
  EXPECT_EQ(created.pids_limit, 32);
  EXPECT_FALSE(created.gpu);
  EXPECT_EQ(created.workdir, kContainerDir);
  EXPECT_EQ(created.command, SplitCommand(kContainerCommand));
  EXPECT_EQ(created.labels.at("codebox.runtime"), "python:3.11");
  EXPECT_EQ(engine->pulls, 0);
  session.Terminate();
  EXPECT_EQ(session.GetState(), SessionState::TERMINATED);
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST_F(SessionTest, GpuRuntime) {
  SandboxSession session(engine, QuickLimits());
  session.Start(ResolveRuntime("python:3.11-gpu"));
  EXPECT_TRUE(engine->last_container.gpu);
}

TEST_F(SessionTest, PullsMissingImage) {
  engine->image_present = false;
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  EXPECT_EQ(engine->pulls, 1);
  EXPECT_EQ(session.GetState(), SessionState::RUNNING);
}

TEST_F(SessionTest, PullFailure) {
  engine->image_present = false;
  engine->pull_ok = false;
  SandboxSession session(engine, QuickLimits());
  EXPECT_SANDBOX_ERROR(session.Start(spec), IMAGE_PULL_ERROR);
  EXPECT_EQ(engine->creates, 0);
  EXPECT_EQ(session.GetState(), SessionState::TERMINATED);
}

TEST_F(SessionTest, EngineUnreachable) {
  engine->reachable = false;
  SandboxSession session(engine, QuickLimits());
  EXPECT_SANDBOX_ERROR(session.Start(spec), ENGINE_UNAVAILABLE);
  EXPECT_EQ(engine->pings, 1);
  EXPECT_EQ(engine->pulls, 0);
  EXPECT_EQ(engine->creates, 0);
}

TEST_F(SessionTest, InvalidLimitsTouchNothing) {
  SandboxSession session(engine, ResourceLimits(64L << 20, 0.0, 16, 1));
  EXPECT_SANDBOX_ERROR(session.Start(spec), INVALID_LIMITS);
  EXPECT_EQ(engine->pings, 0);
  EXPECT_EQ(engine->creates, 0);
}

TEST_F(SessionTest, CreateFailure) {
  engine->create_ok = false;
  SandboxSession session(engine, QuickLimits());
  EXPECT_SANDBOX_ERROR(session.Start(spec), CONTAINER_ERROR);
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST_F(SessionTest, StartFailureRemovesContainer) {
  engine->start_ok = false;
  SandboxSession session(engine, QuickLimits());
  EXPECT_SANDBOX_ERROR(session.Start(spec), CONTAINER_ERROR);
  EXPECT_EQ(engine->creates, 1);
  EXPECT_EQ(engine->removes, 1);
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST_F(SessionTest, TerminateIsIdempotent) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  session.Terminate();
  session.Terminate();
  EXPECT_EQ(engine->removes, 1);
}

TEST_F(SessionTest, DestructorRemovesContainer) {
  {
    SandboxSession session(engine, QuickLimits());
    session.Start(spec);
    EXPECT_EQ(engine->LiveContainers(), 1u);
  }
  EXPECT_EQ(engine->LiveContainers(), 0u);
  EXPECT_EQ(engine->removes, 1);
}

TEST_F(SessionTest, UploadAndRun) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  std::string path = session.UploadFile("prog.py", "print:hi\nerr:warn\nexit:3\n");
  EXPECT_EQ(path, kContainerTmpDir + "/prog.py");
  RunOutput out = session.Run({"python", path});
  EXPECT_EQ(out.stdout_text, "hi\n");
  EXPECT_EQ(out.stderr_text, "warn\n");
  EXPECT_EQ(out.exit_code, 3);
  EXPECT_FALSE(out.interrupted);
  EXPECT_TRUE(session.RemoveFiles({path}));
  EXPECT_FALSE(engine->GetFile(path));
}

TEST_F(SessionTest, UploadTree) {
  TempDirectory dir;
  dir.WriteFile("pkg/mod.py", "X = 1\n");
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  session.UploadTree(dir.Path(), kContainerDir);
  EXPECT_EQ(engine->GetFile("/home/app/pkg/mod.py"), "X = 1\n");
}

TEST_F(SessionTest, UploadRequiresRunning) {
  SandboxSession session(engine, QuickLimits());
  EXPECT_SANDBOX_ERROR(session.UploadFile("a.py", ""), UPLOAD_ERROR);
  session.Start(spec);
  engine->put_ok = false;
  EXPECT_SANDBOX_ERROR(session.UploadFile("a.py", ""), UPLOAD_ERROR);
  session.Terminate();
  engine->put_ok = true;
  EXPECT_SANDBOX_ERROR(session.UploadFile("a.py", ""), UPLOAD_ERROR);
}

TEST_F(SessionTest, RunAfterTerminate) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  session.Terminate();
  EXPECT_SANDBOX_ERROR(session.Run({"true"}), SESSION_CLOSED);
  EXPECT_SANDBOX_ERROR(session.CheckAlive(), SESSION_CLOSED);
}

TEST_F(SessionTest, ExecFailure) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  engine->exec_ok = false;
  EXPECT_SANDBOX_ERROR(session.Run({"python", "/tmp/x.py"}), CONTAINER_ERROR);
}

TEST_F(SessionTest, CheckAlive) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  EXPECT_NO_THROW(session.CheckAlive());
  engine->Crash();
  EXPECT_SANDBOX_ERROR(session.CheckAlive(), CONTAINER_ERROR);
  engine->reachable = false;
  EXPECT_SANDBOX_ERROR(session.CheckAlive(), ENGINE_UNAVAILABLE);
}

TEST_F(SessionTest, InterruptKeepsContainer) {
  SandboxSession session(engine, QuickLimits());
  session.Start(spec);
  EXPECT_FALSE(session.Interrupt()); // nothing running
  std::string path = session.UploadFile("hang.py", "print:before\nhang\nprint:after\n");
  std::thread thr([&]() {
    engine->WaitForHang();
    EXPECT_TRUE(session.Interrupt());
  });
  RunOutput out = session.Run({"python", path});
  thr.join();
  EXPECT_TRUE(out.interrupted);
  EXPECT_EQ(out.stdout_text, "before\n");
  EXPECT_EQ(engine->kills, 0);
  EXPECT_NO_THROW(session.CheckAlive());
}

TEST(SplitCommand, Words) {
  EXPECT_EQ(SplitCommand("tail -f  /dev/null"), (std::vector<std::string>{"tail", "-f", "/dev/null"}));
  EXPECT_TRUE(SplitCommand("   ").empty());
}
