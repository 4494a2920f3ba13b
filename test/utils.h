#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <memory>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <codebox/errors.h>
#include <codebox/limits.h>

#include "fake_engine.h"

// Runs statement and checks that it throws SandboxError with the given code.
#define EXPECT_SANDBOX_ERROR(statement, error_code) \
  do { \
    try { \
      statement; \
      ADD_FAILURE() << "expected " #error_code; \
    } catch (const SandboxError& err) { \
      EXPECT_EQ(err.GetCode(), ErrorCode::error_code) << err.what(); \
    } \
  } while (0)

class TempDirectory {
  std::filesystem::path path_;
 public:
  TempDirectory();
  ~TempDirectory();
  const std::filesystem::path& Path() const { return path_; }
  // creates parent directories as needed
  void WriteFile(const std::string& rel, const std::string& content) const;
};

class FakeEngineTest : public ::testing::Test {
 protected:
  void SetUp() override { engine = std::make_shared<FakeEngine>(); }

  // small limits so that timeouts finish quickly
  static ResourceLimits QuickLimits(int timeout = 1) { return ResourceLimits(64L << 20, 0.5, 16, timeout); }

  std::shared_ptr<FakeEngine> engine;
};

#endif // TEST_UTILS_H_
