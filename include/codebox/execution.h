#ifndef INCLUDE_CODEBOX_EXECUTION_H_
#define INCLUDE_CODEBOX_EXECUTION_H_

#include <string>

// exit status reported by the engine when the memory cgroup kills the process
constexpr int kOomExitCode = 137;

// name, abbreviation, description
#define ENUM_OUTCOME_ \
  X(NORMAL, "OK", "Exited normally") \
  X(NONZERO_EXIT, "RE", "Exited with nonzero status") \
  X(OUT_OF_MEMORY, "OOM", "Killed for exceeding the memory limit") \
  X(TIMED_OUT, "TLE", "Killed for exceeding the wall-clock limit") \
  X(INTERRUPTED, "INT", "Interrupted by the caller")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

struct ExecutionResult {
  std::string stdout_text, stderr_text;
  // not meaningful if outcome is TIMED_OUT or INTERRUPTED
  int exit_code;
  double wall_seconds;
  Outcome outcome;
  // output exceeded kMaxOutput and was cut
  bool truncated;

  ExecutionResult() : exit_code(-1), wall_seconds(0), outcome(Outcome::NORMAL), truncated(false) {}
};

Outcome ClassifyExitCode(int exit_code);

#endif  // INCLUDE_CODEBOX_EXECUTION_H_
