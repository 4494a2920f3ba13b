#ifndef CODEBOX_SUPERVISOR_H_
#define CODEBOX_SUPERVISOR_H_

#include <chrono>
#include <string>
#include <vector>

#include <codebox/execution.h>
#include "session.h"

// Runs command in the session and races it against timeout.
// On expiry the whole container is killed, the run is joined, and the container is restarted;
//   the result is TIMED_OUT with whatever output arrived before the kill.
// throws SandboxError if the run itself fails (see SandboxSession::Run),
//   including a broken output stream on a run that was neither timed out nor interrupted
ExecutionResult Supervise(SandboxSession& session, const std::vector<std::string>& command,
                          const std::vector<std::string>& env, std::chrono::seconds timeout);

#endif  // CODEBOX_SUPERVISOR_H_
