#include <signal.h>
#include <pthread.h>
#include <atomic>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/paths.h>
#include <codebox/utils.h>
#include <codebox/limits.h>
#include <codebox/logger.h>
#include <codebox/interpreter.h>
#include "codebox/server.h"
#include "codebox/interrupt_relay.h"

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr int kInterruptExitCode = 130;
constexpr int kUsageExitCode = 2;
const fs::path kDefaultConfig = "/etc/codebox.conf";

InterruptRelay interrupt_relay;
std::atomic_bool serving = false;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string engine_socket = ini[""]["engine_socket"] | "";
  std::string container_dir = ini[""]["container_dir"] | "";
  std::string tmp_dir = ini[""]["tmp_dir"] | "";
  if (engine_socket.size()) kEngineSocket = engine_socket;
  if (container_dir.size()) kContainerDir = container_dir;
  if (tmp_dir.size()) kContainerTmpDir = tmp_dir;
  kEngineApiVersion = ini[""]["engine_api_version"] | kEngineApiVersion;
  kDefaultMemory = ini[""]["default_memory"] | kDefaultMemory;
  kDefaultCpus = ini[""]["default_cpus"] | kDefaultCpus;
  kDefaultPids = ini[""]["default_pids"] | kDefaultPids;
  kDefaultTimeout = ini[""]["default_timeout"] | kDefaultTimeout;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  return true;
}

// SIGINT/SIGTERM are blocked in every thread and consumed here
void SignalLoop(sigset_t set) {
  int sig;
  while (sigwait(&set, &sig) == 0) {
    spdlog::info("Received signal {}", sig);
    if (serving) {
      StopServer();
    } else {
      interrupt_relay.Request();
    }
  }
}

void StartSignalThread() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  std::thread thr(SignalLoop, set);
  thr.detach();
}

bool ConfirmOnTerminal(LanguageFamily family, const std::string& code) {
  std::cerr << "----- " << LanguageFamilyName(family) << " -----\n" << code << "\n-----\n";
  std::cerr << "Run this code? [Y/n] " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) return false;
  return line.empty() || line == "y" || line == "Y" || line == "yes";
}

void PrintRuntimes(std::ostream& out) {
  out << "Supported runtimes:";
  for (Runtime runtime : AllRuntimes()) out << ' ' << RuntimeName(runtime);
  out << std::endl;
}

int ExitCodeOf(const ExecutionResult& result) {
  switch (result.outcome) {
    case Outcome::NORMAL: return 0;
    case Outcome::NONZERO_EXIT: return result.exit_code > 0 && result.exit_code < 256 ? result.exit_code : 1;
    case Outcome::OUT_OF_MEMORY: return kOomExitCode;
    case Outcome::TIMED_OUT: return kTimeoutExitCode;
    case Outcome::INTERRUPTED: return kInterruptExitCode;
  }
  __builtin_unreachable();
}

int DoRun(argparse::ArgumentParser& cmd) {
  auto code = cmd.present<std::string>("--code");
  auto file = cmd.present<std::string>("--file");
  if (!code == !file) {
    std::cerr << "Exactly one of --code and --file is required" << std::endl;
    std::cerr << cmd;
    return kUsageExitCode;
  }
  try {
    ResourceLimits limits = MakeLimits(
        cmd.present<std::string>("--memory").value_or(kDefaultMemory),
        cmd.present<std::string>("--cpus").value_or(kDefaultCpus),
        cmd.present<int>("--pids").value_or(kDefaultPids),
        cmd.present<int>("--timeout").value_or(kDefaultTimeout));
    std::string runtime = cmd.get<std::string>("--runtime");
    std::string language = cmd.get<std::string>("--language");
    fs::path host_dir = cmd.get<std::string>("--dir");

    Interpreter interpreter(runtime, limits, host_dir);
    if (!interrupt_relay.Attach(&interpreter)) {
      // interrupted while the container was being set up
      interpreter.Dispose();
      return kInterruptExitCode;
    }
    if (cmd["--confirm"] == true) interpreter.SetConfirmHook(ConfirmOnTerminal);
    ExecutionResult result;
    try {
      if (code) {
        result = language.empty() ? interpreter.Run(*code) : interpreter.Execute(*code, language);
      } else {
        result = interpreter.ExecuteScript(*file, language);
      }
    } catch (const SandboxError&) {
      interrupt_relay.Detach();
      throw;
    }
    interrupt_relay.Detach();
    interpreter.Dispose();

    std::cout << result.stdout_text << std::flush;
    std::cerr << result.stderr_text << std::flush;
    if (result.truncated) spdlog::warn("Output truncated at {} KiB per stream", kMaxOutput);
    if (result.outcome != Outcome::NORMAL && result.outcome != Outcome::NONZERO_EXIT) {
      spdlog::warn("{}", OutcomeToDesc(result.outcome));
    }
    return interrupt_relay.Requested() ? kInterruptExitCode : ExitCodeOf(result);
  } catch (const SandboxError& err) {
    std::cerr << err.what() << std::endl;
    if (interrupt_relay.Requested()) return kInterruptExitCode;
    if (err.GetCode() == ErrorCode::UNSUPPORTED_RUNTIME) {
      PrintRuntimes(std::cerr);
      return kUsageExitCode;
    }
    return 1;
  }
}

int DoServe(argparse::ArgumentParser& cmd) {
  if (auto val = cmd.present<std::string>("--host")) kListenHost = val.value();
  if (auto val = cmd.present<int>("--port")) kListenPort = val.value();
  serving = true;
  return ServeForever(kListenHost, kListenPort, nullptr) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute code once in a fresh sandbox");
  run_cmd.add_argument("-c", "--code")
    .help("Source code to execute");
  run_cmd.add_argument("--file")
    .help("Host script file to execute instead of --code");
  run_cmd.add_argument("--runtime")
    .default_value(std::string(kDefaultRuntime))
    .help("Runtime identifier");
  run_cmd.add_argument("--language")
    .default_value(std::string(""))
    .help("Language of the code (default: the runtime's own)");
  run_cmd.add_argument("--memory")
    .help("Memory ceiling, e.g. 512m");
  run_cmd.add_argument("--cpus")
    .help("CPU share, e.g. 1.0");
  run_cmd.add_argument("--pids")
    .scan<'d', int>()
    .help("Maximum number of processes");
  run_cmd.add_argument("--timeout")
    .scan<'d', int>()
    .help("Wall-clock limit in seconds");
  run_cmd.add_argument("-d", "--dir")
    .default_value(std::string(""))
    .help("Host directory staged into the container working directory");
  run_cmd.add_argument("--confirm")
    .default_value(false)
    .implicit_value(true)
    .help("Ask before executing");

  argparse::ArgumentParser serve_cmd("serve");
  serve_cmd.add_description("Serve POST /execute over HTTP");
  serve_cmd.add_argument("--host")
    .help("Listen address");
  serve_cmd.add_argument("--port")
    .scan<'d', int>()
    .help("Listen port");

  parser.add_subparser(run_cmd);
  parser.add_subparser(serve_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return kUsageExitCode;
  }
  InitLogger(verbosity);

  if (auto config = parser.present<std::string>("--config")) {
    if (!ParseConfig(*config)) {
      spdlog::error("Failed to parse configuration file {}", *config);
      return 1;
    }
  } else if (fs::exists(kDefaultConfig) && !ParseConfig(kDefaultConfig)) {
    spdlog::error("Failed to parse configuration file {}", kDefaultConfig.string());
    return 1;
  }

  StartSignalThread();
  if (parser.is_subcommand_used("run")) return DoRun(run_cmd);
  if (parser.is_subcommand_used("serve")) return DoServe(serve_cmd);
  std::cerr << parser;
  return kUsageExitCode;
}
