#include "docker_engine.h"

#include <sys/socket.h>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "http_utils.h"
#include "stream_demux.h"

namespace {

using namespace std::chrono_literals;
using nlohmann::json;

constexpr auto kDefaultReadTimeout = 60s;
constexpr auto kPullReadTimeout = 600s;
const char kJson[] = "application/json";

inline int Status(const httplib::Result& res) {
  return res ? res->status : -1;
}

void LogFailure(const char* what, const std::string& target, const httplib::Result& res) {
  if (!res) {
    spdlog::warn("{} {} failed: {}", what, target, httplib::to_string(res.error()));
    return;
  }
  std::string message = res->body;
  if (auto body = json::parse(res->body, nullptr, false); !body.is_discarded() && body.contains("message")) {
    message = body["message"].get<std::string>();
  }
  spdlog::warn("{} {} failed: status={} {}", what, target, res->status, message);
}

json ParseBody(const httplib::Result& res) {
  return json::parse(res->body, nullptr, false);
}

} // namespace

std::pair<std::string, std::string> SplitImageReference(const std::string& image) {
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  // a colon before the last slash belongs to a registry port
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

std::shared_ptr<ContainerEngine> MakeDockerEngine() {
  return std::make_shared<DockerEngine>(kEngineSocket, kEngineApiVersion);
}

DockerEngine::DockerEngine(const fs::path& socket, const std::string& api_version) :
    socket_(socket), api_prefix_(api_version.empty() ? "" : "/" + api_version) {}

std::unique_ptr<httplib::Client> DockerEngine::NewClient(std::chrono::seconds read_timeout) const {
  auto cli = std::make_unique<httplib::Client>(socket_.string());
  cli->set_address_family(AF_UNIX);
  // the engine rejects the socket path as a Host header
  cli->set_default_headers({{"Host", "localhost"}});
  cli->set_connection_timeout(5s);
  cli->set_read_timeout(read_timeout);
  cli->set_write_timeout(kDefaultReadTimeout);
  return cli;
}

std::string DockerEngine::Endpoint(const std::string& path) const {
  return api_prefix_ + path;
}

bool DockerEngine::Ping() {
  auto cli = NewClient(5s);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/_ping"));
  if (!IsSuccess(res)) {
    LogFailure("Ping", socket_.string(), res);
    return false;
  }
  return true;
}

bool DockerEngine::ImageExists(const std::string& image) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/images/" + image + "/json"));
  if (Status(res) == 404) return false;
  if (!IsSuccess(res)) {
    LogFailure("Inspect image", image, res);
    return false;
  }
  return true;
}

bool DockerEngine::PullImage(const std::string& image) {
  auto [repo, tag] = SplitImageReference(image);
  spdlog::info("Pulling image {}", image);
  auto cli = NewClient(kPullReadTimeout);
  auto res = HTTPRequest<HTTPPost>(*cli,
      Endpoint("/images/create?fromImage=" + http_utils::EncodeQuery(repo) + "&tag=" + http_utils::EncodeQuery(tag)),
      std::string(), std::string(kJson));
  if (!IsSuccess(res)) {
    LogFailure("Pull image", image, res);
    return false;
  }
  // progress is streamed as JSON lines; failures show up as an "error" line with status 200
  std::istringstream lines(res->body);
  for (std::string line; std::getline(lines, line);) {
    auto msg = json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.contains("error")) continue;
    spdlog::warn("Pull image {} failed: {}", image, msg["error"].dump());
    return false;
  }
  spdlog::info("Pulled image {}", image);
  return true;
}

std::optional<std::string> DockerEngine::CreateContainer(const ContainerSpec& spec) {
  json host_config = {
    {"Memory", spec.memory_bytes},
    // no swap, so exceeding Memory triggers the OOM killer
    {"MemorySwap", spec.memory_bytes},
    {"NanoCpus", spec.nano_cpus},
    {"PidsLimit", spec.pids_limit},
  };
  if (spec.gpu) {
    host_config["DeviceRequests"] = json::array({
      {{"Driver", "nvidia"}, {"Count", -1}, {"Capabilities", json::array({json::array({"gpu"})})}},
    });
  }
  json body = {
    {"Image", spec.image},
    {"Cmd", spec.command},
    {"WorkingDir", spec.workdir},
    {"Tty", false},
    {"OpenStdin", false},
    {"Labels", spec.labels},
    {"HostConfig", host_config},
  };
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/create"), body.dump(), std::string(kJson));
  if (!IsSuccess(res)) {
    LogFailure("Create container", spec.image, res);
    return std::nullopt;
  }
  auto reply = ParseBody(res);
  if (reply.is_discarded() || !reply.contains("Id")) {
    spdlog::warn("Create container {}: unexpected reply {}", spec.image, res->body);
    return std::nullopt;
  }
  if (auto warnings = reply.find("Warnings"); warnings != reply.end() && warnings->is_array()) {
    for (auto& i : *warnings) spdlog::warn("Create container {}: {}", spec.image, i.dump());
  }
  return reply["Id"].get<std::string>();
}

bool DockerEngine::StartContainer(const std::string& id) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/" + id + "/start"), std::string(), std::string(kJson));
  // 304: already started
  if (Status(res) == 304) return true;
  if (!IsSuccess(res)) {
    LogFailure("Start container", id, res);
    return false;
  }
  return true;
}

bool DockerEngine::KillContainer(const std::string& id) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/" + id + "/kill?signal=SIGKILL"),
                                   std::string(), std::string(kJson));
  // 409: not running
  if (Status(res) == 409) {
    spdlog::debug("Kill container {}: not running", id);
    return true;
  }
  if (!IsSuccess(res)) {
    LogFailure("Kill container", id, res);
    return false;
  }
  return true;
}

bool DockerEngine::RemoveContainer(const std::string& id) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPDelete>(*cli, Endpoint("/containers/" + id + "?force=true&v=true"));
  if (Status(res) == 404) {
    spdlog::debug("Remove container {}: already removed", id);
    return true;
  }
  if (!IsSuccess(res)) {
    LogFailure("Remove container", id, res);
    return false;
  }
  return true;
}

std::optional<bool> DockerEngine::IsRunning(const std::string& id) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/containers/" + id + "/json"));
  if (Status(res) == 404) return false;
  if (!IsSuccess(res)) {
    LogFailure("Inspect container", id, res);
    return std::nullopt;
  }
  auto reply = ParseBody(res);
  if (reply.is_discarded() || !reply.contains("State")) return std::nullopt;
  return reply["State"].value("Running", false);
}

bool DockerEngine::PutArchive(const std::string& id, const std::string& dir, const std::string& tar) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPPut>(*cli,
      Endpoint("/containers/" + id + "/archive?path=" + http_utils::EncodeQuery(dir)),
      tar, std::string("application/x-tar"));
  if (!IsSuccess(res)) {
    LogFailure("Upload archive to", dir, res);
    return false;
  }
  return true;
}

std::optional<std::string> DockerEngine::CreateExec(const std::string& id, const ExecSpec& spec) {
  json body = {
    {"AttachStdin", false},
    {"AttachStdout", true},
    {"AttachStderr", true},
    {"Tty", false},
    {"Cmd", spec.command},
  };
  if (!spec.env.empty()) body["Env"] = spec.env;
  if (!spec.workdir.empty()) body["WorkingDir"] = spec.workdir;
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/" + id + "/exec"), body.dump(), std::string(kJson));
  if (!IsSuccess(res)) {
    LogFailure("Create exec in", id, res);
    return std::nullopt;
  }
  auto reply = ParseBody(res);
  if (reply.is_discarded() || !reply.contains("Id")) return std::nullopt;
  return reply["Id"].get<std::string>();
}

bool DockerEngine::StartExec(const std::string& exec_id, std::chrono::seconds stream_timeout, ExecOutput& output) {
  StreamDemuxer demux(output.stdout_text, output.stderr_text, (size_t)kMaxOutput * 1024);
  httplib::Request req;
  req.method = "POST";
  req.path = Endpoint("/exec/" + exec_id + "/start");
  req.set_header("Host", "localhost");
  req.set_header("Content-Type", kJson);
  req.body = json{{"Detach", false}, {"Tty", false}}.dump();
  // the reply is a raw multiplexed stream that ends when the exec exits
  req.content_receiver = [&demux](const char* data, size_t len, uint64_t, uint64_t) {
    demux.Feed(data, len);
    return true;
  };
  spdlog::debug("POST {} params {}", req.path, req.body);
  auto cli = NewClient(stream_timeout);
  auto res = cli->send(req);
  if (!IsSuccess(res)) {
    LogFailure("Start exec", exec_id, res);
    return false;
  }
  if (demux.Malformed() || demux.Pending()) {
    spdlog::warn("Exec {} stream ended with {} undecoded bytes", exec_id, demux.Pending());
  }
  output.truncated = demux.Truncated();
  return true;
}

std::optional<int> DockerEngine::ExecExitCode(const std::string& exec_id) {
  auto cli = NewClient(kDefaultReadTimeout);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/exec/" + exec_id + "/json"));
  if (!IsSuccess(res)) {
    LogFailure("Inspect exec", exec_id, res);
    return std::nullopt;
  }
  auto reply = ParseBody(res);
  if (reply.is_discarded() || reply.value("Running", false)) return std::nullopt;
  if (auto code = reply.find("ExitCode"); code != reply.end() && code->is_number_integer()) {
    return code->get<int>();
  }
  return std::nullopt;
}
