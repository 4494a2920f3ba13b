#ifndef CODEBOX_DOCKER_ENGINE_H_
#define CODEBOX_DOCKER_ENGINE_H_

#include <memory>
#include <codebox/engine.h>
#include <codebox/paths.h>

namespace httplib {
class Client;
} // namespace httplib

// ContainerEngine over the Docker Engine HTTP API on a unix socket.
// A new connection is opened per request, so calls from different threads do not interfere.
class DockerEngine : public ContainerEngine {
  fs::path socket_;
  std::string api_prefix_;

  std::unique_ptr<httplib::Client> NewClient(std::chrono::seconds read_timeout) const;
  std::string Endpoint(const std::string& path) const;
 public:
  DockerEngine(const fs::path& socket, const std::string& api_version);

  bool Ping() override;
  bool ImageExists(const std::string& image) override;
  bool PullImage(const std::string& image) override;
  std::optional<std::string> CreateContainer(const ContainerSpec&) override;
  bool StartContainer(const std::string& id) override;
  bool KillContainer(const std::string& id) override;
  bool RemoveContainer(const std::string& id) override;
  std::optional<bool> IsRunning(const std::string& id) override;
  bool PutArchive(const std::string& id, const std::string& dir, const std::string& tar) override;
  std::optional<std::string> CreateExec(const std::string& id, const ExecSpec&) override;
  bool StartExec(const std::string& exec_id, std::chrono::seconds stream_timeout, ExecOutput&) override;
  std::optional<int> ExecExitCode(const std::string& exec_id) override;
};

// "repo/name:tag" -> ("repo/name", "tag"); tag defaults to "latest"
std::pair<std::string, std::string> SplitImageReference(const std::string& image);

#endif  // CODEBOX_DOCKER_ENGINE_H_
