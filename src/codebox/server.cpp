#include "server.h"

#include <mutex>
#include <limits>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <codebox/utils.h>
#include <codebox/limits.h>
#include <codebox/errors.h>
#include <codebox/interpreter.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8080;

namespace {

using nlohmann::json;

std::mutex server_mtx;
httplib::Server* active_server = nullptr;

json ErrorBody(const std::string& error, const std::string& cls, const std::string& message) {
  return {{"error", error}, {"class", cls}, {"message", message}};
}

// accepts "512m" or a plain byte count
std::string LimitString(const json& limits, const char* key, const std::string& def) {
  auto it = limits.find(key);
  if (it == limits.end() || it->is_null()) return def;
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
  if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
  if (it->is_number()) return fmt::format("{}", it->get<double>());
  throw SandboxError(ErrorCode::INVALID_LIMITS, fmt::format("{} must be a string or a number", key));
}

// whole numbers only; fractions and values outside int are rejected rather than truncated
int LimitInt(const json& limits, const char* key, int def) {
  auto it = limits.find(key);
  if (it == limits.end() || it->is_null()) return def;
  if (it->is_number_unsigned()) {
    uint64_t val = it->get<uint64_t>();
    if (val <= (uint64_t)std::numeric_limits<int>::max()) return (int)val;
  } else if (it->is_number_integer()) {
    int64_t val = it->get<int64_t>();
    if (val >= std::numeric_limits<int>::min() && val <= std::numeric_limits<int>::max()) return (int)val;
  } else {
    throw SandboxError(ErrorCode::INVALID_LIMITS, fmt::format("{} must be an integer", key));
  }
  throw SandboxError(ErrorCode::INVALID_LIMITS, fmt::format("{} is out of range", key));
}

ResourceLimits ParseLimits(const json& body) {
  auto it = body.find("limits");
  if (it == body.end() || it->is_null()) return ResourceLimits();
  const json& limits = *it;
  if (!limits.is_object()) throw SandboxError(ErrorCode::INVALID_LIMITS, "limits must be an object");
  return MakeLimits(LimitString(limits, "memory", kDefaultMemory),
                    LimitString(limits, "cpus", kDefaultCpus),
                    LimitInt(limits, "pids", kDefaultPids),
                    LimitInt(limits, "timeout", kDefaultTimeout));
}

json ResultBody(const ExecutionResult& res) {
  return {
    {"stdout", res.stdout_text},
    {"stderr", res.stderr_text},
    {"exit_code", res.exit_code},
    {"runtime_seconds", res.wall_seconds},
    {"outcome", OutcomeName(res.outcome)},
    {"truncated", res.truncated},
  };
}

void Reply(httplib::Response& res, const HttpReply& reply) {
  res.status = reply.status;
  // program output may not be valid UTF-8
  res.set_content(reply.body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

} // namespace

int HttpStatus(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::CONFIG: return 400;
    case ErrorClass::REQUEST: return 400;
    case ErrorClass::STAGING: return 502;
    case ErrorClass::INFRASTRUCTURE: return 503;
  }
  __builtin_unreachable();
}

HttpReply HandleExecute(const std::string& request_body, const EngineFactory& factory) {
  try {
    json body = json::parse(request_body);
    if (!body.is_object()) return {400, ErrorBody("MALFORMED_REQUEST", "REQUEST", "body must be an object")};
    std::string code = body.at("code").get<std::string>();
    std::string runtime = body.value("runtime", std::string(kDefaultRuntime));
    ResourceLimits limits = ParseLimits(body);

    Interpreter interpreter(runtime, limits, {}, factory ? factory() : nullptr);
    std::string language = body.value("language", std::string(LanguageFamilyName(interpreter.GetRuntimeSpec().family)));
    ExecutionResult result = interpreter.Execute(code, language);
    interpreter.Dispose();
    return {200, ResultBody(result)};
  } catch (const json::exception& err) {
    spdlog::info("Malformed execute request: {}", err.what());
    return {400, ErrorBody("MALFORMED_REQUEST", "REQUEST", err.what())};
  } catch (const SandboxError& err) {
    spdlog::info("Execute request failed: {}", err.what());
    return {HttpStatus(err.GetClass()),
            ErrorBody(ErrorCodeName(err.GetCode()), ErrorClassName(err.GetClass()), err.what())};
  }
}

HttpReply HandleRuntimes() {
  json list = json::array();
  for (Runtime runtime : AllRuntimes()) {
    RuntimeSpec spec = ResolveRuntime(runtime);
    list.push_back({
      {"id", RuntimeName(runtime)},
      {"image", spec.image},
      {"language", LanguageFamilyName(spec.family)},
      {"gpu", spec.gpu},
    });
  }
  return {200, {{"runtimes", list}, {"default", kDefaultRuntime}}};
}

bool ServeForever(const std::string& host, int port, EngineFactory factory) {
  httplib::Server svr;
  svr.Post("/execute", [&factory](const httplib::Request& req, httplib::Response& res) {
    Reply(res, HandleExecute(req.body, factory));
  });
  svr.Get("/runtimes", [](const httplib::Request&, httplib::Response& res) {
    Reply(res, HandleRuntimes());
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} {}", req.remote_addr, req.method, req.path, res.status);
  });
  {
    std::lock_guard lck(server_mtx);
    active_server = &svr;
  }
  spdlog::warn("Listening on {}:{}", host, port);
  bool ret = svr.listen(host.c_str(), port);
  {
    std::lock_guard lck(server_mtx);
    active_server = nullptr;
  }
  if (!ret) spdlog::error("Failed to listen on {}:{}", host, port);
  return ret;
}

void StopServer() {
  std::lock_guard lck(server_mtx);
  if (active_server) active_server->stop();
}
