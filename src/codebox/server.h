#ifndef CODEBOX_SERVER_H_
#define CODEBOX_SERVER_H_

#include <string>
#include <memory>
#include <functional>

#include <nlohmann/json.hpp>
#include <codebox/errors.h>
#include <codebox/engine.h>

extern std::string kListenHost;
extern int kListenPort;

// engine handed to each request's interpreter
using EngineFactory = std::function<std::shared_ptr<ContainerEngine>()>;

struct HttpReply {
  int status;
  nlohmann::json body;
};

int HttpStatus(ErrorClass);

// POST /execute; each call builds its own interpreter and disposes it before returning
HttpReply HandleExecute(const std::string& request_body, const EngineFactory& factory);
// GET /runtimes
HttpReply HandleRuntimes();

// blocks; returns false if the address cannot be bound
bool ServeForever(const std::string& host, int port, EngineFactory factory);
// makes ServeForever return after in-flight requests finish; safe from any thread
void StopServer();

#endif  // CODEBOX_SERVER_H_
