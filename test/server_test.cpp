#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "utils.h"
#include "codebox/server.h"

using nlohmann::json;

class ServerTest : public FakeEngineTest {
 protected:
  HttpReply Post(const json& body) { return Post(body.dump()); }
  HttpReply Post(const std::string& body) {
    return HandleExecute(body, [this]() -> std::shared_ptr<ContainerEngine> { return engine; });
  }
};

TEST_F(ServerTest, Execute) {
  HttpReply reply = Post(json{{"code", "print:2\n"}, {"runtime", "python:3.11"}, {"language", "python"}});
  ASSERT_EQ(reply.status, 200) << reply.body.dump();
  EXPECT_EQ(reply.body["stdout"], "2\n");
  EXPECT_EQ(reply.body["stderr"], "");
  EXPECT_EQ(reply.body["exit_code"], 0);
  EXPECT_EQ(reply.body["outcome"], "NORMAL");
  EXPECT_EQ(reply.body["truncated"], false);
  EXPECT_TRUE(reply.body["runtime_seconds"].is_number());
  // each request gets its own container, gone before the reply
  EXPECT_EQ(engine->creates, 1);
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST_F(ServerTest, DefaultsRuntimeAndLanguage) {
  HttpReply reply = Post(json{{"code", "print:1\n"}});
  ASSERT_EQ(reply.status, 200);
  EXPECT_EQ(engine->last_container.image, "python:3.11-slim");
  EXPECT_EQ(engine->last_container.memory_bytes, ResourceLimits().memory_bytes);
}

TEST_F(ServerTest, Limits) {
  HttpReply reply = Post(json{
    {"code", "exit:137\n"},
    {"runtime", "node:20"},
    {"limits", {{"memory", "128m"}, {"cpus", 0.5}, {"pids", 8}, {"timeout", 3}}},
  });
  ASSERT_EQ(reply.status, 200);
  EXPECT_EQ(reply.body["outcome"], "OUT_OF_MEMORY");
  EXPECT_EQ(reply.body["exit_code"], 137);
  EXPECT_EQ(engine->last_container.memory_bytes, 128L << 20);
  EXPECT_EQ(engine->last_container.nano_cpus, 500000000);
  EXPECT_EQ(engine->last_container.pids_limit, 8);
}

TEST_F(ServerTest, NumericMemory) {
  HttpReply reply = Post(json{{"code", "print:1\n"}, {"limits", {{"memory", 1 << 26}}}});
  ASSERT_EQ(reply.status, 200);
  EXPECT_EQ(engine->last_container.memory_bytes, 1 << 26);
}

TEST_F(ServerTest, ConfigErrors) {
  HttpReply reply = Post(json{{"code", "print:1\n"}, {"runtime", "ruby:3"}});
  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.body["error"], "UNSUPPORTED_RUNTIME");
  EXPECT_EQ(reply.body["class"], "CONFIG");

  reply = Post(json{{"code", "print:1\n"}, {"limits", {{"cpus", "0"}}}});
  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.body["error"], "INVALID_LIMITS");

  reply = Post(json{{"code", "print:1\n"}, {"limits", {{"memory", true}}}});
  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.body["error"], "INVALID_LIMITS");

  reply = Post(json{{"code", "  "}});
  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.body["error"], "EMPTY_CODE");
  EXPECT_EQ(engine->creates, 1);
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST_F(ServerTest, IntegerLimits) {
  const json bad[] = {
    {{"timeout", 1e12}},
    {{"timeout", 3.7}},
    {{"timeout", 4294967297LL}},
    {{"timeout", "5"}},
    {{"pids", 18446744073709551615ULL}},
    {{"pids", -4294967295LL}},
    {{"pids", 2.5}},
  };
  for (const json& limits : bad) {
    HttpReply reply = Post(json{{"code", "print:1\n"}, {"limits", limits}});
    EXPECT_EQ(reply.status, 400) << limits.dump();
    EXPECT_EQ(reply.body["error"], "INVALID_LIMITS") << limits.dump();
  }
  EXPECT_EQ(engine->creates, 0);

  HttpReply reply = Post(json{{"code", "print:1\n"}, {"limits", {{"pids", 32}, {"timeout", nullptr}}}});
  ASSERT_EQ(reply.status, 200);
  EXPECT_EQ(engine->last_container.pids_limit, 32);
}

TEST_F(ServerTest, RequestErrors) {
  HttpReply reply = Post(json{{"code", "print:1\n"}, {"language", "javascript"}});
  EXPECT_EQ(reply.status, 400);
  EXPECT_EQ(reply.body["error"], "UNSUPPORTED_LANGUAGE");
  EXPECT_EQ(reply.body["class"], "REQUEST");
}

TEST_F(ServerTest, MalformedBodies) {
  for (std::string body : {"", "{", "[1,2]", "{\"runtime\":\"python:3.11\"}", "{\"code\":5}"}) {
    HttpReply reply = Post(body);
    EXPECT_EQ(reply.status, 400) << body;
    EXPECT_EQ(reply.body["error"], "MALFORMED_REQUEST") << body;
  }
  EXPECT_EQ(engine->creates, 0);
}

TEST_F(ServerTest, InfrastructureErrors) {
  engine->reachable = false;
  HttpReply reply = Post(json{{"code", "print:1\n"}});
  EXPECT_EQ(reply.status, 503);
  EXPECT_EQ(reply.body["error"], "ENGINE_UNAVAILABLE");
}

TEST_F(ServerTest, StagingErrors) {
  engine->put_ok = false;
  HttpReply reply = Post(json{{"code", "print:1\n"}});
  EXPECT_EQ(reply.status, 502);
  EXPECT_EQ(reply.body["error"], "UPLOAD_ERROR");
  EXPECT_EQ(engine->LiveContainers(), 0u);
}

TEST(Server, Runtimes) {
  HttpReply reply = HandleRuntimes();
  ASSERT_EQ(reply.status, 200);
  ASSERT_EQ(reply.body["runtimes"].size(), 3u);
  EXPECT_EQ(reply.body["runtimes"][0]["id"], "python:3.11");
  EXPECT_EQ(reply.body["runtimes"][0]["language"], "python");
  EXPECT_EQ(reply.body["runtimes"][2]["gpu"], true);
  EXPECT_EQ(reply.body["default"], "python:3.11");
}

TEST(Server, StatusByClass) {
  EXPECT_EQ(HttpStatus(ErrorClass::CONFIG), 400);
  EXPECT_EQ(HttpStatus(ErrorClass::REQUEST), 400);
  EXPECT_EQ(HttpStatus(ErrorClass::STAGING), 502);
  EXPECT_EQ(HttpStatus(ErrorClass::INFRASTRUCTURE), 503);
}
