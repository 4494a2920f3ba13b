#include "utils.h"

#include <atomic>
#include <random>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG2(Runtime, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RuntimeName, Runtime, ENUM_RUNTIME_)
#undef X

#define X(...) X_RETURN_ARG3(Runtime, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RuntimeImage, Runtime, ENUM_RUNTIME_)
#undef X

static const char* kLanguageFamilyNameTable[] = {
#define X(name, ext, interp) interp,
  ENUM_LANGUAGE_FAMILY_
#undef X
};

const char* LanguageFamilyName(LanguageFamily family) {
  return kLanguageFamilyNameTable[(int)family];
}

static const char* kOutcomeAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_OUTCOME_
#undef X
};

const char* OutcomeToAbr(Outcome outcome) {
  return kOutcomeAbrTable[(int)outcome];
}

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG1(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeName, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG1(ErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorCodeName, ErrorCode, ENUM_ERROR_CODE_)
#undef X

#define X(...) X_RETURN_ARG3(ErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorCodeDesc, ErrorCode, ENUM_ERROR_CODE_)
#undef X

static const ErrorClass kErrorClassTable[] = {
#define X(name, cls, desc) ErrorClass::cls,
  ENUM_ERROR_CODE_
#undef X
};

ErrorClass ErrorCodeClass(ErrorCode code) {
  return kErrorClassTable[(int)code];
}

#define X(...) X_RETURN_ARG1(ErrorClass, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorClassName, ErrorClass, ENUM_ERROR_CLASS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

SandboxError::SandboxError(ErrorCode code, const std::string& detail) :
    std::runtime_error(detail.empty() ? std::string(ErrorCodeDesc(code))
                                      : std::string(ErrorCodeDesc(code)) + ": " + detail),
    code_(code) {}

ErrorClass SandboxError::GetClass() const {
  return ErrorCodeClass(code_);
}

std::string RandomHex(size_t bytes) {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::string ret;
  ret.reserve(bytes * 2);
  for (size_t i = 0; i < bytes; i++) {
    ret += fmt::format("{:02x}", (unsigned)(gen() & 0xff));
  }
  return ret;
}

bool ReadFile(const fs::path& path, std::string& content) {
  spdlog::debug("Read file {}", path.c_str());
  std::ifstream fin(path, std::ios::binary);
  if (!fin) goto err;
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  if (fin.bad()) goto err;
  return true;
err:
  spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(errno));
  return false;
}

bool IsRegularFile(const fs::path& path) {
  std::error_code ec;
  bool ret = fs::is_regular_file(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    spdlog::warn("Failed checking {}: {}", path.c_str(), ec.message());
  }
  return ret;
}
