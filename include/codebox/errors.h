#ifndef INCLUDE_CODEBOX_ERRORS_H_
#define INCLUDE_CODEBOX_ERRORS_H_

#include <string>
#include <stdexcept>

#define ENUM_ERROR_CLASS_ \
  X(CONFIG) /* bad input; fix and retry */ \
  X(INFRASTRUCTURE) /* engine-level failure; caller may retry with backoff */ \
  X(STAGING) /* file injection failed; container still usable */ \
  X(REQUEST)
enum class ErrorClass {
#define X(name) name,
  ENUM_ERROR_CLASS_
#undef X
};

// name, class, description
#define ENUM_ERROR_CODE_ \
  X(UNSUPPORTED_RUNTIME, CONFIG, "Unsupported runtime") \
  X(INVALID_LIMITS, CONFIG, "Invalid resource limits") \
  X(EMPTY_CODE, CONFIG, "Code content cannot be empty") \
  X(ENGINE_UNAVAILABLE, INFRASTRUCTURE, "Container engine unavailable") \
  X(IMAGE_PULL_ERROR, INFRASTRUCTURE, "Failed to pull image") \
  X(CONTAINER_ERROR, INFRASTRUCTURE, "Container failure") \
  X(UPLOAD_ERROR, STAGING, "Failed to upload files") \
  X(DIRECTORY_NOT_FOUND, STAGING, "Directory not found") \
  X(FILE_NOT_FOUND, STAGING, "File not found") \
  X(UNSUPPORTED_LANGUAGE, REQUEST, "Unsupported language") \
  X(EXECUTION_ABORTED, REQUEST, "Execution aborted") \
  X(SESSION_CLOSED, REQUEST, "Session closed")
enum class ErrorCode {
#define X(name, cls, desc) name,
  ENUM_ERROR_CODE_
#undef X
};

class SandboxError : public std::runtime_error {
  ErrorCode code_;
 public:
  SandboxError(ErrorCode code, const std::string& detail);
  ErrorCode GetCode() const { return code_; }
  ErrorClass GetClass() const;
};

#endif  // INCLUDE_CODEBOX_ERRORS_H_
