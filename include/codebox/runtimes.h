#ifndef INCLUDE_CODEBOX_RUNTIMES_H_
#define INCLUDE_CODEBOX_RUNTIMES_H_

#include <string>
#include <vector>
#include <optional>

// name, extension, interpreter
#define ENUM_LANGUAGE_FAMILY_ \
  X(PYTHON, ".py", "python") \
  X(NODE, ".js", "node")
enum class LanguageFamily {
#define X(name, ext, interp) name,
  ENUM_LANGUAGE_FAMILY_
#undef X
};

// The allow-list of runtimes; nothing outside it is ever pulled or executed.
// name, id, image, family, gpu
#define ENUM_RUNTIME_ \
  X(PYTHON_3_11, "python:3.11", "python:3.11-slim", PYTHON, false) \
  X(NODE_20, "node:20", "node:20-slim", NODE, false) \
  X(PYTHON_3_11_GPU, "python:3.11-gpu", "nvidia/cuda:12.4.0-runtime-ubuntu22.04", PYTHON, true)
enum class Runtime {
#define X(name, id, image, family, gpu) name,
  ENUM_RUNTIME_
#undef X
};

// used when a caller does not name a runtime
constexpr char kDefaultRuntime[] = "python:3.11";

// "{file}" in command_template is replaced by the source path inside the container
constexpr char kFilePlaceholder[] = "{file}";

struct RuntimeSpec {
  Runtime runtime;
  std::string image;
  LanguageFamily family;
  std::vector<std::string> command_template;
  bool gpu;
};

// throws SandboxError(UNSUPPORTED_RUNTIME) if id is not in the catalog
RuntimeSpec ResolveRuntime(const std::string& id);
RuntimeSpec ResolveRuntime(Runtime);
std::optional<Runtime> GetRuntime(const std::string& id);
std::vector<Runtime> AllRuntimes();

// accepts aliases such as "py3" or "js"
std::optional<LanguageFamily> GetLanguageFamily(const std::string& language);
// by source extension (".py", ".js", ...)
std::optional<LanguageFamily> LanguageFamilyFromExtension(const std::string& ext);
const char* SourceExtension(LanguageFamily);
std::vector<std::string> RunCommand(const RuntimeSpec&, const std::string& file);

#endif  // INCLUDE_CODEBOX_RUNTIMES_H_
