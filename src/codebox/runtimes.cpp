#include <codebox/runtimes.h>

#include <cctype>
#include <algorithm>
#include <unordered_map>

#include <codebox/errors.h>
#include "utils.h"

namespace {

const std::unordered_map<std::string, LanguageFamily> kLanguageAliases = {
  {"python", LanguageFamily::PYTHON},
  {"python3", LanguageFamily::PYTHON},
  {"py", LanguageFamily::PYTHON},
  {"py3", LanguageFamily::PYTHON},
  {"node", LanguageFamily::NODE},
  {"javascript", LanguageFamily::NODE},
  {"js", LanguageFamily::NODE},
};

const std::unordered_map<std::string, LanguageFamily> kExtensions = {
  {".py", LanguageFamily::PYTHON},
  {".js", LanguageFamily::NODE},
  {".mjs", LanguageFamily::NODE},
  {".cjs", LanguageFamily::NODE},
};

inline std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

} // namespace

std::optional<Runtime> GetRuntime(const std::string& id) {
#define X(name, rid, image, family, gpu) if (id == rid) return Runtime::name;
  ENUM_RUNTIME_
#undef X
  return std::nullopt;
}

std::vector<Runtime> AllRuntimes() {
  return {
#define X(name, rid, image, family, gpu) Runtime::name,
    ENUM_RUNTIME_
#undef X
  };
}

RuntimeSpec ResolveRuntime(Runtime runtime) {
  RuntimeSpec ret;
  ret.runtime = runtime;
  switch (runtime) {
#define X(name, rid, img, fam, use_gpu) \
    case Runtime::name: ret.image = img, ret.family = LanguageFamily::fam, ret.gpu = use_gpu; break;
    ENUM_RUNTIME_
#undef X
  }
  ret.command_template = {LanguageFamilyName(ret.family), kFilePlaceholder};
  return ret;
}

RuntimeSpec ResolveRuntime(const std::string& id) {
  auto runtime = GetRuntime(id);
  if (!runtime) throw SandboxError(ErrorCode::UNSUPPORTED_RUNTIME, id);
  return ResolveRuntime(*runtime);
}

std::optional<LanguageFamily> GetLanguageFamily(const std::string& language) {
  if (auto it = kLanguageAliases.find(ToLower(language)); it != kLanguageAliases.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<LanguageFamily> LanguageFamilyFromExtension(const std::string& ext) {
  if (auto it = kExtensions.find(ToLower(ext)); it != kExtensions.end()) {
    return it->second;
  }
  return std::nullopt;
}

const char* SourceExtension(LanguageFamily family) {
  switch (family) {
#define X(name, ext, interp) case LanguageFamily::name: return ext;
    ENUM_LANGUAGE_FAMILY_
#undef X
  }
  __builtin_unreachable();
}

std::vector<std::string> RunCommand(const RuntimeSpec& spec, const std::string& file) {
  std::vector<std::string> ret = spec.command_template;
  for (auto& i : ret) {
    if (i == kFilePlaceholder) i = file;
  }
  return ret;
}
