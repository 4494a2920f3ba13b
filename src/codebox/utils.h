#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// lowercase hex of `bytes` random bytes
std::string RandomHex(size_t bytes);

// These functions log on failure
bool ReadFile(const fs::path&, std::string& content);
bool IsRegularFile(const fs::path&);

#endif  // CODEBOX_UTILS_H_
