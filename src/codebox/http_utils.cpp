#include "http_utils.h"

#include <cctype>
#include <fmt/format.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // archives and JSON bodies can be large
  if (str.size() > 256) return fmt::format("({} bytes)", str.size());
  return str;
}
std::string FormatOneParam(const httplib::Headers& headers) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

std::string EncodeQuery(const std::string& str) {
  std::string ret;
  for (unsigned char c : str) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/' || c == ':') {
      ret += c;
    } else {
      ret += fmt::format("%{:02X}", c);
    }
  }
  return ret;
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}
