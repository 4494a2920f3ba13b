#include "tar.h"

#include <cstring>

#include <spdlog/spdlog.h>

namespace {

// field offsets in a ustar header
constexpr size_t kNameOff = 0, kNameLen = 100;
constexpr size_t kModeOff = 100;
constexpr size_t kUidOff = 108;
constexpr size_t kGidOff = 116;
constexpr size_t kSizeOff = 124;
constexpr size_t kMtimeOff = 136;
constexpr size_t kChksumOff = 148, kChksumLen = 8;
constexpr size_t kTypeOff = 156;
constexpr size_t kMagicOff = 257;
constexpr size_t kVersionOff = 263;
constexpr size_t kPrefixOff = 345, kPrefixLen = 155;

// zero-padded octal with a trailing NUL, filling `len` bytes
void WriteOctal(char* dst, size_t len, uint64_t val) {
  for (size_t i = len - 1; i-- > 0;) {
    dst[i] = '0' + (val & 7);
    val >>= 3;
  }
  dst[len - 1] = '\0';
}

bool SplitName(const std::string& name, std::string& prefix, std::string& base) {
  if (name.size() <= kNameLen) {
    prefix.clear();
    base = name;
    return true;
  }
  // the split point must be a '/' with the tail fitting in name and the head in prefix
  for (size_t pos = name.find('/'); pos != std::string::npos; pos = name.find('/', pos + 1)) {
    if (pos > kPrefixLen) break;
    if (name.size() - pos - 1 <= kNameLen && name.size() - pos - 1 > 0) {
      prefix = name.substr(0, pos);
      base = name.substr(pos + 1);
      return true;
    }
  }
  return false;
}

} // namespace

bool TarWriter::AddFile(const std::string& name, const std::string& content, int mode, int64_t mtime) {
  if (finished_) return false;
  std::string prefix, base;
  if (name.empty() || !SplitName(name, prefix, base)) {
    spdlog::warn("Cannot represent {} in a tar header", name);
    return false;
  }
  if (content.size() > kMaxFieldValue || (mtime > 0 && (uint64_t)mtime > kMaxFieldValue)) {
    spdlog::warn("Size or mtime of {} does not fit in a tar header", name);
    return false;
  }
  size_t cur = buf_.size();
  buf_.resize(cur + kBlockSize, '\0');
  char* header = buf_.data() + cur;
  memcpy(header + kNameOff, base.data(), base.size());
  WriteOctal(header + kModeOff, 8, mode & 07777);
  WriteOctal(header + kUidOff, 8, 0);
  WriteOctal(header + kGidOff, 8, 0);
  WriteOctal(header + kSizeOff, 12, content.size());
  WriteOctal(header + kMtimeOff, 12, mtime < 0 ? 0 : mtime);
  header[kTypeOff] = '0';
  memcpy(header + kMagicOff, "ustar", 6);
  memcpy(header + kVersionOff, "00", 2);
  memcpy(header + kPrefixOff, prefix.data(), prefix.size());
  // checksum is computed with its own field filled by spaces
  memset(header + kChksumOff, ' ', kChksumLen);
  unsigned sum = 0;
  for (size_t i = 0; i < kBlockSize; i++) sum += (unsigned char)header[i];
  WriteOctal(header + kChksumOff, 7, sum);
  header[kChksumOff + 7] = ' ';

  size_t padded = (content.size() + kBlockSize - 1) / kBlockSize * kBlockSize;
  buf_.append(content);
  buf_.append(padded - content.size(), '\0');
  return true;
}

std::string TarWriter::Finish() {
  if (!finished_) {
    buf_.append(kBlockSize * 2, '\0');
    finished_ = true;
  }
  return std::move(buf_);
}
