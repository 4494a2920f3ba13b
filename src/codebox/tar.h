#ifndef CODEBOX_TAR_H_
#define CODEBOX_TAR_H_

#include <string>
#include <cstdint>

// In-memory POSIX ustar writer; regular files only.
class TarWriter {
  std::string buf_;
  bool finished_;
 public:
  static constexpr size_t kBlockSize = 512;
  // largest file size or mtime the 11-digit octal fields hold (8 GiB - 1)
  static constexpr uint64_t kMaxFieldValue = (1ull << 33) - 1;

  TarWriter() : finished_(false) {}

  // name must be relative; names longer than 100 bytes are split into prefix/name.
  // returns false if the name, size or mtime cannot be represented
  bool AddFile(const std::string& name, const std::string& content, int mode = 0644, int64_t mtime = 0);
  // appends the end-of-archive marker; the writer cannot be used afterwards
  std::string Finish();
};

#endif  // CODEBOX_TAR_H_
