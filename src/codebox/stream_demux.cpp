#include "stream_demux.h"

#include <spdlog/spdlog.h>

namespace {

constexpr size_t kFrameHeader = 8;

} // namespace

void StreamDemuxer::Feed(const char* data, size_t len) {
  if (malformed_) return;
  pending_.append(data, len);
  size_t cur = 0;
  while (pending_.size() - cur >= kFrameHeader) {
    const unsigned char* header = (const unsigned char*)pending_.data() + cur;
    uint32_t size = (uint32_t)header[4] << 24 | (uint32_t)header[5] << 16 |
                    (uint32_t)header[6] << 8 | (uint32_t)header[7];
    if (pending_.size() - cur - kFrameHeader < size) break;
    std::string* target = nullptr;
    switch (header[0]) {
      case 0: [[fallthrough]]; // stdin; only echoed with a tty
      case 1: target = out_; break;
      case 2: target = err_; break;
      default: {
        spdlog::warn("Malformed exec stream: stream id {}", (int)header[0]);
        malformed_ = true;
        pending_.clear();
        return;
      }
    }
    size_t keep = size;
    if (limit_ && target->size() + keep > limit_) {
      keep = target->size() < limit_ ? limit_ - target->size() : 0;
      truncated_ = true;
    }
    target->append(pending_, cur + kFrameHeader, keep);
    cur += kFrameHeader + size;
  }
  pending_.erase(0, cur);
}
