#ifndef CODEBOX_STREAM_DEMUX_H_
#define CODEBOX_STREAM_DEMUX_H_

#include <string>
#include <cstdint>

// Splits the engine's multiplexed exec stream into stdout and stderr.
// Each frame: 1 byte stream id (1 = stdout, 2 = stderr), 3 zero bytes, 4 bytes big-endian length, payload.
// Frames may arrive split across arbitrary chunk boundaries.
class StreamDemuxer {
  std::string pending_;
  size_t limit_;
  std::string* out_;
  std::string* err_;
  bool truncated_;
  bool malformed_;
 public:
  // limit: max bytes kept per stream; 0 = unlimited
  StreamDemuxer(std::string& out, std::string& err, size_t limit) :
      limit_(limit), out_(&out), err_(&err), truncated_(false), malformed_(false) {}

  void Feed(const char* data, size_t len);
  // bytes of an incomplete trailing frame
  size_t Pending() const { return pending_.size(); }
  bool Truncated() const { return truncated_; }
  bool Malformed() const { return malformed_; }
};

#endif  // CODEBOX_STREAM_DEMUX_H_
