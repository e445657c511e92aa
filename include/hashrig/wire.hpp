#pragma once

#include "hashrig/net_platform.hpp"
#include "hashrig/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hashrig {

constexpr uint16_t kDefaultServerPort = 8888;
constexpr uint32_t kMaxFrameSize = 64U * 1024U * 1024U;

enum class RpcOp : uint8_t {
  GET_DEVICE_INFO = 1,
  COMPUTE_HASH = 2,
  COMPUTE_BATCH = 3,
  GET_METRICS = 4,
  MINE_WORK = 5,
};

const char* rpc_op_name(RpcOp op);

class BincodeWriter {
public:
  void write_u8(uint8_t value) { buffer_.push_back(value); }
  void write_bool(bool value) { write_u8(value ? 1U : 0U); }
  void write_le_u32(uint32_t value);
  void write_le_u64(uint64_t value);
  void write_varuint(uint64_t value);
  void write_f64(double value);
  void write_fixed_bytes(const uint8_t* data, size_t len);
  void write_hash(const Hash& hash) { write_fixed_bytes(hash.bytes.data(), hash.bytes.size()); }
  void write_bytes(const Bytes& data);
  void write_string(const std::string& text);

  const Bytes& buffer() const { return buffer_; }
  Bytes take() { return std::move(buffer_); }

private:
  Bytes buffer_;
};

// Bounds-checked mirror of BincodeWriter. Any overrun throws TransportError.
class BincodeReader {
public:
  BincodeReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
  explicit BincodeReader(const Bytes& data) : BincodeReader(data.data(), data.size()) {}

  uint8_t read_u8();
  bool read_bool();
  uint32_t read_le_u32();
  uint64_t read_le_u64();
  uint64_t read_varuint();
  double read_f64();
  Hash read_hash();
  Bytes read_bytes();
  std::string read_string();

  size_t remaining() const { return len_ - pos_; }
  void expect_end() const;

private:
  const uint8_t* take(size_t n);

  const uint8_t* data_;
  size_t len_;
  size_t pos_ = 0;
};

struct DeviceInfo {
  std::string device_path;
  uint32_t chip_count = 0;
  std::string firmware_version;
  bool is_operational = false;
  uint64_t uptime_seconds = 0;
};

struct HashReply {
  Hash hash;
  uint64_t latency_us = 0;
};

struct BatchRequest {
  uint32_t max_batch_size = 0;
  std::vector<Bytes> items;
};

struct BatchReply {
  std::vector<Hash> hashes;
  uint64_t latency_us = 0;
  uint32_t processed = 0;
};

struct ServerMetrics {
  uint64_t total_requests = 0;
  uint64_t total_bytes = 0;
  double avg_latency_us = 0.0;
  uint64_t peak_latency_us = 0;
  uint64_t total_errors = 0;
  uint64_t cache_hits = 0;
  uint64_t cache_misses = 0;
  std::map<std::string, std::string> device_stats;
};

struct MineRequest {
  Bytes header;
  uint64_t nonce_start = 0;
  uint64_t max_tries = 0;
};

struct MineReply {
  bool found = false;
  uint64_t nonce = 0;
  uint64_t latency_us = 0;
};

Bytes encode_device_info(const DeviceInfo& info);
DeviceInfo decode_device_info(const Bytes& body);
Bytes encode_hash_request(const Bytes& data);
Bytes decode_hash_request(const Bytes& body);
Bytes encode_hash_reply(const HashReply& reply);
HashReply decode_hash_reply(const Bytes& body);
Bytes encode_batch_request(const BatchRequest& request);
BatchRequest decode_batch_request(const Bytes& body);
Bytes encode_batch_reply(const BatchReply& reply);
BatchReply decode_batch_reply(const Bytes& body);
Bytes encode_metrics(const ServerMetrics& metrics);
ServerMetrics decode_metrics(const Bytes& body);
Bytes encode_mine_request(const MineRequest& request);
MineRequest decode_mine_request(const Bytes& body);
Bytes encode_mine_reply(const MineReply& reply);
MineReply decode_mine_reply(const Bytes& body);

// Request payload:  u8 op | u64 request_id | body
// Response payload: u8 op | u64 request_id | u8 status | body or error string
struct RpcRequest {
  RpcOp op = RpcOp::GET_DEVICE_INFO;
  uint64_t request_id = 0;
  Bytes body;
};

struct RpcResponse {
  RpcOp op = RpcOp::GET_DEVICE_INFO;
  uint64_t request_id = 0;
  bool ok = false;
  std::string error;
  Bytes body;
};

Bytes encode_request(const RpcRequest& request);
RpcRequest decode_request(const Bytes& payload);
Bytes encode_response(const RpcResponse& response);
RpcResponse decode_response(const Bytes& payload);

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

Deadline deadline_after(std::chrono::milliseconds timeout);

// Frames are a 4-byte big-endian length followed by the payload. Throws
// TimeoutError when the peer stops draining the socket past the deadline.
void write_frame(SocketHandle sock, const Bytes& payload, const Deadline& deadline = std::nullopt);
// Reads one frame, buffering surplus bytes in rx_buffer. Throws TimeoutError
// when the deadline passes and TransportError when the peer goes away.
Bytes read_frame(SocketHandle sock, Bytes& rx_buffer, const Deadline& deadline);

} // namespace hashrig
