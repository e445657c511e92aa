#include "hashrig/wire.hpp"

#include "hashrig/errors.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

namespace hashrig {

namespace {

constexpr size_t kMaxCollectionItems = 1U << 20U;

RpcOp op_from_byte(uint8_t value) {
  if (value < static_cast<uint8_t>(RpcOp::GET_DEVICE_INFO) || value > static_cast<uint8_t>(RpcOp::MINE_WORK)) {
    throw TransportError("unknown rpc op " + std::to_string(value));
  }
  return static_cast<RpcOp>(value);
}

size_t checked_count(uint64_t count) {
  if (count > kMaxCollectionItems) {
    throw TransportError("collection length " + std::to_string(count) + " exceeds limit");
  }
  return static_cast<size_t>(count);
}

// Milliseconds left before the deadline, UINT32_MAX when there is none.
uint32_t wait_budget_ms(const Deadline& deadline) {
  if (!deadline.has_value()) {
    return std::numeric_limits<uint32_t>::max();
  }
  const auto now = std::chrono::steady_clock::now();
  if (now >= *deadline) {
    throw TimeoutError("deadline exceeded");
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now).count();
  return static_cast<uint32_t>(std::clamp<int64_t>(left, 1, std::numeric_limits<uint32_t>::max() - 1));
}

} // namespace

const char* rpc_op_name(RpcOp op) {
  switch (op) {
    case RpcOp::GET_DEVICE_INFO: return "GetDeviceInfo";
    case RpcOp::COMPUTE_HASH: return "ComputeHash";
    case RpcOp::COMPUTE_BATCH: return "ComputeBatch";
    case RpcOp::GET_METRICS: return "GetMetrics";
    case RpcOp::MINE_WORK: return "MineWork";
  }
  return "Unknown";
}

void BincodeWriter::write_le_u32(uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>((value >> (i * 8U)) & 0xFFU));
  }
}

void BincodeWriter::write_le_u64(uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>((value >> (i * 8U)) & 0xFFU));
  }
}

void BincodeWriter::write_varuint(uint64_t value) {
  if (value < 251U) {
    write_u8(static_cast<uint8_t>(value));
    return;
  }

  if (value <= 0xFFFFULL) {
    write_u8(251U);
    buffer_.push_back(static_cast<uint8_t>(value & 0xFFU));
    buffer_.push_back(static_cast<uint8_t>((value >> 8U) & 0xFFU));
    return;
  }

  if (value <= 0xFFFFFFFFULL) {
    write_u8(252U);
    write_le_u32(static_cast<uint32_t>(value));
    return;
  }

  write_u8(253U);
  write_le_u64(value);
}

void BincodeWriter::write_f64(double value) {
  uint64_t bits = 0;
  static_assert(sizeof(bits) == sizeof(value));
  std::memcpy(&bits, &value, sizeof(bits));
  write_le_u64(bits);
}

void BincodeWriter::write_fixed_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void BincodeWriter::write_bytes(const Bytes& data) {
  write_varuint(data.size());
  write_fixed_bytes(data.data(), data.size());
}

void BincodeWriter::write_string(const std::string& text) {
  write_varuint(text.size());
  write_fixed_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

const uint8_t* BincodeReader::take(size_t n) {
  if (n > len_ - pos_) {
    throw TransportError("truncated payload: need " + std::to_string(n) + " bytes, have " +
                         std::to_string(len_ - pos_));
  }
  const uint8_t* p = data_ + pos_;
  pos_ += n;
  return p;
}

uint8_t BincodeReader::read_u8() {
  return *take(1);
}

bool BincodeReader::read_bool() {
  const uint8_t v = read_u8();
  if (v > 1U) {
    throw TransportError("invalid bool byte " + std::to_string(v));
  }
  return v == 1U;
}

uint32_t BincodeReader::read_le_u32() {
  return load_u32_le(take(4));
}

uint64_t BincodeReader::read_le_u64() {
  const uint8_t* p = take(8);
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(p[i]) << (i * 8U);
  }
  return value;
}

uint64_t BincodeReader::read_varuint() {
  const uint8_t prefix = read_u8();
  if (prefix < 251U) {
    return prefix;
  }
  if (prefix == 251U) {
    const uint8_t* p = take(2);
    return static_cast<uint64_t>(p[0]) | (static_cast<uint64_t>(p[1]) << 8U);
  }
  if (prefix == 252U) {
    return read_le_u32();
  }
  if (prefix == 253U) {
    return read_le_u64();
  }
  throw TransportError("invalid varuint prefix " + std::to_string(prefix));
}

double BincodeReader::read_f64() {
  const uint64_t bits = read_le_u64();
  double value = 0.0;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

Hash BincodeReader::read_hash() {
  Hash hash;
  const uint8_t* p = take(hash.bytes.size());
  std::copy(p, p + hash.bytes.size(), hash.bytes.begin());
  return hash;
}

Bytes BincodeReader::read_bytes() {
  const uint64_t len = read_varuint();
  if (len > remaining()) {
    throw TransportError("byte string length " + std::to_string(len) + " exceeds payload");
  }
  const uint8_t* p = take(static_cast<size_t>(len));
  return Bytes(p, p + len);
}

std::string BincodeReader::read_string() {
  const uint64_t len = read_varuint();
  if (len > remaining()) {
    throw TransportError("string length " + std::to_string(len) + " exceeds payload");
  }
  const uint8_t* p = take(static_cast<size_t>(len));
  return std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
}

void BincodeReader::expect_end() const {
  if (pos_ != len_) {
    throw TransportError(std::to_string(len_ - pos_) + " trailing bytes in payload");
  }
}

Bytes encode_device_info(const DeviceInfo& info) {
  BincodeWriter w;
  w.write_string(info.device_path);
  w.write_le_u32(info.chip_count);
  w.write_string(info.firmware_version);
  w.write_bool(info.is_operational);
  w.write_le_u64(info.uptime_seconds);
  return w.take();
}

DeviceInfo decode_device_info(const Bytes& body) {
  BincodeReader r(body);
  DeviceInfo info;
  info.device_path = r.read_string();
  info.chip_count = r.read_le_u32();
  info.firmware_version = r.read_string();
  info.is_operational = r.read_bool();
  info.uptime_seconds = r.read_le_u64();
  r.expect_end();
  return info;
}

Bytes encode_hash_request(const Bytes& data) {
  BincodeWriter w;
  w.write_bytes(data);
  return w.take();
}

Bytes decode_hash_request(const Bytes& body) {
  BincodeReader r(body);
  Bytes data = r.read_bytes();
  r.expect_end();
  return data;
}

Bytes encode_hash_reply(const HashReply& reply) {
  BincodeWriter w;
  w.write_hash(reply.hash);
  w.write_le_u64(reply.latency_us);
  return w.take();
}

HashReply decode_hash_reply(const Bytes& body) {
  BincodeReader r(body);
  HashReply reply;
  reply.hash = r.read_hash();
  reply.latency_us = r.read_le_u64();
  r.expect_end();
  return reply;
}

Bytes encode_batch_request(const BatchRequest& request) {
  BincodeWriter w;
  w.write_le_u32(request.max_batch_size);
  w.write_varuint(request.items.size());
  for (const auto& item : request.items) {
    w.write_bytes(item);
  }
  return w.take();
}

BatchRequest decode_batch_request(const Bytes& body) {
  BincodeReader r(body);
  BatchRequest request;
  request.max_batch_size = r.read_le_u32();
  const size_t count = checked_count(r.read_varuint());
  request.items.reserve(std::min(count, r.remaining()));
  for (size_t i = 0; i < count; ++i) {
    request.items.push_back(r.read_bytes());
  }
  r.expect_end();
  return request;
}

Bytes encode_batch_reply(const BatchReply& reply) {
  BincodeWriter w;
  w.write_varuint(reply.hashes.size());
  for (const auto& hash : reply.hashes) {
    w.write_hash(hash);
  }
  w.write_le_u64(reply.latency_us);
  w.write_le_u32(reply.processed);
  return w.take();
}

BatchReply decode_batch_reply(const Bytes& body) {
  BincodeReader r(body);
  BatchReply reply;
  const size_t count = checked_count(r.read_varuint());
  reply.hashes.reserve(std::min(count, r.remaining() / 32U));
  for (size_t i = 0; i < count; ++i) {
    reply.hashes.push_back(r.read_hash());
  }
  reply.latency_us = r.read_le_u64();
  reply.processed = r.read_le_u32();
  r.expect_end();
  return reply;
}

Bytes encode_metrics(const ServerMetrics& metrics) {
  BincodeWriter w;
  w.write_le_u64(metrics.total_requests);
  w.write_le_u64(metrics.total_bytes);
  w.write_f64(metrics.avg_latency_us);
  w.write_le_u64(metrics.peak_latency_us);
  w.write_le_u64(metrics.total_errors);
  w.write_le_u64(metrics.cache_hits);
  w.write_le_u64(metrics.cache_misses);
  w.write_varuint(metrics.device_stats.size());
  for (const auto& [key, value] : metrics.device_stats) {
    w.write_string(key);
    w.write_string(value);
  }
  return w.take();
}

ServerMetrics decode_metrics(const Bytes& body) {
  BincodeReader r(body);
  ServerMetrics metrics;
  metrics.total_requests = r.read_le_u64();
  metrics.total_bytes = r.read_le_u64();
  metrics.avg_latency_us = r.read_f64();
  metrics.peak_latency_us = r.read_le_u64();
  metrics.total_errors = r.read_le_u64();
  metrics.cache_hits = r.read_le_u64();
  metrics.cache_misses = r.read_le_u64();
  const size_t count = checked_count(r.read_varuint());
  for (size_t i = 0; i < count; ++i) {
    std::string key = r.read_string();
    metrics.device_stats.insert_or_assign(std::move(key), r.read_string());
  }
  r.expect_end();
  return metrics;
}

Bytes encode_mine_request(const MineRequest& request) {
  BincodeWriter w;
  w.write_bytes(request.header);
  w.write_le_u64(request.nonce_start);
  w.write_le_u64(request.max_tries);
  return w.take();
}

MineRequest decode_mine_request(const Bytes& body) {
  BincodeReader r(body);
  MineRequest request;
  request.header = r.read_bytes();
  request.nonce_start = r.read_le_u64();
  request.max_tries = r.read_le_u64();
  r.expect_end();
  return request;
}

Bytes encode_mine_reply(const MineReply& reply) {
  BincodeWriter w;
  w.write_bool(reply.found);
  w.write_le_u64(reply.nonce);
  w.write_le_u64(reply.latency_us);
  return w.take();
}

MineReply decode_mine_reply(const Bytes& body) {
  BincodeReader r(body);
  MineReply reply;
  reply.found = r.read_bool();
  reply.nonce = r.read_le_u64();
  reply.latency_us = r.read_le_u64();
  r.expect_end();
  return reply;
}

Bytes encode_request(const RpcRequest& request) {
  BincodeWriter w;
  w.write_u8(static_cast<uint8_t>(request.op));
  w.write_le_u64(request.request_id);
  w.write_fixed_bytes(request.body.data(), request.body.size());
  return w.take();
}

RpcRequest decode_request(const Bytes& payload) {
  BincodeReader r(payload);
  RpcRequest request;
  request.op = op_from_byte(r.read_u8());
  request.request_id = r.read_le_u64();
  request.body.assign(payload.end() - static_cast<Bytes::difference_type>(r.remaining()), payload.end());
  return request;
}

Bytes encode_response(const RpcResponse& response) {
  BincodeWriter w;
  w.write_u8(static_cast<uint8_t>(response.op));
  w.write_le_u64(response.request_id);
  w.write_u8(response.ok ? 0U : 1U);
  if (response.ok) {
    w.write_fixed_bytes(response.body.data(), response.body.size());
  } else {
    w.write_string(response.error);
  }
  return w.take();
}

RpcResponse decode_response(const Bytes& payload) {
  BincodeReader r(payload);
  RpcResponse response;
  response.op = op_from_byte(r.read_u8());
  response.request_id = r.read_le_u64();
  const uint8_t status = r.read_u8();
  if (status == 0U) {
    response.ok = true;
    response.body.assign(payload.end() - static_cast<Bytes::difference_type>(r.remaining()), payload.end());
  } else if (status == 1U) {
    response.ok = false;
    response.error = r.read_string();
  } else {
    throw TransportError("invalid response status " + std::to_string(status));
  }
  return response;
}

Deadline deadline_after(std::chrono::milliseconds timeout) {
  return std::chrono::steady_clock::now() + timeout;
}

void write_frame(SocketHandle sock, const Bytes& payload, const Deadline& deadline) {
  if (sock == invalid_socket_handle()) {
    throw TransportError("socket is not connected");
  }
  if (payload.size() > kMaxFrameSize) {
    throw TransportError("frame of " + std::to_string(payload.size()) + " bytes exceeds limit");
  }

  std::array<uint8_t, 4> len_prefix{};
  store_u32_be(len_prefix.data(), static_cast<uint32_t>(payload.size()));

  auto write_all = [sock, &deadline](const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
      if (!socket_wait_writable(sock, wait_budget_ms(deadline))) {
        continue;
      }
      sent += send_socket_data(sock, data + sent, len - sent);
    }
  };

  write_all(len_prefix.data(), len_prefix.size());
  write_all(payload.data(), payload.size());
}

Bytes read_frame(SocketHandle sock, Bytes& rx_buffer, const Deadline& deadline) {
  if (sock == invalid_socket_handle()) {
    throw TransportError("socket is not connected");
  }
  std::array<uint8_t, 16384> chunk{};

  while (true) {
    if (rx_buffer.size() >= 4) {
      const uint32_t len = load_u32_be(rx_buffer.data());
      if (len > kMaxFrameSize) {
        throw TransportError("incoming frame of " + std::to_string(len) + " bytes exceeds limit");
      }
      if (rx_buffer.size() >= 4U + len) {
        Bytes payload(rx_buffer.begin() + 4, rx_buffer.begin() + 4 + len);
        rx_buffer.erase(rx_buffer.begin(), rx_buffer.begin() + 4 + len);
        return payload;
      }
    }

    if (!socket_wait_readable(sock, wait_budget_ms(deadline))) {
      continue;
    }

    const size_t n = recv_socket_data(sock, chunk.data(), chunk.size());
    if (n == 0) {
      throw TransportError("connection closed by peer");
    }
    rx_buffer.insert(rx_buffer.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
  }
}

} // namespace hashrig
