#pragma once

#include "hashrig/net_platform.hpp"
#include "hashrig/types.hpp"
#include "hashrig/wire.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hashrig {

constexpr uint32_t kMaxSubBatch = 32;

struct BridgeTimeouts {
  std::chrono::milliseconds liveness{5000};
  std::chrono::milliseconds hash{10000};
  std::chrono::milliseconds batch{30000};
  std::chrono::milliseconds metrics{5000};
  std::chrono::milliseconds info{5000};
  // 0 leaves the TCP handshake to the OS.
  uint32_t connect_timeout_ms = 0;
};

std::pair<std::string, uint16_t> split_host_port(const std::string& address, uint16_t default_port = kDefaultServerPort);

// Not internally synchronized.
class DeviceBridge {
public:
  explicit DeviceBridge(const std::string& address, BridgeTimeouts timeouts = {});
  ~DeviceBridge();

  DeviceBridge(const DeviceBridge&) = delete;
  DeviceBridge& operator=(const DeviceBridge&) = delete;

  const std::string& address() const { return address_; }
  bool is_connected() const;
  void close();

  bool is_using_fallback() const;
  uint32_t chip_count() const { return info_.chip_count; }
  const DeviceInfo& cached_device_info() const { return info_; }

  DeviceInfo device_info();
  HashReply compute_hash(const Bytes& data);
  std::vector<Hash> compute_batch(const std::vector<Bytes>& items, uint32_t max_sub_batch = kMaxSubBatch);
  // Empty when the batch call fails.
  Bytes compute_layer(const Bytes& input, const std::vector<Seed>& seeds);
  MineReply mine_work(const Bytes& header, uint64_t nonce_start, uint64_t max_tries);
  ServerMetrics metrics();

private:
  Bytes call(RpcOp op, const Bytes& body, std::chrono::milliseconds timeout);
  void close_socket();

  std::string address_;
  std::string host_;
  uint16_t port_ = kDefaultServerPort;
  BridgeTimeouts timeouts_;

  SocketHandle socket_ = invalid_socket_handle();
  Bytes rx_buffer_;
  uint64_t next_request_id_ = 1;
  DeviceInfo info_;
};

} // namespace hashrig
