#pragma once

#include "hashrig/hash_method.hpp"
#include "hashrig/net_platform.hpp"
#include "hashrig/wire.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hashrig {

constexpr uint32_t kServerMaxSubBatch = 256;
constexpr size_t kServerMaxBatchItems = 4096;

struct HashServerOptions {
  std::string listen_host = "0.0.0.0";
  // 0 binds an ephemeral port.
  uint16_t listen_port = kDefaultServerPort;
  std::string device_path;
  // Reported when the backend has no hardware descriptor.
  uint32_t chip_count = 1;
  std::string firmware_version;
  // Recent COMPUTE_HASH results kept for repeat requests; 0 disables.
  size_t hash_cache_capacity = 1024;
};

// Serves the hash-compute RPC protocol over one backend. One thread accepts,
// one thread per connection serves requests; backend calls are serialized.
class HashServer {
public:
  HashServer(HashMethod& backend, HashServerOptions options);
  ~HashServer();

  HashServer(const HashServer&) = delete;
  HashServer& operator=(const HashServer&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }
  uint16_t port() const { return port_; }
  std::string address() const;

  // True when the backend is hardware and currently available.
  bool is_operational() const;
  ServerMetrics metrics() const;
  DeviceInfo device_info() const;

private:
  struct Connection {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
    SocketHandle socket = 0;
  };

  void accept_loop();
  void serve_connection(SocketHandle sock);
  Bytes dispatch(const RpcRequest& request);
  void reap_connections(bool join_all);

  Hash cached_hash(const Bytes& data);
  BatchReply compute_batch(const BatchRequest& request);
  void record_request(size_t bytes, uint64_t latency_us, bool failed);

  HashMethod& backend_;
  HashServerOptions options_;

  std::atomic<bool> running_{false};
  SocketHandle listener_ = 0;
  uint16_t port_ = 0;
  std::thread accept_thread_;
  std::chrono::steady_clock::time_point started_at_{};

  std::mutex connections_mutex_;
  std::vector<Connection> connections_;

  std::mutex backend_mutex_;
  std::unordered_map<std::string, Hash> hash_cache_;

  mutable std::mutex metrics_mutex_;
  ServerMetrics metrics_;
  uint64_t latency_total_us_ = 0;
  uint64_t latency_samples_ = 0;
};

} // namespace hashrig
