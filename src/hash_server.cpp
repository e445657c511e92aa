#include "hashrig/hash_server.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"

#include <algorithm>
#include <exception>

#ifndef HASHRIG_VERSION
#define HASHRIG_VERSION "dev"
#endif

namespace hashrig {

namespace {

uint64_t micros_since(std::chrono::steady_clock::time_point start) {
  return static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count());
}

} // namespace

HashServer::HashServer(HashMethod& backend, HashServerOptions options)
  : backend_(backend),
    options_(std::move(options)),
    listener_(invalid_socket_handle()) {
  if (options_.firmware_version.empty()) {
    options_.firmware_version = "hashrig-server/" HASHRIG_VERSION;
  }
}

HashServer::~HashServer() {
  stop();
}

void HashServer::start() {
  if (running_.load()) {
    return;
  }

  initialize_network_stack_once();
  listener_ = listen_tcp_socket(options_.listen_host, options_.listen_port);
  port_ = socket_local_port(listener_);
  started_at_ = std::chrono::steady_clock::now();
  running_.store(true);

  accept_thread_ = std::thread([this]() { accept_loop(); });
  log_info("hash server listening on " + address() + " backend=" + backend_.name() +
           (is_operational() ? "" : " (software fallback)"));
}

void HashServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  interrupt_socket_handle(listener_);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  close_socket_handle(listener_);
  listener_ = invalid_socket_handle();

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto& conn : connections_) {
      interrupt_socket_handle(conn.socket);
    }
  }
  reap_connections(true);
  log_info("hash server on port " + std::to_string(port_) + " stopped");
}

std::string HashServer::address() const {
  const std::string host = options_.listen_host.empty() || options_.listen_host == "0.0.0.0"
    ? std::string("127.0.0.1")
    : options_.listen_host;
  return host + ":" + std::to_string(port_);
}

void HashServer::accept_loop() {
  while (running_.load()) {
    const SocketHandle client = accept_tcp_socket(listener_);
    if (client == invalid_socket_handle()) {
      break;
    }
    if (!running_.load()) {
      close_socket_handle(client);
      break;
    }

    reap_connections(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(connections_mutex_);
    Connection conn;
    conn.socket = client;
    conn.done = done;
    conn.thread = std::thread([this, client, done]() {
      serve_connection(client);
      done->store(true);
    });
    connections_.push_back(std::move(conn));
  }
}

void HashServer::reap_connections(bool join_all) {
  std::vector<Connection> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.begin();
    while (it != connections_.end()) {
      if (join_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& conn : finished) {
    if (conn.thread.joinable()) {
      conn.thread.join();
    }
    close_socket_handle(conn.socket);
  }
}

void HashServer::serve_connection(SocketHandle sock) {
  Bytes rx_buffer;
  try {
    while (running_.load()) {
      const Bytes payload = read_frame(sock, rx_buffer, std::nullopt);
      const auto start = std::chrono::steady_clock::now();
      const RpcRequest request = decode_request(payload);

      RpcResponse response;
      response.op = request.op;
      response.request_id = request.request_id;
      bool failed = false;
      try {
        response.body = dispatch(request);
        response.ok = true;
      } catch (const std::exception& ex) {
        failed = true;
        response.ok = false;
        response.error = ex.what();
        log_warn(std::string(rpc_op_name(request.op)) + " failed: " + ex.what());
      }

      write_frame(sock, encode_response(response));
      record_request(payload.size(), micros_since(start), failed);
    }
  } catch (const TransportError& ex) {
    log_debug(std::string("connection closed: ") + ex.what());
  }
}

bool HashServer::is_operational() const {
  return backend_.capabilities().is_hardware && backend_.is_available();
}

DeviceInfo HashServer::device_info() const {
  const Capabilities caps = backend_.capabilities();

  DeviceInfo info;
  info.device_path = options_.device_path;
  info.chip_count = options_.chip_count;
  if (caps.hardware.has_value()) {
    if (info.device_path.empty()) {
      info.device_path = caps.hardware->device_path;
    }
    if (caps.hardware->chip_count > 0) {
      info.chip_count = caps.hardware->chip_count;
    }
  }
  if (info.device_path.empty()) {
    info.device_path = backend_.name();
  }
  info.firmware_version = options_.firmware_version;
  info.is_operational = caps.is_hardware && backend_.is_available();
  info.uptime_seconds = running_.load()
    ? static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count())
    : 0U;
  return info;
}

Hash HashServer::cached_hash(const Bytes& data) {
  std::lock_guard<std::mutex> lock(backend_mutex_);
  if (options_.hash_cache_capacity == 0) {
    return backend_.compute_hash(data);
  }

  const std::string key = to_hex(data);
  if (const auto it = hash_cache_.find(key); it != hash_cache_.end()) {
    std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
    ++metrics_.cache_hits;
    return it->second;
  }

  const Hash hash = backend_.compute_hash(data);
  if (hash_cache_.size() >= options_.hash_cache_capacity) {
    hash_cache_.clear();
  }
  hash_cache_.emplace(key, hash);
  std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
  ++metrics_.cache_misses;
  return hash;
}

BatchReply HashServer::compute_batch(const BatchRequest& request) {
  if (request.items.empty()) {
    throw HashError(HashErrorKind::INVALID_INPUT, "empty batch");
  }
  if (request.items.size() > kServerMaxBatchItems) {
    throw HashError(HashErrorKind::RESOURCE_BUSY,
                    "batch of " + std::to_string(request.items.size()) + " items exceeds limit of " +
                      std::to_string(kServerMaxBatchItems));
  }

  const size_t sub_batch = request.max_batch_size == 0
    ? kServerMaxSubBatch
    : std::min<size_t>(request.max_batch_size, kServerMaxSubBatch);

  BatchReply reply;
  reply.hashes.reserve(request.items.size());
  const auto start = std::chrono::steady_clock::now();

  std::lock_guard<std::mutex> lock(backend_mutex_);
  for (size_t offset = 0; offset < request.items.size(); offset += sub_batch) {
    const size_t end = std::min(request.items.size(), offset + sub_batch);
    const std::vector<Bytes> chunk(request.items.begin() + static_cast<std::ptrdiff_t>(offset),
                                   request.items.begin() + static_cast<std::ptrdiff_t>(end));
    auto hashes = backend_.compute_batch(chunk);
    if (hashes.size() != chunk.size()) {
      throw HashError(HashErrorKind::OPERATION_FAILED, "backend returned a short batch");
    }
    reply.hashes.insert(reply.hashes.end(), hashes.begin(), hashes.end());
  }

  reply.latency_us = micros_since(start);
  reply.processed = static_cast<uint32_t>(reply.hashes.size());
  return reply;
}

Bytes HashServer::dispatch(const RpcRequest& request) {
  switch (request.op) {
    case RpcOp::GET_DEVICE_INFO:
      return encode_device_info(device_info());

    case RpcOp::COMPUTE_HASH: {
      const Bytes data = decode_hash_request(request.body);
      if (data.empty()) {
        throw HashError(HashErrorKind::INVALID_INPUT, "empty hash payload");
      }
      const auto start = std::chrono::steady_clock::now();
      HashReply reply;
      reply.hash = cached_hash(data);
      reply.latency_us = micros_since(start);
      return encode_hash_reply(reply);
    }

    case RpcOp::COMPUTE_BATCH:
      return encode_batch_reply(compute_batch(decode_batch_request(request.body)));

    case RpcOp::GET_METRICS:
      return encode_metrics(metrics());

    case RpcOp::MINE_WORK: {
      const MineRequest mine = decode_mine_request(request.body);
      const auto start = std::chrono::steady_clock::now();
      std::optional<uint64_t> nonce;
      {
        std::lock_guard<std::mutex> lock(backend_mutex_);
        nonce = backend_.mine_header(mine.header, mine.nonce_start, mine.max_tries);
      }
      MineReply reply;
      reply.found = nonce.has_value();
      reply.nonce = nonce.value_or(0);
      reply.latency_us = micros_since(start);
      return encode_mine_reply(reply);
    }
  }
  throw HashError(HashErrorKind::INVALID_INPUT, "unknown op " + std::to_string(static_cast<unsigned>(request.op)));
}

void HashServer::record_request(size_t bytes, uint64_t latency_us, bool failed) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  ++metrics_.total_requests;
  metrics_.total_bytes += bytes;
  if (failed) {
    ++metrics_.total_errors;
  }
  latency_total_us_ += latency_us;
  ++latency_samples_;
  metrics_.avg_latency_us = static_cast<double>(latency_total_us_) / static_cast<double>(latency_samples_);
  metrics_.peak_latency_us = std::max(metrics_.peak_latency_us, latency_us);
}

ServerMetrics HashServer::metrics() const {
  const DeviceInfo info = device_info();
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  ServerMetrics out = metrics_;
  out.device_stats["backend"] = backend_.name();
  out.device_stats["device_path"] = info.device_path;
  out.device_stats["chip_count"] = std::to_string(info.chip_count);
  out.device_stats["operational"] = info.is_operational ? "true" : "false";
  out.device_stats["uptime_seconds"] = std::to_string(info.uptime_seconds);
  return out;
}

} // namespace hashrig
