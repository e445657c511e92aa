#include "hashrig/device_bridge.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"

#include <exception>

namespace hashrig {

std::pair<std::string, uint16_t> split_host_port(const std::string& address, uint16_t default_port) {
  if (address.empty()) {
    throw ConfigError("device address is empty");
  }

  std::string host = address;
  std::string port_text;

  if (address.front() == '[') {
    const auto close = address.find(']');
    if (close == std::string::npos) {
      throw ConfigError("unterminated IPv6 literal in address " + address);
    }
    host = address.substr(1, close - 1);
    if (close + 1 < address.size()) {
      if (address[close + 1] != ':') {
        throw ConfigError("invalid address " + address);
      }
      port_text = address.substr(close + 2);
    }
  } else if (const auto colon = address.rfind(':'); colon != std::string::npos) {
    if (address.find(':') != colon) {
      // Bare IPv6 literal without brackets.
      return {address, default_port};
    }
    host = address.substr(0, colon);
    port_text = address.substr(colon + 1);
  }

  if (host.empty()) {
    throw ConfigError("missing host in address " + address);
  }
  if (port_text.empty()) {
    return {host, default_port};
  }

  uint32_t port = 0;
  for (const char ch : port_text) {
    if (ch < '0' || ch > '9') {
      throw ConfigError("invalid port in address " + address);
    }
    port = port * 10U + static_cast<uint32_t>(ch - '0');
    if (port > 65535U) {
      throw ConfigError("port out of range in address " + address);
    }
  }
  if (port == 0) {
    throw ConfigError("port must be > 0 in address " + address);
  }
  return {host, static_cast<uint16_t>(port)};
}

DeviceBridge::DeviceBridge(const std::string& address, BridgeTimeouts timeouts)
  : timeouts_(timeouts) {
  auto [host, port] = split_host_port(address);
  host_ = std::move(host);
  port_ = port;
  address_ = host_ + ":" + std::to_string(port_);

  initialize_network_stack_once();
  socket_ = connect_tcp_socket(host_, port_, timeouts_.connect_timeout_ms);

  try {
    info_ = decode_device_info(call(RpcOp::GET_DEVICE_INFO, {}, timeouts_.liveness));
  } catch (const std::exception&) {
    close_socket();
    throw;
  }

  log_info("device bridge connected to " + address_ +
           " chips=" + std::to_string(info_.chip_count) +
           " firmware=" + info_.firmware_version +
           (info_.is_operational ? "" : " (server in software fallback)"));
}

DeviceBridge::~DeviceBridge() {
  close();
}

bool DeviceBridge::is_connected() const {
  return socket_ != invalid_socket_handle();
}

void DeviceBridge::close() {
  close_socket();
}

void DeviceBridge::close_socket() {
  if (socket_ == invalid_socket_handle()) {
    return;
  }
  interrupt_socket_handle(socket_);
  close_socket_handle(socket_);
  socket_ = invalid_socket_handle();
  rx_buffer_.clear();
}

bool DeviceBridge::is_using_fallback() const {
  return !info_.is_operational;
}

Bytes DeviceBridge::call(RpcOp op, const Bytes& body, std::chrono::milliseconds timeout) {
  const std::string what = std::string(rpc_op_name(op)) + " rpc to " + address_;
  if (socket_ == invalid_socket_handle()) {
    throw TransportError(what + " failed: bridge is closed");
  }

  const uint64_t request_id = next_request_id_++;
  const Deadline deadline = deadline_after(timeout);

  try {
    write_frame(socket_, encode_request(RpcRequest{op, request_id, body}), deadline);
  } catch (const TimeoutError&) {
    // A partly written frame leaves the stream unusable.
    close_socket();
    throw TimeoutError(what + " timed out after " + std::to_string(timeout.count()) + " ms while sending");
  } catch (const TransportError& ex) {
    close_socket();
    throw TransportError(what + " failed: " + ex.what());
  }

  try {
    while (true) {
      RpcResponse response = decode_response(read_frame(socket_, rx_buffer_, deadline));
      // Late answers to calls that already timed out are dropped here.
      if (response.request_id != request_id) {
        log_debug("discarding stale response id=" + std::to_string(response.request_id) + " from " + address_);
        continue;
      }
      if (response.op != op) {
        throw TransportError("response op mismatch");
      }
      if (!response.ok) {
        throw RpcError(what + " failed: " + response.error);
      }
      return std::move(response.body);
    }
  } catch (const TimeoutError&) {
    throw TimeoutError(what + " timed out after " + std::to_string(timeout.count()) + " ms");
  } catch (const TransportError& ex) {
    throw TransportError(what + " failed: " + ex.what());
  }
}

DeviceInfo DeviceBridge::device_info() {
  info_ = decode_device_info(call(RpcOp::GET_DEVICE_INFO, {}, timeouts_.info));
  return info_;
}

HashReply DeviceBridge::compute_hash(const Bytes& data) {
  return decode_hash_reply(call(RpcOp::COMPUTE_HASH, encode_hash_request(data), timeouts_.hash));
}

std::vector<Hash> DeviceBridge::compute_batch(const std::vector<Bytes>& items, uint32_t max_sub_batch) {
  if (items.empty()) {
    return {};
  }

  BatchRequest request;
  request.max_batch_size = max_sub_batch == 0 ? kMaxSubBatch : max_sub_batch;
  request.items = items;

  BatchReply reply = decode_batch_reply(call(RpcOp::COMPUTE_BATCH, encode_batch_request(request), timeouts_.batch));
  if (reply.hashes.size() != items.size()) {
    throw RpcError("ComputeBatch rpc to " + address_ + " returned " + std::to_string(reply.hashes.size()) +
                   " hashes for " + std::to_string(items.size()) + " items");
  }
  return std::move(reply.hashes);
}

Bytes DeviceBridge::compute_layer(const Bytes& input, const std::vector<Seed>& seeds) {
  std::vector<Bytes> jobs;
  jobs.reserve(seeds.size());
  for (const auto& seed : seeds) {
    Bytes job;
    job.reserve(input.size() + seed.size());
    job.insert(job.end(), input.begin(), input.end());
    job.insert(job.end(), seed.begin(), seed.end());
    jobs.push_back(std::move(job));
  }

  try {
    const auto hashes = compute_batch(jobs, kMaxSubBatch);
    Bytes out;
    out.reserve(hashes.size() * 32U);
    for (const auto& hash : hashes) {
      out.insert(out.end(), hash.bytes.begin(), hash.bytes.end());
    }
    return out;
  } catch (const std::exception& ex) {
    log_error(std::string("compute_layer failed: ") + ex.what());
    return {};
  }
}

MineReply DeviceBridge::mine_work(const Bytes& header, uint64_t nonce_start, uint64_t max_tries) {
  MineRequest request;
  request.header = header;
  request.nonce_start = nonce_start;
  request.max_tries = max_tries;
  return decode_mine_reply(call(RpcOp::MINE_WORK, encode_mine_request(request), timeouts_.batch));
}

ServerMetrics DeviceBridge::metrics() {
  return decode_metrics(call(RpcOp::GET_METRICS, {}, timeouts_.metrics));
}

} // namespace hashrig
