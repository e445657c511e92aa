#include "hashrig/hash_methods.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"

#include <exception>

namespace hashrig {

namespace {

constexpr uint32_t kDeviceMaxBatch = 256;

} // namespace

DirectDeviceMethod::DirectDeviceMethod(std::string address, std::string device_path, BridgeTimeouts timeouts)
  : address_(std::move(address)),
    device_path_(std::move(device_path)),
    timeouts_(timeouts) {}

DirectDeviceMethod::DirectDeviceMethod(std::unique_ptr<DeviceBridge> bridge, std::string device_path)
  : device_path_(std::move(device_path)),
    bridge_(std::move(bridge)) {
  if (bridge_) {
    address_ = bridge_->address();
  }
  (void)detect();
}

bool DirectDeviceMethod::detect() {
  available_ = false;

  if (!bridge_ || !bridge_->is_connected()) {
    bridge_.reset();
    if (address_.empty()) {
      reason_ = "no device address configured";
      return false;
    }
    try {
      bridge_ = std::make_unique<DeviceBridge>(address_, timeouts_);
    } catch (const std::exception& ex) {
      reason_ = ex.what();
      log_debug("direct-device probe of " + address_ + " failed: " + reason_);
      return false;
    }
  }

  if (bridge_->is_using_fallback()) {
    reason_ = "server at " + bridge_->address() + " is hashing in software";
    return false;
  }

  available_ = true;
  reason_.clear();
  return true;
}

bool DirectDeviceMethod::is_available() const {
  return available_ && bridge_ && bridge_->is_connected();
}

Capabilities DirectDeviceMethod::capabilities() const {
  Capabilities caps;
  caps.name = kDirectDeviceMethod;
  caps.is_hardware = true;
  caps.hash_rate = 500.0e9;
  caps.production_ready = true;
  caps.training_optimized = false;
  caps.max_batch_size = kDeviceMaxBatch;
  caps.avg_latency_us = 100;
  caps.reason = reason_;

  HardwareInfo hw;
  hw.device_path = device_path_;
  hw.chip_count = 32;
  hw.version = "BM1382";
  hw.connection_type = "network";
  if (bridge_) {
    const DeviceInfo& info = bridge_->cached_device_info();
    if (!info.device_path.empty() && hw.device_path.empty()) {
      hw.device_path = info.device_path;
    }
    hw.chip_count = info.chip_count;
    hw.version = info.firmware_version;
    hw.metadata["address"] = bridge_->address();
    hw.metadata["remote_device_path"] = info.device_path;
  } else if (!address_.empty()) {
    hw.metadata["address"] = address_;
  }
  caps.hardware = hw;
  return caps;
}

void DirectDeviceMethod::initialize() {
  if (!is_available() && !detect()) {
    throw HashError(HashErrorKind::HARDWARE_UNAVAILABLE, "direct-device: " + reason_);
  }
}

void DirectDeviceMethod::shutdown() {
  if (bridge_) {
    bridge_->close();
  }
  available_ = false;
}

DeviceBridge& DirectDeviceMethod::require_bridge() {
  if (!bridge_ || !bridge_->is_connected()) {
    throw HashError(HashErrorKind::NOT_INITIALIZED, "direct-device has no connected bridge");
  }
  return *bridge_;
}

Hash DirectDeviceMethod::compute_hash(const Bytes& data) {
  try {
    return require_bridge().compute_hash(data).hash;
  } catch (const TimeoutError& ex) {
    throw HashError(HashErrorKind::TIMEOUT, ex.what());
  } catch (const TransportError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  } catch (const RpcError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  }
}

std::vector<Hash> DirectDeviceMethod::compute_batch(const std::vector<Bytes>& items) {
  if (items.empty()) {
    return {};
  }
  try {
    return require_bridge().compute_batch(items, kMaxSubBatch);
  } catch (const TimeoutError& ex) {
    throw HashError(HashErrorKind::TIMEOUT, ex.what());
  } catch (const TransportError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  } catch (const RpcError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  }
}

std::optional<uint64_t> DirectDeviceMethod::mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) {
  (void)require_valid_header(header);
  try {
    const MineReply reply = require_bridge().mine_work(header, start_nonce, max_tries);
    if (!reply.found) {
      return std::nullopt;
    }
    return reply.nonce;
  } catch (const TimeoutError& ex) {
    throw HashError(HashErrorKind::TIMEOUT, ex.what());
  } catch (const TransportError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  } catch (const RpcError& ex) {
    throw HashError(HashErrorKind::OPERATION_FAILED, ex.what());
  }
}

} // namespace hashrig
