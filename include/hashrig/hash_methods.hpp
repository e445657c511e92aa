#pragma once

#include "hashrig/device_bridge.hpp"
#include "hashrig/hash_method.hpp"
#include "hashrig/kernel_filter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hashrig {

// Sequential host SHA-256. Always available; must be initialized before use.
class SoftwareMethod : public HashMethod {
public:
  std::string name() const override { return kSoftwareMethod; }
  bool detect() override { return true; }
  bool is_available() const override { return true; }
  Capabilities capabilities() const override;

  void initialize() override;
  void shutdown() override;

  Hash compute_hash(const Bytes& data) override;
  std::vector<Hash> compute_batch(const std::vector<Bytes>& items) override;
  std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) override;

private:
  void require_initialized() const;

  std::atomic<bool> initialized_{false};
};

// Training-oriented simulator of a GPU hasher. Present when the host reports
// a GPU or co-processor at the configured index; computes real SHA-256 across
// host threads standing in for GPU lanes.
class GpuSimulatorMethod : public HashMethod {
public:
  explicit GpuSimulatorMethod(int device_index = 0, uint32_t lanes = 0);

  std::string name() const override { return kGpuSimMethod; }
  bool detect() override;
  bool is_available() const override;
  Capabilities capabilities() const override;

  void initialize() override;
  void shutdown() override;

  Hash compute_hash(const Bytes& data) override;
  std::vector<Hash> compute_batch(const std::vector<Bytes>& items) override;
  std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) override;

  uint32_t lanes() const { return lanes_; }

private:
  void require_initialized() const;

  int device_index_;
  uint32_t lanes_;
  mutable std::mutex mutex_;
  bool available_ = false;
  std::string device_name_;
  std::string reason_;
  std::atomic<bool> initialized_{false};
};

enum class KernelFilterKind {
  UBPF,
  EBPF,
};

// Placeholder for kernel packet-filter hashers. Never available; exposes the
// job/nonce channel the filter program would share with the host.
class KernelFilterMethod : public HashMethod {
public:
  explicit KernelFilterMethod(KernelFilterKind kind);

  std::string name() const override;
  bool detect() override { return false; }
  bool is_available() const override { return false; }
  Capabilities capabilities() const override;

  void initialize() override;
  void shutdown() override;

  Hash compute_hash(const Bytes& data) override;
  std::vector<Hash> compute_batch(const std::vector<Bytes>& items) override;
  std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) override;

  KernelFilterChannel& channel() { return channel_; }

private:
  [[noreturn]] void unavailable(const char* operation) const;

  KernelFilterKind kind_;
  KernelFilterChannel channel_;
};

// Hash-compute hardware reached through a DeviceBridge. The bridge is either
// dialed from the configured address on detect() or adopted from discovery.
class DirectDeviceMethod : public HashMethod {
public:
  DirectDeviceMethod(std::string address, std::string device_path, BridgeTimeouts timeouts = {});
  explicit DirectDeviceMethod(std::unique_ptr<DeviceBridge> bridge, std::string device_path = {});

  std::string name() const override { return kDirectDeviceMethod; }
  bool detect() override;
  bool is_available() const override;
  Capabilities capabilities() const override;

  void initialize() override;
  void shutdown() override;

  Hash compute_hash(const Bytes& data) override;
  std::vector<Hash> compute_batch(const std::vector<Bytes>& items) override;
  std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) override;

  DeviceBridge* bridge() { return bridge_.get(); }

private:
  DeviceBridge& require_bridge();

  std::string address_;
  std::string device_path_;
  BridgeTimeouts timeouts_;
  std::unique_ptr<DeviceBridge> bridge_;
  bool available_ = false;
  std::string reason_;
};

} // namespace hashrig
