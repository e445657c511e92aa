#pragma once

#include "hashrig/header_codec.hpp"
#include "hashrig/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hashrig {

constexpr const char* kDirectDeviceMethod = "direct-device";
constexpr const char* kSoftwareMethod = "software";
constexpr const char* kGpuSimMethod = "gpu-sim";
constexpr const char* kUbpfSimMethod = "ubpf-sim";
constexpr const char* kEbpfSimMethod = "ebpf-sim";

struct HardwareInfo {
  std::string device_path;
  uint32_t chip_count = 0;
  std::string version;
  std::string connection_type; // usb | network | pcie | kernel
  std::map<std::string, std::string> metadata;
};

struct Capabilities {
  std::string name;
  bool is_hardware = false;
  double hash_rate = 0.0;
  bool production_ready = false;
  bool training_optimized = false;
  uint32_t max_batch_size = 0;
  uint32_t avg_latency_us = 0;
  std::optional<HardwareInfo> hardware;
  std::string reason; // empty when available
};

// is_available() reports the last detect() and never probes on its own.
class HashMethod {
public:
  virtual ~HashMethod() = default;

  virtual std::string name() const = 0;
  virtual bool detect() = 0;
  virtual bool is_available() const = 0;
  virtual Capabilities capabilities() const = 0;

  virtual void initialize() = 0;
  virtual void shutdown() = 0;

  virtual Hash compute_hash(const Bytes& data) = 0;
  virtual std::vector<Hash> compute_batch(const std::vector<Bytes>& items) = 0;

  virtual std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) = 0;
};

std::string canonical_method_name(const std::string& name);

JobBytes require_valid_header(const Bytes& header);
uint64_t nonce_range_end(uint64_t start_nonce, uint64_t max_tries);

std::optional<uint64_t> search_nonce_range(const JobBytes& header, uint64_t begin, uint64_t end);

} // namespace hashrig
