#include "hashrig/hash_methods.hpp"

#include "hashrig/errors.hpp"

namespace hashrig {

KernelFilterMethod::KernelFilterMethod(KernelFilterKind kind)
  : kind_(kind) {}

std::string KernelFilterMethod::name() const {
  return kind_ == KernelFilterKind::EBPF ? kEbpfSimMethod : kUbpfSimMethod;
}

Capabilities KernelFilterMethod::capabilities() const {
  Capabilities caps;
  caps.name = name();
  caps.production_ready = false;
  caps.training_optimized = false;

  if (kind_ == KernelFilterKind::EBPF) {
    caps.is_hardware = true;
    caps.hash_rate = 0.0;
    caps.max_batch_size = 0;
    caps.avg_latency_us = 0;
    caps.reason = "not yet implemented - requires ASIC flash";

    HardwareInfo hw;
    hw.device_path = "/dev/bitmain-asic";
    hw.chip_count = 32;
    hw.version = "openwrt-ebpf";
    hw.connection_type = "SPI";
    hw.metadata["status"] = "future_implementation";
    hw.metadata["requires_flash"] = "true";
    caps.hardware = hw;
  } else {
    caps.is_hardware = false;
    caps.hash_rate = 100.0e6;
    caps.max_batch_size = 50;
    caps.avg_latency_us = 100;
    caps.reason = "userspace packet-filter runtime not bundled";
  }
  return caps;
}

void KernelFilterMethod::unavailable(const char* operation) const {
  throw HashError(HashErrorKind::HARDWARE_UNAVAILABLE,
                  name() + " " + operation + ": " + capabilities().reason);
}

void KernelFilterMethod::initialize() {
  unavailable("initialize");
}

void KernelFilterMethod::shutdown() {
  channel_.clear();
}

Hash KernelFilterMethod::compute_hash(const Bytes&) {
  unavailable("compute_hash");
}

std::vector<Hash> KernelFilterMethod::compute_batch(const std::vector<Bytes>& items) {
  if (items.empty()) {
    return {};
  }
  unavailable("compute_batch");
}

std::optional<uint64_t> KernelFilterMethod::mine_header(const Bytes& header, uint64_t, uint64_t) {
  (void)require_valid_header(header);
  unavailable("mine_header");
}

} // namespace hashrig
