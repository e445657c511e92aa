#include "hashrig/hash_methods.hpp"

#include "hashrig/crypto.hpp"
#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"
#include "hashrig/perf.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace hashrig {

namespace {

constexpr uint64_t kNoNonce = ~0ULL;

// Runs fn(lane, begin, end) over [0, count) split into contiguous chunks.
// The first exception raised by any lane is rethrown after all lanes join.
template <typename Fn>
void run_lanes(uint32_t lanes, uint64_t count, Fn&& fn) {
  const uint64_t lane_count = std::max<uint64_t>(1U, std::min<uint64_t>(lanes, count));
  if (lane_count == 1) {
    fn(0U, 0U, count);
    return;
  }

  const uint64_t chunk = (count + lane_count - 1) / lane_count;
  std::vector<std::thread> workers;
  std::vector<std::exception_ptr> errors(lane_count);
  workers.reserve(lane_count);

  for (uint64_t lane = 0; lane < lane_count; ++lane) {
    const uint64_t begin = lane * chunk;
    const uint64_t end = std::min(count, begin + chunk);
    workers.emplace_back([&fn, &errors, lane, begin, end]() {
      try {
        fn(static_cast<uint32_t>(lane), begin, end);
      } catch (...) {
        errors[lane] = std::current_exception();
      }
    });
  }

  for (auto& worker : workers) {
    worker.join();
  }
  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

} // namespace

GpuSimulatorMethod::GpuSimulatorMethod(int device_index, uint32_t lanes)
  : device_index_(device_index),
    lanes_(lanes == 0 ? recommended_hash_lanes() : lanes) {}

bool GpuSimulatorMethod::detect() {
  const auto devices = detect_accelerators();

  std::lock_guard<std::mutex> lock(mutex_);
  if (device_index_ < 0) {
    available_ = false;
    reason_ = "gpu_device index must be >= 0";
    return false;
  }
  if (static_cast<size_t>(device_index_) >= devices.size()) {
    available_ = false;
    device_name_.clear();
    reason_ = devices.empty()
      ? "no GPU or co-processor reported by " + topology_source()
      : "gpu_device " + std::to_string(device_index_) + " not present (" + std::to_string(devices.size()) + " found)";
    return false;
  }

  const auto& device = devices[static_cast<size_t>(device_index_)];
  available_ = true;
  device_name_ = device.model.empty() ? device.name : device.model;
  reason_.clear();
  return true;
}

bool GpuSimulatorMethod::is_available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

Capabilities GpuSimulatorMethod::capabilities() const {
  std::lock_guard<std::mutex> lock(mutex_);

  Capabilities caps;
  caps.name = kGpuSimMethod;
  caps.is_hardware = false;
  caps.hash_rate = 50.0e9;
  caps.production_ready = false;
  caps.training_optimized = true;
  caps.max_batch_size = 1000;
  caps.avg_latency_us = 50;
  caps.reason = reason_;
  if (available_) {
    HardwareInfo hw;
    hw.device_path = device_name_;
    hw.chip_count = lanes_;
    hw.version = "sim";
    hw.connection_type = "pcie";
    hw.metadata["device_index"] = std::to_string(device_index_);
    hw.metadata["topology"] = topology_source();
    caps.hardware = hw;
  }
  return caps;
}

void GpuSimulatorMethod::initialize() {
  if (!is_available()) {
    throw HashError(HashErrorKind::HARDWARE_UNAVAILABLE, "gpu-sim: " + capabilities().reason);
  }
  initialized_.store(true, std::memory_order_relaxed);
  log_info("gpu-sim initialized with " + std::to_string(lanes_) + " lanes");
}

void GpuSimulatorMethod::shutdown() {
  initialized_.store(false, std::memory_order_relaxed);
}

void GpuSimulatorMethod::require_initialized() const {
  if (!initialized_.load(std::memory_order_relaxed)) {
    throw HashError(HashErrorKind::NOT_INITIALIZED, "gpu-sim method not initialized");
  }
}

Hash GpuSimulatorMethod::compute_hash(const Bytes& data) {
  require_initialized();
  return sha256(data);
}

std::vector<Hash> GpuSimulatorMethod::compute_batch(const std::vector<Bytes>& items) {
  if (items.empty()) {
    return {};
  }
  require_initialized();

  std::vector<Hash> out(items.size());
  run_lanes(lanes_, items.size(), [&](uint32_t, uint64_t begin, uint64_t end) {
    for (uint64_t i = begin; i < end; ++i) {
      out[i] = sha256(items[i]);
    }
  });
  return out;
}

std::optional<uint64_t> GpuSimulatorMethod::mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) {
  const JobBytes job = require_valid_header(header);
  require_initialized();

  const uint64_t end = nonce_range_end(start_nonce, max_tries);
  if (end <= start_nonce) {
    return std::nullopt;
  }

  // Lanes search contiguous chunks; the lowest winning nonce is reported so
  // the result matches a sequential search.
  std::atomic<uint64_t> best{kNoNonce};
  run_lanes(lanes_, end - start_nonce, [&](uint32_t, uint64_t begin, uint64_t stop) {
    const auto found = search_nonce_range(job, start_nonce + begin, start_nonce + stop);
    if (!found.has_value()) {
      return;
    }
    uint64_t current = best.load(std::memory_order_relaxed);
    while (*found < current && !best.compare_exchange_weak(current, *found, std::memory_order_relaxed)) {
    }
  });

  const uint64_t nonce = best.load(std::memory_order_relaxed);
  if (nonce == kNoNonce) {
    return std::nullopt;
  }
  return nonce;
}

} // namespace hashrig
