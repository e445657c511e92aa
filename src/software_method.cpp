#include "hashrig/hash_methods.hpp"

#include "hashrig/crypto.hpp"
#include "hashrig/errors.hpp"

namespace hashrig {

Capabilities SoftwareMethod::capabilities() const {
  Capabilities caps;
  caps.name = kSoftwareMethod;
  caps.is_hardware = false;
  caps.hash_rate = 1.0e6;
  caps.production_ready = true;
  caps.training_optimized = false;
  caps.max_batch_size = 100;
  caps.avg_latency_us = 1000;
  return caps;
}

void SoftwareMethod::initialize() {
  initialized_.store(true, std::memory_order_relaxed);
}

void SoftwareMethod::shutdown() {
  initialized_.store(false, std::memory_order_relaxed);
}

void SoftwareMethod::require_initialized() const {
  if (!initialized_.load(std::memory_order_relaxed)) {
    throw HashError(HashErrorKind::NOT_INITIALIZED, "software method not initialized");
  }
}

Hash SoftwareMethod::compute_hash(const Bytes& data) {
  require_initialized();
  return sha256(data);
}

std::vector<Hash> SoftwareMethod::compute_batch(const std::vector<Bytes>& items) {
  if (items.empty()) {
    return {};
  }
  require_initialized();

  std::vector<Hash> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    out.push_back(sha256(item));
  }
  return out;
}

std::optional<uint64_t> SoftwareMethod::mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) {
  const JobBytes job = require_valid_header(header);
  require_initialized();
  return search_nonce_range(job, start_nonce, nonce_range_end(start_nonce, max_tries));
}

} // namespace hashrig
