#include "hashrig/header_codec.hpp"

#include "hashrig/errors.hpp"

#include <algorithm>

namespace hashrig {

namespace {

void write_prefix(uint8_t* out, const JobSlots& slots, uint32_t timestamp) {
  store_u32_le(out + kJobVersionOffset, kJobVersion);
  for (size_t i = 0; i < 8; ++i) {
    store_u32_be(out + kJobSlotsOffset + i * 4, slots[i]);
  }
  for (size_t i = 8; i < kJobSlots; ++i) {
    store_u32_be(out + kJobUpperSlotsOffset + (i - 8) * 4, slots[i]);
  }
  std::fill(out + kJobPaddingOffset, out + kJobPaddingOffset + kJobPaddingSize, uint8_t{0});
  store_u32_le(out + kJobTimestampOffset, timestamp);
  store_u32_le(out + kJobBitsOffset, kJobDifficultyBits);
}

} // namespace

JobCodec::JobCodec(bool enable_cache, size_t cache_capacity)
  : cache_enabled_(enable_cache && cache_capacity > 0), cache_capacity_(cache_capacity) {}

std::string JobCodec::cache_key(const JobSlots& slots, uint32_t candidate) {
  std::array<uint8_t, kJobSlots * 4> raw{};
  for (size_t i = 0; i < kJobSlots; ++i) {
    store_u32_be(raw.data() + i * 4, slots[i]);
  }
  std::array<uint8_t, 4> cand{};
  store_u32_be(cand.data(), candidate);
  return to_hex(raw.data(), raw.size()) + ":" + to_hex(cand.data(), cand.size());
}

JobBytes JobCodec::encode(const JobSlots& slots, uint32_t candidate) {
  std::string key;
  if (cache_enabled_) {
    key = cache_key(slots, candidate);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    const auto it = cache_.find(key);
    if (it != cache_.end()) {
      ++hits_;
      return it->second;
    }
    ++misses_;
  }

  JobBytes job{};
  write_prefix(job.data(), slots, static_cast<uint32_t>(unix_timestamp_now()));
  store_u32_le(job.data() + kJobCandidateOffset, candidate);

  if (cache_enabled_) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_.size() >= cache_capacity_) {
      cache_.clear();
    }
    cache_.emplace(std::move(key), job);
  }
  return job;
}

std::vector<JobBytes> JobCodec::encode_batch(const JobSlots& slots, const std::vector<uint32_t>& candidates) const {
  std::array<uint8_t, kJobPrefixSize> prefix{};
  write_prefix(prefix.data(), slots, static_cast<uint32_t>(unix_timestamp_now()));

  std::vector<JobBytes> out(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    std::copy(prefix.begin(), prefix.end(), out[i].begin());
    store_u32_le(out[i].data() + kJobCandidateOffset, candidates[i]);
  }
  return out;
}

JobSlots JobCodec::decode(const JobBytes& job) {
  JobSlots slots{};
  for (size_t i = 0; i < 8; ++i) {
    slots[i] = load_u32_be(job.data() + kJobSlotsOffset + i * 4);
  }
  for (size_t i = 8; i < kJobSlots; ++i) {
    slots[i] = load_u32_be(job.data() + kJobUpperSlotsOffset + (i - 8) * 4);
  }
  return slots;
}

uint32_t JobCodec::extract_candidate(const JobBytes& job) {
  return load_u32_le(job.data() + kJobCandidateOffset);
}

bool JobCodec::validate(const uint8_t* data, size_t len) {
  if (data == nullptr || len != kJobSize) {
    return false;
  }
  return load_u32_le(data + kJobVersionOffset) == kJobVersion &&
         load_u32_le(data + kJobBitsOffset) == kJobDifficultyBits;
}

JobBytes JobCodec::with_candidate(const JobBytes& job, uint32_t candidate) {
  JobBytes out = job;
  store_u32_le(out.data() + kJobCandidateOffset, candidate);
  return out;
}

bool JobCodec::slots_are_meaningful(const JobSlots& slots) {
  const auto non_zero = std::count_if(slots.begin(), slots.end(), [](uint32_t s) { return s != 0; });
  return non_zero >= 8;
}

void JobCodec::clear_cache() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_.clear();
  hits_ = 0;
  misses_ = 0;
}

JobCacheStats JobCodec::cache_stats() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  JobCacheStats stats;
  stats.entries = cache_.size();
  stats.bytes = cache_.size() * kJobSize;
  stats.hits = hits_;
  stats.misses = misses_;
  return stats;
}

JobBytes job_from_bytes(const Bytes& data) {
  if (data.size() != kJobSize) {
    throw HashError(HashErrorKind::INVALID_INPUT,
                    "job must be " + std::to_string(kJobSize) + " bytes, got " + std::to_string(data.size()));
  }
  JobBytes job{};
  std::copy(data.begin(), data.end(), job.begin());
  return job;
}

} // namespace hashrig
