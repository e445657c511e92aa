#pragma once

#include "hashrig/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hashrig {

constexpr uint32_t kJobVersion = 0x00000002U;
constexpr uint32_t kJobDifficultyBits = 0x1d00ffffU;
constexpr size_t kJobSize = 80;
constexpr size_t kJobSlots = 12;
constexpr size_t kJobPrefixSize = 76;

constexpr size_t kJobVersionOffset = 0;
constexpr size_t kJobSlotsOffset = 4;
constexpr size_t kJobUpperSlotsOffset = 36;
constexpr size_t kJobPaddingOffset = 52;
constexpr size_t kJobPaddingSize = 16;
constexpr size_t kJobTimestampOffset = 68;
constexpr size_t kJobBitsOffset = 72;
constexpr size_t kJobCandidateOffset = 76;

constexpr size_t kDefaultJobCacheCapacity = 4096;

using JobBytes = std::array<uint8_t, kJobSize>;
using JobSlots = std::array<uint32_t, kJobSlots>;

struct JobCacheStats {
  size_t entries = 0;
  size_t bytes = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
};

// Packs 12 slot words plus a candidate into the 80-byte job layout:
//   0..3    version (LE)
//   4..35   slots 0-7 (BE words)
//   36..51  slots 8-11 (BE words)
//   52..67  zero padding
//   68..71  timestamp (LE, seconds at encode time)
//   72..75  difficulty bits (LE)
//   76..79  candidate (LE)
class JobCodec {
public:
  // The cache is dropped wholesale once it holds cache_capacity entries.
  explicit JobCodec(bool enable_cache = false, size_t cache_capacity = kDefaultJobCacheCapacity);

  JobCodec(const JobCodec&) = delete;
  JobCodec& operator=(const JobCodec&) = delete;

  JobBytes encode(const JobSlots& slots, uint32_t candidate);
  std::vector<JobBytes> encode_batch(const JobSlots& slots, const std::vector<uint32_t>& candidates) const;

  static JobSlots decode(const JobBytes& job);
  static uint32_t extract_candidate(const JobBytes& job);
  static bool validate(const uint8_t* data, size_t len);
  static bool validate(const Bytes& data) { return validate(data.data(), data.size()); }

  static JobBytes with_candidate(const JobBytes& job, uint32_t candidate);
  static bool slots_are_meaningful(const JobSlots& slots);

  bool cache_enabled() const { return cache_enabled_; }
  void clear_cache();
  JobCacheStats cache_stats() const;

private:
  static std::string cache_key(const JobSlots& slots, uint32_t candidate);

  bool cache_enabled_;
  size_t cache_capacity_;
  mutable std::mutex cache_mutex_;
  std::unordered_map<std::string, JobBytes> cache_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
};

JobBytes job_from_bytes(const Bytes& data);

} // namespace hashrig
