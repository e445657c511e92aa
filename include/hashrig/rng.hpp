#pragma once

#include <cstdint>

namespace hashrig {

// SplitMix64 stream. Deterministic for a given seed on every platform.
class SplitMix64 {
public:
  explicit SplitMix64(uint64_t seed) : state_(seed) {}

  uint64_t next() {
    uint64_t z = (state_ += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30U)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27U)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31U);
  }

  // Uniform in [0, 1) from the top 53 bits.
  double next_unit() {
    return static_cast<double>(next() >> 11U) * (1.0 / 9007199254740992.0);
  }

private:
  uint64_t state_;
};

} // namespace hashrig
