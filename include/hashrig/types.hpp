#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hashrig {

using Bytes = std::vector<uint8_t>;
using Seed = std::array<uint8_t, 32>;

struct Hash {
  std::array<uint8_t, 32> bytes{};

  static Hash zero();
  bool operator==(const Hash& other) const;
  bool operator!=(const Hash& other) const;
  bool operator<(const Hash& other) const;
};

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const Bytes& data);
std::string to_hex(const Hash& hash);
Bytes from_hex(std::string_view text);
Seed seed_from_hex(std::string_view text);

uint64_t unix_timestamp_now();

inline uint32_t load_u32_be(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24U) |
         (static_cast<uint32_t>(p[1]) << 16U) |
         (static_cast<uint32_t>(p[2]) << 8U) |
         static_cast<uint32_t>(p[3]);
}

inline uint32_t load_u32_le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8U) |
         (static_cast<uint32_t>(p[2]) << 16U) |
         (static_cast<uint32_t>(p[3]) << 24U);
}

inline uint64_t load_u64_be(const uint8_t* p) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value = (value << 8U) | static_cast<uint64_t>(p[i]);
  }
  return value;
}

inline void store_u32_be(uint8_t* p, uint32_t value) {
  p[0] = static_cast<uint8_t>((value >> 24U) & 0xFFU);
  p[1] = static_cast<uint8_t>((value >> 16U) & 0xFFU);
  p[2] = static_cast<uint8_t>((value >> 8U) & 0xFFU);
  p[3] = static_cast<uint8_t>(value & 0xFFU);
}

inline void store_u32_le(uint8_t* p, uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    p[i] = static_cast<uint8_t>((value >> (i * 8U)) & 0xFFU);
  }
}

inline void store_u64_be(uint8_t* p, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    p[i] = static_cast<uint8_t>((value >> (56U - i * 8U)) & 0xFFU);
  }
}

} // namespace hashrig
