#pragma once

#include "hashrig/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace hashrig {

class Sha256 {
public:
  Sha256();

  void update(const uint8_t* data, size_t len);
  void update(const Bytes& data) { update(data.data(), data.size()); }
  Hash finish();

private:
  void transform();

  std::array<uint32_t, 8> state_{};
  std::array<uint8_t, 64> block_{};
  uint64_t bit_length_ = 0;
  size_t block_len_ = 0;
};

Hash sha256(const uint8_t* data, size_t len);
Hash sha256(const Bytes& data);
Hash double_sha256(const uint8_t* data, size_t len);

// Reference share check used by mine_header: first three bytes zero and the
// fourth below 0x10.
bool meets_difficulty_one(const Hash& hash);

} // namespace hashrig
