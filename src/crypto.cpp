#include "hashrig/crypto.hpp"

namespace hashrig {

namespace {

constexpr std::array<uint32_t, 64> K = {
  0x428a2f98U, 0x71374491U, 0xb5c0fbcfU, 0xe9b5dba5U, 0x3956c25bU, 0x59f111f1U, 0x923f82a4U,
  0xab1c5ed5U, 0xd807aa98U, 0x12835b01U, 0x243185beU, 0x550c7dc3U, 0x72be5d74U, 0x80deb1feU,
  0x9bdc06a7U, 0xc19bf174U, 0xe49b69c1U, 0xefbe4786U, 0x0fc19dc6U, 0x240ca1ccU, 0x2de92c6fU,
  0x4a7484aaU, 0x5cb0a9dcU, 0x76f988daU, 0x983e5152U, 0xa831c66dU, 0xb00327c8U, 0xbf597fc7U,
  0xc6e00bf3U, 0xd5a79147U, 0x06ca6351U, 0x14292967U, 0x27b70a85U, 0x2e1b2138U, 0x4d2c6dfcU,
  0x53380d13U, 0x650a7354U, 0x766a0abbU, 0x81c2c92eU, 0x92722c85U, 0xa2bfe8a1U, 0xa81a664bU,
  0xc24b8b70U, 0xc76c51a3U, 0xd192e819U, 0xd6990624U, 0xf40e3585U, 0x106aa070U, 0x19a4c116U,
  0x1e376c08U, 0x2748774cU, 0x34b0bcb5U, 0x391c0cb3U, 0x4ed8aa4aU, 0x5b9cca4fU, 0x682e6ff3U,
  0x748f82eeU, 0x78a5636fU, 0x84c87814U, 0x8cc70208U, 0x90befffaU, 0xa4506cebU, 0xbef9a3f7U,
  0xc67178f2U,
};

inline uint32_t rotr(uint32_t x, uint32_t n) {
  return (x >> n) | (x << (32U - n));
}

} // namespace

Sha256::Sha256() {
  state_ = {
    0x6a09e667U, 0xbb67ae85U, 0x3c6ef372U, 0xa54ff53aU,
    0x510e527fU, 0x9b05688cU, 0x1f83d9abU, 0x5be0cd19U,
  };
}

void Sha256::transform() {
  std::array<uint32_t, 64> w{};
  for (size_t i = 0; i < 16; ++i) {
    w[i] = load_u32_be(block_.data() + i * 4);
  }
  for (size_t i = 16; i < 64; ++i) {
    const uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3U);
    const uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10U);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  auto v = state_;
  for (size_t i = 0; i < 64; ++i) {
    const uint32_t s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
    const uint32_t ch = (v[4] & v[5]) ^ ((~v[4]) & v[6]);
    const uint32_t temp1 = v[7] + s1 + ch + K[i] + w[i];
    const uint32_t s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
    const uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);

    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + temp1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = temp1 + s0 + maj;
  }

  for (size_t i = 0; i < 8; ++i) {
    state_[i] += v[i];
  }
}

void Sha256::update(const uint8_t* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    block_[block_len_++] = data[i];
    if (block_len_ == 64) {
      transform();
      bit_length_ += 512;
      block_len_ = 0;
    }
  }
}

Hash Sha256::finish() {
  bit_length_ += static_cast<uint64_t>(block_len_) * 8ULL;

  size_t i = block_len_;
  block_[i++] = 0x80;
  if (i > 56) {
    while (i < 64) {
      block_[i++] = 0;
    }
    transform();
    i = 0;
  }
  while (i < 56) {
    block_[i++] = 0;
  }
  for (size_t j = 0; j < 8; ++j) {
    block_[63 - j] = static_cast<uint8_t>(bit_length_ >> (j * 8U));
  }
  transform();

  Hash out;
  for (size_t j = 0; j < 8; ++j) {
    store_u32_be(out.bytes.data() + j * 4, state_[j]);
  }
  return out;
}

Hash sha256(const uint8_t* data, size_t len) {
  Sha256 ctx;
  ctx.update(data, len);
  return ctx.finish();
}

Hash sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}

Hash double_sha256(const uint8_t* data, size_t len) {
  const Hash first = sha256(data, len);
  return sha256(first.bytes.data(), first.bytes.size());
}

bool meets_difficulty_one(const Hash& hash) {
  return hash.bytes[0] == 0 && hash.bytes[1] == 0 && hash.bytes[2] == 0 && hash.bytes[3] < 0x10U;
}

} // namespace hashrig
