#include "hashrig/types.hpp"

#include "hashrig/errors.hpp"

#include <algorithm>
#include <chrono>

namespace hashrig {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

} // namespace

Hash Hash::zero() {
  return Hash{};
}

bool Hash::operator==(const Hash& other) const {
  return bytes == other.bytes;
}

bool Hash::operator!=(const Hash& other) const {
  return !(*this == other);
}

bool Hash::operator<(const Hash& other) const {
  return std::lexicographical_compare(bytes.begin(), bytes.end(), other.bytes.begin(), other.bytes.end());
}

std::string to_hex(const uint8_t* data, size_t len) {
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kHexDigits[(data[i] >> 4U) & 0x0FU]);
    out.push_back(kHexDigits[data[i] & 0x0FU]);
  }
  return out;
}

std::string to_hex(const Bytes& data) {
  return to_hex(data.data(), data.size());
}

std::string to_hex(const Hash& hash) {
  return to_hex(hash.bytes.data(), hash.bytes.size());
}

Bytes from_hex(std::string_view text) {
  if (text.size() % 2 != 0) {
    throw ConfigError("hex string has odd length");
  }
  Bytes out;
  out.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    const int hi = hex_digit(text[i]);
    const int lo = hex_digit(text[i + 1]);
    if (hi < 0 || lo < 0) {
      throw ConfigError("invalid hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

Seed seed_from_hex(std::string_view text) {
  const Bytes raw = from_hex(text);
  if (raw.size() != 32) {
    throw ConfigError("seed must be 32 bytes, got " + std::to_string(raw.size()));
  }
  Seed seed{};
  std::copy(raw.begin(), raw.end(), seed.begin());
  return seed;
}

uint64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
  return static_cast<uint64_t>(epoch.count());
}

} // namespace hashrig
