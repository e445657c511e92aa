#include "hashrig/seed_codec.hpp"

#include "hashrig/errors.hpp"

#include <algorithm>
#include <cmath>

namespace hashrig {

namespace {

constexpr size_t kRank = 4;
constexpr size_t kDenseMaxRows = 4;
constexpr size_t kDenseMaxCols = 4;
constexpr size_t kChecksumOffset = 30;
constexpr size_t kFactorizedBiasOffset = 28;
constexpr size_t kDenseBiasOffset = 24;

void append_fixed16(Bytes& out, float value) {
  const uint16_t q = quantize_fixed16(value);
  out.push_back(static_cast<uint8_t>(q >> 8U));
  out.push_back(static_cast<uint8_t>(q & 0xFFU));
}

float read_fixed16(const Seed& seed, size_t offset) {
  return dequantize_fixed16(static_cast<uint16_t>((static_cast<uint16_t>(seed[offset]) << 8U) | seed[offset + 1]));
}

Seed seed_from(const Bytes& data) {
  Seed seed{};
  std::copy_n(data.begin(), std::min(data.size(), seed.size()), seed.begin());
  return seed;
}

} // namespace

uint16_t quantize_fixed16(float value) {
  const double v = std::isnan(value) ? 0.0 : static_cast<double>(value);
  const double clamped = std::clamp(v, -1.0, 1.0);
  return static_cast<uint16_t>((clamped + 1.0) * 32767.5);
}

float dequantize_fixed16(uint16_t value) {
  return static_cast<float>(value) / 32767.5F - 1.0F;
}

uint16_t seed_checksum(const uint8_t* data, size_t len) {
  uint16_t sum = 0;
  for (size_t i = 0; i < len; ++i) {
    sum = static_cast<uint16_t>(sum + data[i]);
  }
  return sum;
}

Seed MatrixSeedCodec::encode(const WeightMatrix& weights, const std::vector<float>& bias) const {
  if (weights.empty() || weights.front().empty()) {
    throw ConfigError("cannot encode an empty weight matrix");
  }
  return packing_ == SeedPacking::FACTORIZED ? encode_factorized(weights, bias) : encode_dense(weights, bias);
}

DecodedWeights MatrixSeedCodec::decode(const Seed& seed, size_t rows, size_t cols) const {
  return packing_ == SeedPacking::FACTORIZED ? decode_factorized(seed, rows, cols) : decode_dense(seed, rows, cols);
}

bool MatrixSeedCodec::validate(const Seed& seed) {
  const uint16_t stored = static_cast<uint16_t>((static_cast<uint16_t>(seed[kChecksumOffset]) << 8U) |
                                                seed[kChecksumOffset + 1]);
  return stored == seed_checksum(seed.data(), kChecksumOffset);
}

Seed MatrixSeedCodec::encode_factorized(const WeightMatrix& weights, const std::vector<float>& bias) const {
  const size_t rows = weights.size();
  const size_t cols = weights.front().size();
  for (const auto& row : weights) {
    if (row.empty()) {
      throw ConfigError("cannot factorize a weight matrix with an empty row");
    }
  }

  Bytes data;
  data.reserve(40);

  for (size_t i = 0; i < rows && i < kDenseMaxRows; ++i) {
    for (size_t j = 0; j < kRank; ++j) {
      append_fixed16(data, weights[i][0]);
    }
  }

  for (size_t i = 0; i < cols && data.size() < 28; ++i) {
    for (size_t j = 0; j < kRank && data.size() < kChecksumOffset; ++j) {
      append_fixed16(data, weights[0][i]);
    }
  }

  if (!bias.empty()) {
    append_fixed16(data, bias.front());
  }
  if (data.size() < 32) {
    data.resize(32, 0);
  }

  // The checksum may land on top of the bias.
  const uint16_t checksum = seed_checksum(data.data(), kChecksumOffset);
  data[kChecksumOffset] = static_cast<uint8_t>(checksum >> 8U);
  data[kChecksumOffset + 1] = static_cast<uint8_t>(checksum & 0xFFU);
  return seed_from(data);
}

Seed MatrixSeedCodec::encode_dense(const WeightMatrix& weights, const std::vector<float>& bias) const {
  Bytes data;
  data.reserve(40);

  for (size_t i = 0; i < weights.size() && i < kDenseMaxRows; ++i) {
    for (size_t j = 0; j < weights[i].size() && j < kDenseMaxCols; ++j) {
      append_fixed16(data, weights[i][j]);
    }
  }
  for (size_t i = 0; i < bias.size() && data.size() < kChecksumOffset; ++i) {
    append_fixed16(data, bias[i]);
  }
  if (data.size() < 32) {
    data.resize(32, 0);
  }
  return seed_from(data);
}

DecodedWeights MatrixSeedCodec::decode_factorized(const Seed& seed, size_t rows, size_t cols) const {
  std::vector<std::array<float, kRank>> u(rows, std::array<float, kRank>{});
  std::vector<std::array<float, kRank>> v(cols, std::array<float, kRank>{});

  for (size_t i = 0; i < rows && i < kDenseMaxRows; ++i) {
    for (size_t j = 0; j < kRank; ++j) {
      const size_t offset = (i * kRank + j) * 2;
      if (offset + 1 < kChecksumOffset) {
        u[i][j] = read_fixed16(seed, offset);
      }
    }
  }
  for (size_t i = 0; i < cols && i < kDenseMaxCols; ++i) {
    for (size_t j = 0; j < kRank; ++j) {
      // V starts past the end of the seed, so nothing is ever read here.
      const size_t offset = 32 + (i * kRank + j) * 2;
      if (offset + 1 < kChecksumOffset) {
        v[i][j] = read_fixed16(seed, offset);
      }
    }
  }

  DecodedWeights out;
  out.weights.assign(rows, std::vector<float>(cols, 0.0F));
  for (size_t i = 0; i < rows; ++i) {
    for (size_t j = 0; j < cols; ++j) {
      float sum = 0.0F;
      for (size_t k = 0; k < kRank; ++k) {
        sum += u[i][k] * v[j][k];
      }
      out.weights[i][j] = sum;
    }
  }

  out.bias.assign(cols, 0.0F);
  size_t offset = kFactorizedBiasOffset;
  for (size_t i = 0; i < cols && offset + 1 < 32; ++i, offset += 2) {
    out.bias[i] = read_fixed16(seed, offset);
  }
  return out;
}

DecodedWeights MatrixSeedCodec::decode_dense(const Seed& seed, size_t rows, size_t cols) const {
  DecodedWeights out;
  out.weights.assign(rows, std::vector<float>(cols, 0.0F));
  for (size_t i = 0; i < rows && i < kDenseMaxRows; ++i) {
    for (size_t j = 0; j < cols && j < kDenseMaxCols; ++j) {
      // Stride is always 4 columns, whatever the encoded width.
      out.weights[i][j] = read_fixed16(seed, (i * kDenseMaxCols + j) * 2);
    }
  }

  out.bias.assign(cols, 0.0F);
  size_t offset = kDenseBiasOffset;
  for (size_t i = 0; i < cols && offset + 1 < 32; ++i, offset += 2) {
    out.bias[i] = read_fixed16(seed, offset);
  }
  return out;
}

} // namespace hashrig
