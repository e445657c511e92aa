#pragma once

#include "hashrig/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hashrig {

using WeightMatrix = std::vector<std::vector<float>>;

struct DecodedWeights {
  WeightMatrix weights;
  std::vector<float> bias;
};

enum class SeedPacking {
  FACTORIZED,
  DENSE,
};

// Packs a weight matrix and bias into one 32-byte seed using 16-bit fixed
// point values (linear over [-1, 1], big-endian).
//
// Layouts, kept byte-compatible with existing seed files:
//   DENSE       up to 4x4 weights row-major, then bias values while fewer
//               than 30 bytes are used, zero padded. No checksum.
//   FACTORIZED  rank-4 "factors" U (rows x 4) then V (cols x 4), then the
//               first bias value, zero padded, with a 16-bit sum of bytes
//               0..29 stored big-endian in bytes 30..31.
//
// The factorization is not a decomposition: every U entry of row i is
// weights[i][0] and every V entry of column j is weights[0][j]. Decoding
// reads V from beyond the seed, so factorized weights always reconstruct as
// zero. Do not rely on it to approximate the matrix.
class MatrixSeedCodec {
public:
  explicit MatrixSeedCodec(SeedPacking packing = SeedPacking::FACTORIZED) : packing_(packing) {}

  SeedPacking packing() const { return packing_; }

  // Throws ConfigError on an empty matrix, or on an empty row when factorized.
  Seed encode(const WeightMatrix& weights, const std::vector<float>& bias) const;
  DecodedWeights decode(const Seed& seed, size_t rows, size_t cols) const;

  // Checks the factorized checksum. Dense seeds carry none.
  static bool validate(const Seed& seed);

private:
  Seed encode_factorized(const WeightMatrix& weights, const std::vector<float>& bias) const;
  Seed encode_dense(const WeightMatrix& weights, const std::vector<float>& bias) const;
  DecodedWeights decode_factorized(const Seed& seed, size_t rows, size_t cols) const;
  DecodedWeights decode_dense(const Seed& seed, size_t rows, size_t cols) const;

  SeedPacking packing_;
};

// NaN quantizes as 0.0.
uint16_t quantize_fixed16(float value);
float dequantize_fixed16(uint16_t value);
uint16_t seed_checksum(const uint8_t* data, size_t len);

} // namespace hashrig
