#include "test_support.hpp"

#include "hashrig/seed_codec.hpp"

#include <cmath>
#include <limits>

using namespace hashrig;

namespace {

bool near(float a, float b, float eps = 1e-4F) {
  return std::fabs(a - b) <= eps;
}

uint16_t be16_at(const Seed& seed, size_t offset) {
  return static_cast<uint16_t>((static_cast<uint16_t>(seed[offset]) << 8U) | seed[offset + 1]);
}

void fixed16_quantization() {
  CHECK(quantize_fixed16(1.0F) == 65535);
  CHECK(quantize_fixed16(-1.0F) == 0);
  CHECK(quantize_fixed16(0.0F) == 32767);
  CHECK(quantize_fixed16(0.5F) == 0xBFFF);
  CHECK(quantize_fixed16(3.0F) == 65535);
  CHECK(quantize_fixed16(-7.0F) == 0);
  CHECK(quantize_fixed16(std::numeric_limits<float>::quiet_NaN()) == 32767);

  CHECK(dequantize_fixed16(0) == -1.0F);
  CHECK(dequantize_fixed16(65535) == 1.0F);
  for (float x = -1.0F; x <= 1.0F; x += 0.125F) {
    CHECK(near(dequantize_fixed16(quantize_fixed16(x)), x));
  }

  const uint8_t bytes[] = {0xFF, 0xFF, 0x02};
  CHECK(seed_checksum(bytes, 3) == 0x0200);
}

void dense_round_trip() {
  const WeightMatrix weights{
    {0.5F, -0.25F, 0.125F, 0.0F},
    {-0.75F, 1.0F, -1.0F, 0.3F},
    {0.9F, -0.9F, 0.05F, -0.05F},
  };
  const std::vector<float> bias{0.25F, -0.5F, 0.75F};

  const MatrixSeedCodec codec(SeedPacking::DENSE);
  const Seed seed = codec.encode(weights, bias);
  CHECK(seed[30] == 0 && seed[31] == 0);

  const DecodedWeights decoded = codec.decode(seed, 3, 4);
  CHECK(decoded.weights.size() == 3);
  for (size_t i = 0; i < 3; ++i) {
    CHECK(decoded.weights[i].size() == 4);
    for (size_t j = 0; j < 4; ++j) {
      CHECK(near(decoded.weights[i][j], weights[i][j]));
    }
  }
  CHECK(decoded.bias.size() == 4);
  CHECK(near(decoded.bias[0], 0.25F));
  CHECK(near(decoded.bias[1], -0.5F));
  CHECK(near(decoded.bias[2], 0.75F));
  // Zero padding decodes as the bottom of the range.
  CHECK(decoded.bias[3] == -1.0F);
}

void dense_full_matrix_leaves_no_room_for_bias() {
  WeightMatrix weights(4, std::vector<float>(4, 0.0F));
  for (size_t i = 0; i < 4; ++i) {
    for (size_t j = 0; j < 4; ++j) {
      weights[i][j] = static_cast<float>(i * 4 + j) / 16.0F - 0.5F;
    }
  }

  const MatrixSeedCodec codec(SeedPacking::DENSE);
  const Seed seed = codec.encode(weights, {0.9F, 0.9F});
  CHECK(be16_at(seed, 30) == quantize_fixed16(weights[3][3]));

  const DecodedWeights decoded = codec.decode(seed, 4, 4);
  for (size_t j = 0; j < 4; ++j) {
    CHECK(near(decoded.bias[j], weights[3][j]));
  }
}

void factorized_layout() {
  const WeightMatrix weights{
    {0.5F, -0.25F, 0.125F},
    {-0.75F, 0.0F, 1.0F},
  };
  const MatrixSeedCodec codec;
  CHECK(codec.packing() == SeedPacking::FACTORIZED);
  const Seed seed = codec.encode(weights, {0.3F});

  // U: every entry of a row is that row's first weight.
  for (size_t j = 0; j < 4; ++j) {
    CHECK(be16_at(seed, j * 2) == quantize_fixed16(0.5F));
    CHECK(be16_at(seed, 8 + j * 2) == quantize_fixed16(-0.75F));
  }
  // V: first-row weights, until byte 30.
  for (size_t j = 0; j < 4; ++j) {
    CHECK(be16_at(seed, 16 + j * 2) == quantize_fixed16(0.5F));
  }
  for (size_t j = 0; j < 3; ++j) {
    CHECK(be16_at(seed, 24 + j * 2) == quantize_fixed16(-0.25F));
  }
  // The bias was written at byte 30 and then replaced by the checksum.
  CHECK(be16_at(seed, 30) == seed_checksum(seed.data(), 30));
  CHECK(MatrixSeedCodec::validate(seed));
}

void factorized_decode_reconstructs_zero_weights() {
  const MatrixSeedCodec codec;
  const Seed seed = codec.encode({{0.5F, -0.25F, 0.125F}, {-0.75F, 0.0F, 1.0F}}, {0.3F});

  const DecodedWeights decoded = codec.decode(seed, 2, 3);
  CHECK(decoded.weights.size() == 2);
  for (const auto& row : decoded.weights) {
    CHECK(row.size() == 3);
    for (float w : row) {
      CHECK(w == 0.0F);
    }
  }
  CHECK(decoded.bias.size() == 3);
  CHECK(near(decoded.bias[0], -0.25F));
  CHECK(decoded.bias[1] == dequantize_fixed16(be16_at(seed, 30)));
  CHECK(decoded.bias[2] == 0.0F);
}

void large_matrix_keeps_first_four_rows() {
  WeightMatrix weights(6, std::vector<float>(6, 0.0F));
  for (size_t i = 0; i < 6; ++i) {
    weights[i][0] = 0.1F * static_cast<float>(i) - 0.2F;
  }
  const MatrixSeedCodec codec;
  const Seed seed = codec.encode(weights, {0.9F});

  CHECK(be16_at(seed, 0) == quantize_fixed16(weights[0][0]));
  CHECK(be16_at(seed, 24) == quantize_fixed16(weights[3][0]));
  CHECK(be16_at(seed, 28) == quantize_fixed16(weights[3][0]));
  CHECK(MatrixSeedCodec::validate(seed));
}

void validation_detects_corruption() {
  const MatrixSeedCodec codec;
  Seed seed = codec.encode({{0.2F, 0.4F}, {0.6F, 0.8F}}, {0.1F});
  CHECK(MatrixSeedCodec::validate(seed));

  Seed flipped = seed;
  flipped[5] ^= 0x01U;
  CHECK(!MatrixSeedCodec::validate(flipped));

  flipped = seed;
  flipped[31] ^= 0x80U;
  CHECK(!MatrixSeedCodec::validate(flipped));

  Seed zeros{};
  CHECK(MatrixSeedCodec::validate(zeros));
  zeros[0] = 1;
  CHECK(!MatrixSeedCodec::validate(zeros));
}

void empty_matrices_are_rejected() {
  const MatrixSeedCodec factorized;
  const MatrixSeedCodec dense(SeedPacking::DENSE);
  CHECK_THROWS_AS(factorized.encode({}, {}), ConfigError);
  CHECK_THROWS_AS(dense.encode(WeightMatrix(1), {1.0F}), ConfigError);
  CHECK_THROWS_AS(factorized.encode({{0.5F}, {}}, {}), ConfigError);

  const Seed ragged = dense.encode({{0.5F}, {0.25F, -0.25F}}, {});
  CHECK(be16_at(ragged, 0) == quantize_fixed16(0.5F));
  CHECK(be16_at(ragged, 2) == quantize_fixed16(0.25F));
  CHECK(be16_at(ragged, 4) == quantize_fixed16(-0.25F));
}

} // namespace

int main() {
  return hashrig::test::run_cases("seed_codec", {
    {"fixed16_quantization", fixed16_quantization},
    {"dense_round_trip", dense_round_trip},
    {"dense_full_matrix_leaves_no_room_for_bias", dense_full_matrix_leaves_no_room_for_bias},
    {"factorized_layout", factorized_layout},
    {"factorized_decode_reconstructs_zero_weights", factorized_decode_reconstructs_zero_weights},
    {"large_matrix_keeps_first_four_rows", large_matrix_keeps_first_four_rows},
    {"validation_detects_corruption", validation_detects_corruption},
    {"empty_matrices_are_rejected", empty_matrices_are_rejected},
  });
}
