#pragma once

#include "hashrig/json.hpp"
#include "hashrig/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace hashrig {

struct NetworkDims {
  size_t input_size = 0;
  size_t hidden1 = 0;
  size_t hidden2 = 0;
  size_t output_size = 0;
};

struct Prediction {
  size_t index = 0;
  double confidence = 0.0;
};

// Three layers of 32-byte seeds. Each neuron is sha256(input || seed) read as
// a unit float; a layer's floats are re-serialized as the next layer's input.
struct HashNetwork {
  size_t input_size = 0;
  size_t hidden1 = 0;
  size_t hidden2 = 0;
  size_t output_size = 0;
  std::vector<Seed> seeds1;
  std::vector<Seed> seeds2;
  std::vector<Seed> seeds_out;

  static HashNetwork create_random(const NetworkDims& dims, uint64_t rng_seed);
  static HashNetwork from_seeds(size_t input_size, std::vector<Seed> seeds1, std::vector<Seed> seeds2,
                                std::vector<Seed> seeds_out);

  NetworkDims dims() const { return {input_size, hidden1, hidden2, output_size}; }
  std::vector<double> forward(const Bytes& input) const;
  Prediction predict(const Bytes& input) const;

  // Copy with every seed byte i XORed with (pass + i) mod 256.
  HashNetwork rotated(uint32_t pass) const;
};

double neuron_forward(const Bytes& input, const Seed& seed);
double hash_to_unit(const Hash& hash);
// Each value clamped to [0,1] and scaled to a big-endian u64.
Bytes floats_to_bytes(const std::vector<double>& values);
// Argmax, first occurrence on ties. Throws HashError(INVALID_INPUT) when empty.
Prediction argmax(const std::vector<double>& values);

JsonValue network_to_json(const HashNetwork& network);
HashNetwork network_from_json(const JsonValue& value);
void save_network(const HashNetwork& network, const std::filesystem::path& path);
HashNetwork load_network(const std::filesystem::path& path);

} // namespace hashrig
