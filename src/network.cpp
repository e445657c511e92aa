#include "hashrig/network.hpp"

#include "hashrig/crypto.hpp"
#include "hashrig/errors.hpp"
#include "hashrig/rng.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>

namespace hashrig {

namespace {

constexpr double kU64Max = static_cast<double>(std::numeric_limits<uint64_t>::max());

void check_dims(const NetworkDims& dims) {
  if (dims.input_size == 0 || dims.hidden1 == 0 || dims.hidden2 == 0 || dims.output_size == 0) {
    throw ConfigError("all network dimensions must be positive");
  }
}

std::vector<Seed> random_seeds(SplitMix64& rng, size_t count) {
  std::vector<Seed> seeds(count);
  for (auto& seed : seeds) {
    for (size_t i = 0; i < seed.size(); i += 8) {
      store_u64_be(seed.data() + i, rng.next());
    }
  }
  return seeds;
}

std::vector<double> layer_forward(const Bytes& input, const std::vector<Seed>& seeds) {
  std::vector<double> out;
  out.reserve(seeds.size());
  for (const auto& seed : seeds) {
    out.push_back(neuron_forward(input, seed));
  }
  return out;
}

void rotate_seeds(std::vector<Seed>& seeds, uint32_t pass) {
  for (auto& seed : seeds) {
    for (size_t i = 0; i < seed.size(); ++i) {
      seed[i] ^= static_cast<uint8_t>((pass + i) % 256U);
    }
  }
}

JsonValue seeds_to_json(const std::vector<Seed>& seeds) {
  JsonValue::array out;
  out.reserve(seeds.size());
  for (const auto& seed : seeds) {
    out.emplace_back(to_hex(seed.data(), seed.size()));
  }
  return JsonValue(std::move(out));
}

std::vector<Seed> seeds_from_json(const JsonValue& root, const char* key) {
  const JsonValue* field = root.find(key);
  if (field == nullptr || !field->is_array()) {
    throw ConfigError(std::string("network field '") + key + "' must be an array of hex seeds");
  }
  std::vector<Seed> seeds;
  seeds.reserve(field->as_array().size());
  for (const auto& item : field->as_array()) {
    if (!item.is_string()) {
      throw ConfigError(std::string("network field '") + key + "' must hold strings");
    }
    seeds.push_back(seed_from_hex(item.as_string()));
  }
  return seeds;
}

} // namespace

double hash_to_unit(const Hash& hash) {
  return static_cast<double>(load_u64_be(hash.bytes.data())) / kU64Max;
}

double neuron_forward(const Bytes& input, const Seed& seed) {
  Sha256 ctx;
  ctx.update(input);
  ctx.update(seed.data(), seed.size());
  return hash_to_unit(ctx.finish());
}

Bytes floats_to_bytes(const std::vector<double>& values) {
  Bytes out(values.size() * 8U);
  for (size_t i = 0; i < values.size(); ++i) {
    const double clamped = std::clamp(values[i], 0.0, 1.0);
    const uint64_t scaled = clamped >= 1.0
      ? std::numeric_limits<uint64_t>::max()
      : static_cast<uint64_t>(clamped * kU64Max);
    store_u64_be(out.data() + i * 8U, scaled);
  }
  return out;
}

Prediction argmax(const std::vector<double>& values) {
  if (values.empty()) {
    throw HashError(HashErrorKind::INVALID_INPUT, "argmax over an empty layer");
  }
  Prediction best{0, values[0]};
  for (size_t i = 1; i < values.size(); ++i) {
    if (values[i] > best.confidence) {
      best = {i, values[i]};
    }
  }
  return best;
}

HashNetwork HashNetwork::create_random(const NetworkDims& dims, uint64_t rng_seed) {
  check_dims(dims);
  SplitMix64 rng(rng_seed);

  HashNetwork net;
  net.input_size = dims.input_size;
  net.hidden1 = dims.hidden1;
  net.hidden2 = dims.hidden2;
  net.output_size = dims.output_size;
  net.seeds1 = random_seeds(rng, dims.hidden1);
  net.seeds2 = random_seeds(rng, dims.hidden2);
  net.seeds_out = random_seeds(rng, dims.output_size);
  return net;
}

HashNetwork HashNetwork::from_seeds(size_t input_size, std::vector<Seed> seeds1, std::vector<Seed> seeds2,
                                    std::vector<Seed> seeds_out) {
  check_dims({input_size, seeds1.size(), seeds2.size(), seeds_out.size()});

  HashNetwork net;
  net.input_size = input_size;
  net.hidden1 = seeds1.size();
  net.hidden2 = seeds2.size();
  net.output_size = seeds_out.size();
  net.seeds1 = std::move(seeds1);
  net.seeds2 = std::move(seeds2);
  net.seeds_out = std::move(seeds_out);
  return net;
}

std::vector<double> HashNetwork::forward(const Bytes& input) const {
  const auto layer1 = layer_forward(input, seeds1);
  const auto layer2 = layer_forward(floats_to_bytes(layer1), seeds2);
  return layer_forward(floats_to_bytes(layer2), seeds_out);
}

Prediction HashNetwork::predict(const Bytes& input) const {
  return argmax(forward(input));
}

HashNetwork HashNetwork::rotated(uint32_t pass) const {
  HashNetwork copy = *this;
  rotate_seeds(copy.seeds1, pass);
  rotate_seeds(copy.seeds2, pass);
  rotate_seeds(copy.seeds_out, pass);
  return copy;
}

JsonValue network_to_json(const HashNetwork& network) {
  JsonValue::object root{
    {"input_size", JsonValue(static_cast<uint64_t>(network.input_size))},
    {"hidden1", JsonValue(static_cast<uint64_t>(network.hidden1))},
    {"hidden2", JsonValue(static_cast<uint64_t>(network.hidden2))},
    {"output_size", JsonValue(static_cast<uint64_t>(network.output_size))},
    {"seeds1", seeds_to_json(network.seeds1)},
    {"seeds2", seeds_to_json(network.seeds2)},
    {"seeds_out", seeds_to_json(network.seeds_out)},
  };
  return JsonValue(std::move(root));
}

HashNetwork network_from_json(const JsonValue& value) {
  if (!value.is_object()) {
    throw ConfigError("network root must be an object");
  }

  uint64_t input_size = 0;
  uint64_t hidden1 = 0;
  uint64_t hidden2 = 0;
  uint64_t output_size = 0;
  read_field(value, "input_size", input_size);
  read_field(value, "hidden1", hidden1);
  read_field(value, "hidden2", hidden2);
  read_field(value, "output_size", output_size);

  HashNetwork net = HashNetwork::from_seeds(static_cast<size_t>(input_size), seeds_from_json(value, "seeds1"),
                                            seeds_from_json(value, "seeds2"), seeds_from_json(value, "seeds_out"));
  if (net.hidden1 != hidden1 || net.hidden2 != hidden2 || net.output_size != output_size) {
    throw ConfigError("network seed counts do not match the declared layer sizes");
  }
  return net;
}

void save_network(const HashNetwork& network, const std::filesystem::path& path) {
  std::ofstream out(path);
  if (!out) {
    throw ConfigError("failed to write network file: " + path.string());
  }
  out << to_json(network_to_json(network), true) << '\n';
}

HashNetwork load_network(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to read network file: " + path.string());
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return network_from_json(parse_json(text));
}

} // namespace hashrig
