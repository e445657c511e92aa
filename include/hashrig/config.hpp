#pragma once

#include "hashrig/discovery.hpp"
#include "hashrig/inference.hpp"
#include "hashrig/json.hpp"
#include "hashrig/method_factory.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace hashrig {

struct InferenceConfig {
  uint32_t passes = kDefaultInferencePasses;
  double jitter = kDefaultInferenceJitter;
  bool seed_rotation = false;
  uint32_t input_size = 32;
  uint32_t hidden1 = 16;
  uint32_t hidden2 = 8;
  uint32_t output_size = 4;
  // Empty creates a network from rng seed 1.
  std::string network_path;
};

struct ServerConfig {
  std::string listen_host = "0.0.0.0";
  uint16_t listen_port = kDefaultServerPort;
  // Empty selects the best method other than direct-device.
  std::string backend;
  std::string device_path;
};

struct Config {
  HashMethodConfig hashing = default_hash_method_config();
  DiscoveryConfig discovery;
  InferenceConfig inference;
  ServerConfig server;
  std::string log_level = "info";
};

JsonValue config_to_json(const Config& config);
Config config_from_json(const JsonValue& value);

Config load_or_create_config(const std::filesystem::path& path, bool& created_default);
void validate_config(const Config& config);

} // namespace hashrig
