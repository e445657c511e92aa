#pragma once

#include "hashrig/device_bridge.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hashrig {

struct DiscoveryConfig {
  // CIDR; empty derives a /24 from the first up, non-loopback interface.
  std::string subnet;
  uint16_t port = kDefaultServerPort;
  std::chrono::milliseconds timeout{2000};
  uint32_t concurrency = 20;
  bool skip_localhost = false;
};

struct DiscoveryResult {
  std::string address;
  std::string ip;
  uint16_t port = 0;
  uint32_t chip_count = 0;
  std::string firmware_version;
  double latency_ms = 0.0;
  bool responding = false;
  std::string error;
};

struct DiscoveryConnection {
  std::unique_ptr<DeviceBridge> bridge;
  DiscoveryResult best;
};

struct Ipv4Network {
  uint32_t network = 0;
  uint32_t prefix_len = 0;
};

// Throws ConfigError on malformed CIDR text or prefixes wider than /16.
Ipv4Network parse_cidr(const std::string& cidr);
std::string ipv4_to_string(uint32_t address);
std::vector<std::string> enumerate_hosts(const Ipv4Network& net);

std::optional<std::string> local_subnet();
bool is_local_address(const std::string& ip);

DiscoveryResult probe_server(const std::string& address, const std::string& ip, uint16_t port,
                             std::chrono::milliseconds timeout);

// Localhost first when probed, the rest in completion order.
std::vector<DiscoveryResult> discover_servers(const DiscoveryConfig& config);

std::optional<DiscoveryResult> find_best_server(const std::vector<DiscoveryResult>& results);

// Rejects a server hashing in software with HashError(HARDWARE_UNAVAILABLE).
DiscoveryConnection discover_and_connect(const DiscoveryConfig& config, BridgeTimeouts timeouts = {});

} // namespace hashrig
