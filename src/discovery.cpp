#include "hashrig/discovery.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"
#include "hashrig/net_platform.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace hashrig {

namespace {

constexpr uint32_t kMinPrefixLen = 16;

uint32_t prefix_mask(uint32_t prefix_len) {
  return prefix_len == 0 ? 0U : (0xFFFFFFFFU << (32U - prefix_len));
}

bool parse_ipv4(const std::string& text, uint32_t& out) {
  uint32_t value = 0;
  uint32_t octet = 0;
  int digits = 0;
  int parts = 0;

  for (size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == '.') {
      if (digits == 0 || octet > 255U) {
        return false;
      }
      value = (value << 8U) | octet;
      ++parts;
      octet = 0;
      digits = 0;
      continue;
    }
    if (text[i] < '0' || text[i] > '9' || digits == 3) {
      return false;
    }
    octet = octet * 10U + static_cast<uint32_t>(text[i] - '0');
    ++digits;
  }

  if (parts != 4) {
    return false;
  }
  out = value;
  return true;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::string ipv4_to_string(uint32_t address) {
  return std::to_string((address >> 24U) & 0xFFU) + "." + std::to_string((address >> 16U) & 0xFFU) + "." +
         std::to_string((address >> 8U) & 0xFFU) + "." + std::to_string(address & 0xFFU);
}

Ipv4Network parse_cidr(const std::string& cidr) {
  const auto slash = cidr.find('/');
  if (slash == std::string::npos) {
    throw ConfigError("subnet '" + cidr + "' is not in CIDR notation");
  }

  uint32_t address = 0;
  if (!parse_ipv4(cidr.substr(0, slash), address)) {
    throw ConfigError("subnet '" + cidr + "' has an invalid IPv4 address");
  }

  const std::string prefix_text = cidr.substr(slash + 1);
  if (prefix_text.empty() || prefix_text.size() > 2 ||
      !std::all_of(prefix_text.begin(), prefix_text.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
    throw ConfigError("subnet '" + cidr + "' has an invalid prefix length");
  }
  const uint32_t prefix_len = static_cast<uint32_t>(std::stoul(prefix_text));
  if (prefix_len > 32U) {
    throw ConfigError("subnet '" + cidr + "' has an invalid prefix length");
  }
  if (prefix_len < kMinPrefixLen) {
    throw ConfigError("subnet '" + cidr + "' is wider than /" + std::to_string(kMinPrefixLen));
  }

  Ipv4Network net;
  net.prefix_len = prefix_len;
  net.network = address & prefix_mask(prefix_len);
  return net;
}

std::vector<std::string> enumerate_hosts(const Ipv4Network& net) {
  const uint64_t size = 1ULL << (32U - net.prefix_len);
  uint64_t first = net.network;
  uint64_t last = first + size - 1;
  if (net.prefix_len <= 30U) {
    ++first;
    --last;
  }

  std::vector<std::string> hosts;
  hosts.reserve(static_cast<size_t>(last - first + 1));
  for (uint64_t addr = first; addr <= last; ++addr) {
    hosts.push_back(ipv4_to_string(static_cast<uint32_t>(addr)));
  }
  return hosts;
}

std::optional<std::string> local_subnet() {
  for (const auto& iface : local_ipv4_interfaces()) {
    if (!iface.up || iface.loopback) {
      continue;
    }
    uint32_t address = 0;
    if (!parse_ipv4(iface.ipv4, address)) {
      continue;
    }
    return ipv4_to_string(address & prefix_mask(24)) + "/24";
  }
  return std::nullopt;
}

bool is_local_address(const std::string& ip) {
  if (ip.rfind("127.", 0) == 0 || ip == "localhost") {
    return true;
  }
  const auto interfaces = local_ipv4_interfaces();
  return std::any_of(interfaces.begin(), interfaces.end(), [&ip](const LocalInterface& iface) {
    return iface.ipv4 == ip;
  });
}

DiscoveryResult probe_server(const std::string& address, const std::string& ip, uint16_t port,
                             std::chrono::milliseconds timeout) {
  DiscoveryResult result;
  result.address = address;
  result.ip = ip;
  result.port = port;

  BridgeTimeouts timeouts;
  timeouts.connect_timeout_ms = static_cast<uint32_t>(std::max<int64_t>(1, timeout.count()));
  timeouts.liveness = std::max(std::chrono::milliseconds(1), timeout / 2);

  const auto start = std::chrono::steady_clock::now();
  try {
    DeviceBridge bridge(address, timeouts);
    result.latency_ms = elapsed_ms(start);
    result.chip_count = bridge.chip_count();
    result.firmware_version = bridge.cached_device_info().firmware_version;
    result.responding = true;
  } catch (const std::exception& ex) {
    result.latency_ms = elapsed_ms(start);
    result.error = ex.what();
  }
  return result;
}

std::vector<DiscoveryResult> discover_servers(const DiscoveryConfig& config) {
  if (config.concurrency == 0) {
    throw ConfigError("discovery concurrency must be > 0");
  }
  if (config.port == 0) {
    throw ConfigError("discovery port must be > 0");
  }

  std::string subnet = config.subnet;
  if (subnet.empty()) {
    const auto derived = local_subnet();
    if (!derived.has_value()) {
      throw ConfigError("no up, non-loopback IPv4 interface to derive a subnet from");
    }
    subnet = *derived;
  }

  const Ipv4Network net = parse_cidr(subnet);
  initialize_network_stack_once();

  std::vector<std::string> targets;
  for (auto& host : enumerate_hosts(net)) {
    if (is_local_address(host)) {
      continue;
    }
    targets.push_back(std::move(host));
  }

  std::vector<DiscoveryResult> results;
  results.reserve(targets.size() + 1);

  if (!config.skip_localhost) {
    const std::string address = "localhost:" + std::to_string(config.port);
    results.push_back(probe_server(address, "127.0.0.1", config.port, config.timeout));
  }

  log_info("scanning " + subnet + " (" + std::to_string(targets.size()) + " hosts) on port " +
           std::to_string(config.port));

  std::mutex results_mutex;
  std::atomic<size_t> next{0};
  const size_t worker_count = std::min<size_t>(config.concurrency, targets.size());

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t w = 0; w < worker_count; ++w) {
    workers.emplace_back([&]() {
      while (true) {
        const size_t index = next.fetch_add(1);
        if (index >= targets.size()) {
          return;
        }
        const std::string& ip = targets[index];
        DiscoveryResult result = probe_server(ip + ":" + std::to_string(config.port), ip, config.port, config.timeout);
        std::lock_guard<std::mutex> lock(results_mutex);
        results.push_back(std::move(result));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto responding = std::count_if(results.begin(), results.end(), [](const DiscoveryResult& r) {
    return r.responding;
  });
  log_info("discovery finished: " + std::to_string(responding) + " of " + std::to_string(results.size()) +
           " responding");
  return results;
}

std::optional<DiscoveryResult> find_best_server(const std::vector<DiscoveryResult>& results) {
  const DiscoveryResult* best = nullptr;
  for (const auto& result : results) {
    if (!result.responding) {
      continue;
    }
    if (best == nullptr || result.chip_count > best->chip_count ||
        (result.chip_count == best->chip_count && result.latency_ms < best->latency_ms)) {
      best = &result;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

DiscoveryConnection discover_and_connect(const DiscoveryConfig& config, BridgeTimeouts timeouts) {
  const auto results = discover_servers(config);
  auto best = find_best_server(results);
  if (!best.has_value()) {
    throw TransportError("no hash-compute servers found" +
                         (config.subnet.empty() ? std::string() : " on " + config.subnet));
  }

  DiscoveryConnection connection;
  connection.best = *best;
  connection.bridge = std::make_unique<DeviceBridge>(best->address, timeouts);
  if (connection.bridge->is_using_fallback()) {
    const std::string address = connection.bridge->address();
    connection.bridge->close();
    throw HashError(HashErrorKind::HARDWARE_UNAVAILABLE,
                    "server at " + address + " is running in software fallback mode");
  }
  return connection;
}

} // namespace hashrig
