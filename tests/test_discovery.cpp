#include "test_support.hpp"

#include "hashrig/discovery.hpp"
#include "hashrig/hash_methods.hpp"
#include "hashrig/hash_server.hpp"
#include "hashrig/net_platform.hpp"
#include "hashrig/ui.hpp"

#include <algorithm>
#include <chrono>

using namespace hashrig;

namespace {

// TEST-NET-1 holds no live hosts.
constexpr const char* kUnroutedSubnet = "192.0.2.0/30";

// Hosts of the scan subnet that are not this machine's own addresses.
size_t remote_host_count(const std::string& subnet) {
  const auto hosts = enumerate_hosts(parse_cidr(subnet));
  return static_cast<size_t>(std::count_if(hosts.begin(), hosts.end(), [](const std::string& host) {
    return !is_local_address(host);
  }));
}

DiscoveryResult responder(const std::string& address, uint32_t chips, double latency_ms) {
  DiscoveryResult result;
  result.address = address;
  result.chip_count = chips;
  result.latency_ms = latency_ms;
  result.responding = true;
  return result;
}

HashServerOptions loopback_options() {
  HashServerOptions options;
  options.listen_host = "127.0.0.1";
  options.listen_port = 0;
  return options;
}

DiscoveryConfig quick_scan(uint16_t port) {
  DiscoveryConfig config;
  config.subnet = kUnroutedSubnet;
  config.port = port;
  config.timeout = std::chrono::milliseconds(200);
  config.concurrency = 2;
  return config;
}

void best_server_prefers_chips() {
  const std::vector<DiscoveryResult> results{
    responder("a:8888", 2, 5.0),
    responder("b:8888", 4, 50.0),
    responder("c:8888", 4, 20.0),
  };
  const auto best = find_best_server(results);
  CHECK(best.has_value());
  CHECK(best->address == "c:8888");
}

void best_server_skips_silent_hosts() {
  std::vector<DiscoveryResult> results{responder("a:8888", 1, 10.0), responder("b:8888", 64, 1.0)};
  results[1].responding = false;
  CHECK(find_best_server(results)->address == "a:8888");

  results[0].responding = false;
  CHECK(!find_best_server(results).has_value());
  CHECK(!find_best_server({}).has_value());
}

void cidr_parsing() {
  const Ipv4Network net = parse_cidr("192.168.1.77/24");
  CHECK(net.prefix_len == 24);
  CHECK(ipv4_to_string(net.network) == "192.168.1.0");

  const auto hosts = enumerate_hosts(net);
  CHECK(hosts.size() == 254);
  CHECK(hosts.front() == "192.168.1.1");
  CHECK(hosts.back() == "192.168.1.254");

  CHECK(enumerate_hosts(parse_cidr("10.0.0.0/30")).size() == 2);
  CHECK(enumerate_hosts(parse_cidr("10.0.0.4/31")).size() == 2);
  const auto single = enumerate_hosts(parse_cidr("10.0.0.9/32"));
  CHECK(single.size() == 1);
  CHECK(single[0] == "10.0.0.9");
  CHECK(enumerate_hosts(parse_cidr("172.16.0.0/16")).size() == 65534);

  CHECK_THROWS_AS(parse_cidr("10.0.0.0"), ConfigError);
  CHECK_THROWS_AS(parse_cidr("10.0.0.0/33"), ConfigError);
  CHECK_THROWS_AS(parse_cidr("10.0.0.0/8"), ConfigError);
  CHECK_THROWS_AS(parse_cidr("300.1.1.1/24"), ConfigError);
  CHECK_THROWS_AS(parse_cidr("1.2.3/24"), ConfigError);
  CHECK_THROWS_AS(parse_cidr("10.0.0.0/ab"), ConfigError);
}

void loopback_counts_as_local() {
  CHECK(is_local_address("127.0.0.1"));
  CHECK(is_local_address("127.1.2.3"));
  bool documentation_address_is_ours = false;
  for (const auto& iface : local_ipv4_interfaces()) {
    CHECK(is_local_address(iface.ipv4));
    documentation_address_is_ours = documentation_address_is_ours || iface.ipv4 == "203.0.113.254";
  }
  CHECK(is_local_address("203.0.113.254") == documentation_address_is_ours);
}

void invalid_scan_settings() {
  DiscoveryConfig config = quick_scan(kDefaultServerPort);
  config.concurrency = 0;
  CHECK_THROWS_AS(discover_servers(config), ConfigError);

  config = quick_scan(0);
  CHECK_THROWS_AS(discover_servers(config), ConfigError);

  config = quick_scan(kDefaultServerPort);
  config.subnet = "not-a-subnet";
  CHECK_THROWS_AS(discover_servers(config), ConfigError);
}

void unrouted_scan_finishes() {
  DiscoveryConfig config = quick_scan(kDefaultServerPort);
  config.concurrency = 1;
  config.timeout = std::chrono::milliseconds(50);
  config.skip_localhost = true;

  const auto start = std::chrono::steady_clock::now();
  const auto results = discover_servers(config);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  CHECK(results.size() == remote_host_count(kUnroutedSubnet));
  for (const auto& result : results) {
    CHECK(!result.responding);
    CHECK(!result.error.empty());
    CHECK(result.port == kDefaultServerPort);
  }
  CHECK(!find_best_server(results).has_value());
  CHECK(discovery_summary(results, false).find("No devices found") != std::string::npos);
}

void closed_port_probe_reports_error() {
  initialize_network_stack_once();
  const SocketHandle listener = listen_tcp_socket("127.0.0.1", 0);
  const uint16_t port = socket_local_port(listener);
  close_socket_handle(listener);

  const auto result = probe_server("127.0.0.1:" + std::to_string(port), "127.0.0.1", port,
                                   std::chrono::milliseconds(200));
  CHECK(!result.responding);
  CHECK(!result.error.empty());
  CHECK(result.latency_ms >= 0.0);
}

void localhost_is_probed_first() {
  test::FakeHardwareMethod backend;
  HashServer server(backend, loopback_options());
  server.start();

  const auto results = discover_servers(quick_scan(server.port()));
  CHECK(results.size() == 1 + remote_host_count(kUnroutedSubnet));
  CHECK(results[0].address == "localhost:" + std::to_string(server.port()));
  CHECK(results[0].ip == "127.0.0.1");
  CHECK(results[0].responding);
  CHECK(results[0].chip_count == 8);
  for (size_t i = 1; i < results.size(); ++i) {
    CHECK(results[i].ip != "127.0.0.1");
  }

  const auto summary = discovery_summary(results, false);
  CHECK(summary.find("Best server: localhost:") != std::string::npos);
}

void connect_adopts_hardware_server() {
  test::FakeHardwareMethod backend;
  HashServer server(backend, loopback_options());
  server.start();

  DiscoveryConnection connection = discover_and_connect(quick_scan(server.port()));
  CHECK(connection.bridge != nullptr);
  CHECK(connection.bridge->is_connected());
  CHECK(connection.best.chip_count == 8);
  CHECK(connection.bridge->compute_hash(Bytes{3}).hash == sha256(Bytes{3}));
}

void connect_rejects_software_server() {
  SoftwareMethod backend;
  backend.initialize();
  HashServer server(backend, loopback_options());
  server.start();

  CHECK_HASH_ERROR(discover_and_connect(quick_scan(server.port())), HashErrorKind::HARDWARE_UNAVAILABLE);
}

void connect_with_nothing_found() {
  DiscoveryConfig config = quick_scan(kDefaultServerPort);
  config.skip_localhost = true;
  config.timeout = std::chrono::milliseconds(50);
  CHECK_THROWS_AS(discover_and_connect(config), TransportError);
}

} // namespace

int main() {
  return hashrig::test::run_cases("discovery", {
    {"best_server_prefers_chips", best_server_prefers_chips},
    {"best_server_skips_silent_hosts", best_server_skips_silent_hosts},
    {"cidr_parsing", cidr_parsing},
    {"loopback_counts_as_local", loopback_counts_as_local},
    {"invalid_scan_settings", invalid_scan_settings},
    {"unrouted_scan_finishes", unrouted_scan_finishes},
    {"closed_port_probe_reports_error", closed_port_probe_reports_error},
    {"localhost_is_probed_first", localhost_is_probed_first},
    {"connect_adopts_hardware_server", connect_adopts_hardware_server},
    {"connect_rejects_software_server", connect_rejects_software_server},
    {"connect_with_nothing_found", connect_with_nothing_found},
  });
}
