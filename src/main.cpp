#include "hashrig/config.hpp"
#include "hashrig/discovery.hpp"
#include "hashrig/errors.hpp"
#include "hashrig/inference.hpp"
#include "hashrig/log.hpp"
#include "hashrig/method_factory.hpp"
#include "hashrig/network.hpp"
#include "hashrig/perf.hpp"
#include "hashrig/ui.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#ifndef HASHRIG_VERSION
#define HASHRIG_VERSION "dev"
#endif

namespace {

constexpr uint64_t kDefaultNetworkRngSeed = 1;

struct CliOptions {
  std::filesystem::path config_path = "hashrig.json";
  std::string command = "detect";
  std::string subnet;
  uint16_t port = 0;
  std::string input;
  bool connect = false;
  bool quiet_passes = false;
};

void print_usage() {
  std::cout << "hashrig " << HASHRIG_VERSION << "\n\n"
            << "Usage:\n"
            << "  hashrig [--config <path>] detect\n"
            << "  hashrig [--config <path>] discover [--subnet <cidr>] [--port <n>]\n"
            << "  hashrig [--config <path>] infer --input <text> [--connect] [--summary]\n\n"
            << "Options:\n"
            << "  --config <path>   Path to config JSON (default: ./hashrig.json)\n"
            << "  --subnet <cidr>   Subnet to scan (default: derived from the first interface)\n"
            << "  --port <n>        Server port to probe (default: 8888)\n"
            << "  --input <text>    Input bytes for inference\n"
            << "  --connect         Discover a hash-compute device and use it for inference\n"
            << "  --summary         Print only the consensus, not every pass\n"
            << "  -h, --help        Show this help\n";
}

uint16_t parse_port(const std::string& text) {
  size_t used = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("--port expects a number, got '" + text + "'");
  }
  if (used != text.size() || value == 0 || value > 65535UL) {
    throw std::runtime_error("--port must be within 1..65535");
  }
  return static_cast<uint16_t>(value);
}

CliOptions parse_cli(int argc, char** argv) {
  CliOptions opts;
  bool have_command = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next_value = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string(flag) + " requires a value");
      }
      return argv[++i];
    };

    if (arg == "--config") {
      opts.config_path = next_value("--config");
    } else if (arg == "--subnet") {
      opts.subnet = next_value("--subnet");
    } else if (arg == "--port") {
      opts.port = parse_port(next_value("--port"));
    } else if (arg == "--input") {
      opts.input = next_value("--input");
    } else if (arg == "--connect") {
      opts.connect = true;
    } else if (arg == "--summary") {
      opts.quiet_passes = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      std::exit(0);
    } else if (!arg.empty() && arg[0] != '-' && !have_command) {
      opts.command = arg;
      have_command = true;
    } else {
      throw std::runtime_error("unknown argument: " + arg);
    }
  }

  if (opts.command != "detect" && opts.command != "discover" && opts.command != "infer") {
    throw std::runtime_error("unknown command: " + opts.command);
  }
  if (opts.command == "infer" && opts.input.empty()) {
    throw std::runtime_error("infer requires --input");
  }
  return opts;
}

hashrig::LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return hashrig::LogLevel::DEBUG;
  if (name == "warn") return hashrig::LogLevel::WARN;
  if (name == "error") return hashrig::LogLevel::ERROR;
  return hashrig::LogLevel::INFO;
}

hashrig::HashNetwork load_or_build_network(const hashrig::InferenceConfig& config) {
  if (!config.network_path.empty()) {
    return hashrig::load_network(config.network_path);
  }
  hashrig::NetworkDims dims;
  dims.input_size = config.input_size;
  dims.hidden1 = config.hidden1;
  dims.hidden2 = config.hidden2;
  dims.output_size = config.output_size;
  return hashrig::HashNetwork::create_random(dims, kDefaultNetworkRngSeed);
}

int run_detect(const hashrig::Config& config) {
  hashrig::HashMethodFactory factory(config.hashing);
  std::cout << "Host: " << hashrig::cpu_runtime_summary() << '\n';
  std::cout << hashrig::detection_summary(factory.detection_report(), true);
  return 0;
}

int run_discover(hashrig::DiscoveryConfig discovery, const CliOptions& cli) {
  if (!cli.subnet.empty()) {
    discovery.subnet = cli.subnet;
  }
  if (cli.port != 0) {
    discovery.port = cli.port;
  }
  const auto results = hashrig::discover_servers(discovery);
  std::cout << hashrig::discovery_summary(results, true);
  return 0;
}

int run_infer(const hashrig::Config& config, const CliOptions& cli) {
  hashrig::HashMethodFactory factory(config.hashing);

  if (cli.connect) {
    auto discovery = config.discovery;
    if (!cli.subnet.empty()) {
      discovery.subnet = cli.subnet;
    }
    if (cli.port != 0) {
      discovery.port = cli.port;
    }
    auto connection = hashrig::discover_and_connect(discovery, config.hashing.device_timeouts);
    std::cout << "Connected to " << connection.best.address << " (" << connection.best.chip_count << " chips)\n";
    factory.register_device(std::move(connection.bridge));
  }

  hashrig::HashMethod& method = factory.initialize_best_method();
  const auto network = load_or_build_network(config.inference);

  hashrig::RecursiveEngine engine(network, &method, config.inference.passes, config.inference.jitter,
                                  config.inference.seed_rotation);
  std::cout << "Method: " << method.name() << (engine.is_using_hardware() ? " (hardware)" : " (software path)")
            << "  passes=" << engine.passes() << " jitter=" << engine.jitter()
            << (engine.seed_rotation() ? " rotation=on" : "") << '\n';

  const hashrig::Bytes input(cli.input.begin(), cli.input.end());
  const auto result = engine.infer(input);
  std::cout << hashrig::inference_summary(result, !cli.quiet_passes);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto cli = parse_cli(argc, argv);

    bool created_default = false;
    const auto config = hashrig::load_or_create_config(cli.config_path, created_default);
    if (created_default) {
      std::cout << "Created default config at: " << cli.config_path << '\n';
    }
    hashrig::validate_config(config);

    hashrig::set_log_echo(true);
    hashrig::set_log_min_level(parse_log_level(config.log_level));

    if (cli.command == "discover") {
      return run_discover(config.discovery, cli);
    }
    if (cli.command == "infer") {
      return run_infer(config, cli);
    }
    return run_detect(config);
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << '\n';
    return 1;
  }
}
