#include "hashrig/config.hpp"
#include "hashrig/errors.hpp"
#include "hashrig/hash_server.hpp"
#include "hashrig/log.hpp"
#include "hashrig/method_factory.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
  g_stop_requested.store(true);
}

struct CliOptions {
  std::filesystem::path config_path = "hashrig.json";
  std::string backend;
  uint16_t port = 0;
  bool port_set = false;
};

CliOptions parse_cli(int argc, char** argv) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path");
      }
      opts.config_path = argv[++i];
      continue;
    }
    if (arg == "--backend") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--backend requires a method name");
      }
      opts.backend = argv[++i];
      continue;
    }
    if (arg == "--port") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--port requires a number");
      }
      const unsigned long value = std::stoul(argv[++i]);
      if (value > 65535UL) {
        throw std::runtime_error("--port must be within 0..65535");
      }
      opts.port = static_cast<uint16_t>(value);
      opts.port_set = true;
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      std::cout << "hashrig-server\n\n"
                << "Usage:\n"
                << "  hashrig-server [--config <path>] [--backend <method>] [--port <n>]\n\n"
                << "Options:\n"
                << "  --config <path>    Path to config JSON (default: ./hashrig.json)\n"
                << "  --backend <name>   Hash method to serve (default: best non-device method)\n"
                << "  --port <n>         Listen port, 0 for ephemeral (default: 8888)\n"
                << "  -h, --help         Show this help\n";
      std::exit(0);
    }
    throw std::runtime_error("unknown argument: " + arg);
  }
  return opts;
}

// The server never serves through a bridge to another server.
hashrig::HashMethod& pick_backend(hashrig::HashMethodFactory& factory, const std::string& requested) {
  if (!requested.empty()) {
    hashrig::HashMethod* method = factory.method(requested);
    if (method == nullptr) {
      throw hashrig::ConfigError("unknown backend: " + requested);
    }
    if (method->name() == hashrig::kDirectDeviceMethod) {
      throw hashrig::ConfigError("direct-device cannot back a hash server");
    }
    return *method;
  }

  for (const auto& name : factory.priority_order()) {
    if (name == hashrig::kDirectDeviceMethod) {
      continue;
    }
    hashrig::HashMethod* method = factory.method(name);
    if (method != nullptr && method->is_available()) {
      return *method;
    }
  }
  return *factory.method(hashrig::kSoftwareMethod);
}

} // namespace

int main(int argc, char** argv) {
  try {
    const auto cli = parse_cli(argc, argv);

    bool created_default = false;
    auto config = hashrig::load_or_create_config(cli.config_path, created_default);
    if (created_default) {
      std::cout << "Created default config at: " << cli.config_path << '\n';
    }
    hashrig::validate_config(config);
    hashrig::set_log_echo(true);

    // Probing our own port would make the server a client of itself.
    config.hashing.device_address.clear();
    hashrig::HashMethodFactory factory(config.hashing);

    hashrig::HashMethod& backend = pick_backend(factory, cli.backend.empty() ? config.server.backend : cli.backend);
    backend.initialize();

    hashrig::HashServerOptions options;
    options.listen_host = config.server.listen_host;
    options.listen_port = cli.port_set ? cli.port : config.server.listen_port;
    options.device_path = config.server.device_path;

    hashrig::HashServer server(backend, options);
    server.start();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (!g_stop_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    factory.shutdown_all();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << '\n';
    return 1;
  }
}
