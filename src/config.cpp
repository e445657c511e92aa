#include "hashrig/config.hpp"

#include "hashrig/errors.hpp"

#include <cmath>
#include <fstream>
#include <iterator>

namespace hashrig {

namespace {

JsonValue string_array(const std::vector<std::string>& values) {
  JsonValue::array out;
  for (const auto& value : values) {
    out.emplace_back(value);
  }
  return JsonValue(std::move(out));
}

const JsonValue* section(const JsonValue& root, const char* name) {
  const JsonValue* value = root.find(name);
  if (value == nullptr || value->is_null()) {
    return nullptr;
  }
  if (!value->is_object()) {
    throw ConfigError(std::string("config section '") + name + "' must be an object");
  }
  return value;
}

} // namespace

JsonValue config_to_json(const Config& config) {
  const auto& h = config.hashing;
  JsonValue::object hashing{
    {"preferred_order", string_array(h.preferred_order)},
    {"device_path", JsonValue(h.device_path)},
    {"device_address", JsonValue(h.device_address)},
    {"external_tool_path", JsonValue(h.external_tool_path)},
    {"gpu_device", JsonValue(static_cast<int64_t>(h.gpu_device))},
    {"allow_fallback", JsonValue(h.allow_fallback)},
    {"training_mode", JsonValue(h.training_mode)},
  };

  const auto& d = config.discovery;
  JsonValue::object discovery{
    {"subnet", JsonValue(d.subnet)},
    {"port", JsonValue(static_cast<uint64_t>(d.port))},
    {"timeout_ms", JsonValue(static_cast<uint64_t>(d.timeout.count()))},
    {"concurrency", JsonValue(d.concurrency)},
    {"skip_localhost", JsonValue(d.skip_localhost)},
  };

  const auto& i = config.inference;
  JsonValue::object inference{
    {"passes", JsonValue(i.passes)},
    {"jitter", JsonValue(i.jitter)},
    {"seed_rotation", JsonValue(i.seed_rotation)},
    {"input_size", JsonValue(i.input_size)},
    {"hidden1", JsonValue(i.hidden1)},
    {"hidden2", JsonValue(i.hidden2)},
    {"output_size", JsonValue(i.output_size)},
    {"network_path", JsonValue(i.network_path)},
  };

  const auto& s = config.server;
  JsonValue::object server{
    {"listen_host", JsonValue(s.listen_host)},
    {"listen_port", JsonValue(static_cast<uint64_t>(s.listen_port))},
    {"backend", JsonValue(s.backend)},
    {"device_path", JsonValue(s.device_path)},
  };

  JsonValue::object root{
    {"hashing", JsonValue(std::move(hashing))},
    {"discovery", JsonValue(std::move(discovery))},
    {"inference", JsonValue(std::move(inference))},
    {"server", JsonValue(std::move(server))},
    {"log_level", JsonValue(config.log_level)},
  };
  return JsonValue(std::move(root));
}

Config config_from_json(const JsonValue& value) {
  if (!value.is_object()) {
    throw ConfigError("config root must be an object");
  }

  Config config;
  read_field(value, "log_level", config.log_level);

  if (const JsonValue* h = section(value, "hashing")) {
    read_field(*h, "preferred_order", config.hashing.preferred_order);
    read_field(*h, "device_path", config.hashing.device_path);
    read_field(*h, "device_address", config.hashing.device_address);
    read_field(*h, "external_tool_path", config.hashing.external_tool_path);
    int64_t gpu_device = config.hashing.gpu_device;
    read_field(*h, "gpu_device", gpu_device);
    config.hashing.gpu_device = static_cast<int>(gpu_device);
    read_field(*h, "allow_fallback", config.hashing.allow_fallback);
    read_field(*h, "training_mode", config.hashing.training_mode);

    // Training mode only swaps the order when none was given explicitly.
    if (config.hashing.training_mode && h->find("preferred_order") == nullptr) {
      config.hashing.preferred_order = training_method_order();
    }
  }

  if (const JsonValue* d = section(value, "discovery")) {
    read_field(*d, "subnet", config.discovery.subnet);
    read_field(*d, "port", config.discovery.port);
    uint64_t timeout_ms = static_cast<uint64_t>(config.discovery.timeout.count());
    read_field(*d, "timeout_ms", timeout_ms);
    config.discovery.timeout = std::chrono::milliseconds(timeout_ms);
    read_field(*d, "concurrency", config.discovery.concurrency);
    read_field(*d, "skip_localhost", config.discovery.skip_localhost);
  }

  if (const JsonValue* i = section(value, "inference")) {
    read_field(*i, "passes", config.inference.passes);
    read_field(*i, "jitter", config.inference.jitter);
    read_field(*i, "seed_rotation", config.inference.seed_rotation);
    read_field(*i, "input_size", config.inference.input_size);
    read_field(*i, "hidden1", config.inference.hidden1);
    read_field(*i, "hidden2", config.inference.hidden2);
    read_field(*i, "output_size", config.inference.output_size);
    read_field(*i, "network_path", config.inference.network_path);
  }

  if (const JsonValue* s = section(value, "server")) {
    read_field(*s, "listen_host", config.server.listen_host);
    read_field(*s, "listen_port", config.server.listen_port);
    read_field(*s, "backend", config.server.backend);
    read_field(*s, "device_path", config.server.device_path);
  }

  return config;
}

Config load_or_create_config(const std::filesystem::path& path, bool& created_default) {
  created_default = false;

  if (!std::filesystem::exists(path)) {
    created_default = true;
    const Config config;
    std::ofstream out(path);
    if (!out) {
      throw ConfigError("failed to create config file: " + path.string());
    }
    out << to_json(config_to_json(config), true) << '\n';
    return config;
  }

  std::ifstream in(path);
  if (!in) {
    throw ConfigError("failed to read config file: " + path.string());
  }

  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return config_from_json(parse_json(text));
}

void validate_config(const Config& config) {
  for (const auto& name : config.hashing.preferred_order) {
    if (name.empty()) {
      throw ConfigError("config hashing.preferred_order has an empty entry");
    }
  }
  if (config.hashing.gpu_device < 0) {
    throw ConfigError("config hashing.gpu_device must be >= 0");
  }
  if (config.discovery.port == 0) {
    throw ConfigError("config discovery.port must be > 0");
  }
  if (config.discovery.concurrency == 0) {
    throw ConfigError("config discovery.concurrency must be > 0");
  }
  if (config.discovery.timeout.count() <= 0) {
    throw ConfigError("config discovery.timeout_ms must be > 0");
  }
  if (config.inference.passes == 0) {
    throw ConfigError("config inference.passes must be > 0");
  }
  if (std::isnan(config.inference.jitter) || config.inference.jitter < 0.0 || config.inference.jitter > 1.0) {
    throw ConfigError("config inference.jitter must be within [0, 1]");
  }
  if (config.inference.input_size == 0 || config.inference.hidden1 == 0 || config.inference.hidden2 == 0 ||
      config.inference.output_size == 0) {
    throw ConfigError("config inference layer sizes must be > 0");
  }
  if (config.server.listen_host.empty()) {
    throw ConfigError("config server.listen_host is missing");
  }
  if (config.log_level != "debug" && config.log_level != "info" && config.log_level != "warn" &&
      config.log_level != "error") {
    throw ConfigError("config log_level must be one of debug, info, warn, error");
  }
}

} // namespace hashrig
