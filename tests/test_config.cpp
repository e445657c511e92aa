#include "test_support.hpp"

#include "hashrig/config.hpp"
#include "hashrig/json.hpp"
#include "hashrig/log.hpp"
#include "hashrig/ui.hpp"

#include <filesystem>
#include <fstream>

using namespace hashrig;

namespace {

std::filesystem::path scratch_path(const char* name) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove(path);
  return path;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

void default_config_is_created_then_reloaded() {
  const auto path = scratch_path("hashrig_test_config.json");

  bool created = false;
  const Config first = load_or_create_config(path, created);
  CHECK(created);
  CHECK(std::filesystem::exists(path));
  CHECK(first.hashing.preferred_order == default_method_order());
  CHECK(first.hashing.device_address == "localhost:8888");
  CHECK(first.discovery.port == kDefaultServerPort);
  CHECK(first.inference.passes == kDefaultInferencePasses);
  validate_config(first);

  const Config second = load_or_create_config(path, created);
  CHECK(!created);
  CHECK(second.hashing.preferred_order == first.hashing.preferred_order);
  CHECK(second.discovery.timeout == first.discovery.timeout);
  CHECK(second.inference.jitter == first.inference.jitter);
  CHECK(second.server.listen_host == "0.0.0.0");
  CHECK(second.log_level == "info");

  std::filesystem::remove(path);
}

void partial_config_keeps_defaults() {
  const Config config = config_from_json(parse_json(R"({
    "discovery": {"subnet": "10.1.0.0/24", "timeout_ms": 750},
    "inference": {"passes": 5, "seed_rotation": true},
    "log_level": "debug"
  })"));
  CHECK(config.discovery.subnet == "10.1.0.0/24");
  CHECK(config.discovery.timeout == std::chrono::milliseconds(750));
  CHECK(config.discovery.concurrency == 20);
  CHECK(config.inference.passes == 5);
  CHECK(config.inference.seed_rotation);
  CHECK(config.inference.hidden1 == 16);
  CHECK(config.hashing.gpu_device == 0);
  CHECK(config.log_level == "debug");
  validate_config(config);
}

void training_mode_swaps_default_order() {
  const Config training = config_from_json(parse_json(R"({"hashing": {"training_mode": true}})"));
  CHECK(training.hashing.training_mode);
  CHECK(training.hashing.preferred_order == training_method_order());

  const Config pinned = config_from_json(
    parse_json(R"({"hashing": {"training_mode": true, "preferred_order": ["software"]}})"));
  CHECK(pinned.hashing.preferred_order == std::vector<std::string>{"software"});
}

void wrong_types_are_rejected() {
  CHECK_THROWS_AS(config_from_json(parse_json("[]")), ConfigError);
  CHECK_THROWS_AS(config_from_json(parse_json(R"({"hashing": 3})")), ConfigError);
  CHECK_THROWS_AS(config_from_json(parse_json(R"({"discovery": {"port": "eighty"}})")), ConfigError);
  CHECK_THROWS_AS(config_from_json(parse_json(R"({"discovery": {"port": 70000}})")), ConfigError);
  CHECK_THROWS_AS(config_from_json(parse_json(R"({"inference": {"passes": -1}})")), ConfigError);
  CHECK_THROWS_AS(config_from_json(parse_json(R"({"hashing": {"preferred_order": [1]}})")), ConfigError);

  const auto path = scratch_path("hashrig_test_broken.json");
  write_text(path, "{\"hashing\": ");
  bool created = false;
  CHECK_THROWS_AS(load_or_create_config(path, created), ConfigError);
  std::filesystem::remove(path);
}

void validation_catches_bad_values() {
  const Config base;
  validate_config(base);

  Config c = base;
  c.hashing.preferred_order.push_back("");
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.hashing.gpu_device = -1;
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.discovery.concurrency = 0;
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.discovery.timeout = std::chrono::milliseconds(0);
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.inference.passes = 0;
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.inference.jitter = 1.5;
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.inference.output_size = 0;
  CHECK_THROWS_AS(validate_config(c), ConfigError);

  c = base;
  c.log_level = "verbose";
  CHECK_THROWS_AS(validate_config(c), ConfigError);
}

void json_parser_edge_cases() {
  CHECK(parse_json(R"("caf\u00e9")").as_string() == "caf\xC3\xA9");
  CHECK(parse_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
  CHECK(parse_json("-12").as_int64() == -12);
  CHECK(parse_json("1.5e1").as_double() == 15.0);
  CHECK(parse_json(R"({"a": [true, null]})").find("a")->as_array().size() == 2);

  CHECK_THROWS_AS(parse_json("{\"a\": 1,}"), JsonError);
  CHECK_THROWS_AS(parse_json("\"open"), JsonError);
  CHECK_THROWS_AS(parse_json("[1] 2"), JsonError);
  CHECK_THROWS_AS(parse_json(std::string(100, '[') + std::string(100, ']')), JsonError);

  const JsonValue round = parse_json(to_json(parse_json(R"({"k": "line\nbreak", "n": 3})"), true));
  CHECK(round.find("k")->as_string() == "line\nbreak");
  CHECK(round.find("n")->as_uint64() == 3);
}

void log_ring_is_bounded() {
  clear_log_lines();
  for (int i = 0; i < 5100; ++i) {
    log_debug("line " + std::to_string(i));
  }
  const auto lines = recent_log_lines();
  CHECK(lines.size() == 5000);
  CHECK(lines.front() == "[debug] line 100");
  CHECK(lines.back() == "[debug] line 5099");
  CHECK(recent_log_lines(3).size() == 3);
  CHECK(recent_log_lines(3).front() == "[debug] line 5097");
  clear_log_lines();
  CHECK(recent_log_lines().empty());
}

void hashrate_formatting() {
  CHECK(human_hashrate(999.0) == "999.00 H/s");
  CHECK(human_hashrate(1.0e6) == "1.00 MH/s");
  CHECK(human_hashrate(500.0e9) == "500.00 GH/s");
  CHECK(human_hashrate(2.5e15) == "2500.00 TH/s");
  CHECK(pad_right("ab", 4) == "ab  ");
  CHECK(pad_right("abcdef", 4) == "abcdef");
}

} // namespace

int main() {
  return hashrig::test::run_cases("config", {
    {"default_config_is_created_then_reloaded", default_config_is_created_then_reloaded},
    {"partial_config_keeps_defaults", partial_config_keeps_defaults},
    {"training_mode_swaps_default_order", training_mode_swaps_default_order},
    {"wrong_types_are_rejected", wrong_types_are_rejected},
    {"validation_catches_bad_values", validation_catches_bad_values},
    {"json_parser_edge_cases", json_parser_edge_cases},
    {"log_ring_is_bounded", log_ring_is_bounded},
    {"hashrate_formatting", hashrate_formatting},
  });
}
