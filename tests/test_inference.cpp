#include "test_support.hpp"

#include "hashrig/hash_methods.hpp"
#include "hashrig/hash_server.hpp"
#include "hashrig/inference.hpp"
#include "hashrig/network.hpp"
#include "hashrig/rng.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>

using namespace hashrig;

namespace {

bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

HashNetwork small_network(uint64_t rng_seed = 7) {
  NetworkDims dims;
  dims.input_size = 16;
  dims.hidden1 = 8;
  dims.hidden2 = 6;
  dims.output_size = 4;
  return HashNetwork::create_random(dims, rng_seed);
}

Bytes sample_input() {
  return Bytes{'h', 'a', 's', 'h', 'r', 'i', 'g', ' ', 'i', 'n', 'p', 'u', 't', '!', 0x00, 0xFF};
}

InferencePass pass_of(size_t prediction, double confidence) {
  InferencePass pass;
  pass.prediction = prediction;
  pass.confidence = confidence;
  return pass;
}

// Reports itself available but fails when asked for its capabilities.
class BrokenCapabilitiesMethod : public SoftwareMethod {
public:
  Capabilities capabilities() const override {
    throw HashError(HashErrorKind::OPERATION_FAILED, "capabilities lookup failed");
  }
};

void random_networks_are_reproducible() {
  const HashNetwork a = small_network(7);
  const HashNetwork b = small_network(7);
  const HashNetwork c = small_network(8);
  CHECK(a.seeds1 == b.seeds1);
  CHECK(a.seeds_out == b.seeds_out);
  CHECK(a.seeds1 != c.seeds1);
  CHECK(a.seeds1.size() == 8);
  CHECK(a.seeds2.size() == 6);
  CHECK(a.seeds_out.size() == 4);
  CHECK(a.dims().hidden2 == 6);

  NetworkDims zero = a.dims();
  zero.hidden1 = 0;
  CHECK_THROWS_AS(HashNetwork::create_random(zero, 1), ConfigError);
  CHECK_THROWS_AS(HashNetwork::from_seeds(16, a.seeds1, {}, a.seeds_out), ConfigError);
  CHECK_THROWS_AS(HashNetwork::from_seeds(0, a.seeds1, a.seeds2, a.seeds_out), ConfigError);
}

void neuron_reads_hash_prefix() {
  const Bytes input{1, 2, 3};
  Seed seed{};
  seed.fill(0x42);

  Bytes joined = input;
  joined.insert(joined.end(), seed.begin(), seed.end());
  const double expected = hash_to_unit(sha256(joined));
  CHECK(neuron_forward(input, seed) == expected);
  CHECK(expected >= 0.0 && expected <= 1.0);

  Hash max_hash;
  max_hash.bytes.fill(0xFF);
  CHECK(hash_to_unit(max_hash) == 1.0);
  CHECK(hash_to_unit(Hash::zero()) == 0.0);
}

void floats_are_clamped_big_endian() {
  const Bytes out = floats_to_bytes({-0.5, 0.0, 1.0, 3.0});
  CHECK(out.size() == 32);
  CHECK(load_u64_be(out.data()) == 0U);
  CHECK(load_u64_be(out.data() + 8) == 0U);
  CHECK(load_u64_be(out.data() + 16) == std::numeric_limits<uint64_t>::max());
  CHECK(load_u64_be(out.data() + 24) == std::numeric_limits<uint64_t>::max());
  CHECK(floats_to_bytes({}).empty());
}

void argmax_keeps_first_tie() {
  const Prediction p = argmax({0.2, 0.9, 0.9, 0.1});
  CHECK(p.index == 1);
  CHECK(p.confidence == 0.9);
  CHECK(argmax({0.5}).index == 0);
  CHECK_HASH_ERROR(argmax({}), HashErrorKind::INVALID_INPUT);
}

void forward_matches_layers() {
  const HashNetwork net = small_network();
  const Bytes input = sample_input();

  std::vector<double> layer1;
  for (const auto& seed : net.seeds1) {
    layer1.push_back(neuron_forward(input, seed));
  }
  std::vector<double> layer2;
  for (const auto& seed : net.seeds2) {
    layer2.push_back(neuron_forward(floats_to_bytes(layer1), seed));
  }
  std::vector<double> out;
  for (const auto& seed : net.seeds_out) {
    out.push_back(neuron_forward(floats_to_bytes(layer2), seed));
  }

  CHECK(net.forward(input) == out);
  CHECK(net.predict(input).index == argmax(out).index);
}

void jitter_is_deterministic() {
  const Bytes input = sample_input();
  CHECK(apply_jitter(input, 0.0, 3) == input);
  CHECK(apply_jitter(input, 0.5, 3) == apply_jitter(input, 0.5, 3));
  CHECK(apply_jitter(input, 0.5, 3) != apply_jitter(input, 0.5, 4));
  CHECK(apply_jitter({}, 0.5, 1).empty());

  const Bytes saturated(64, 0xFF);
  const Bytes jittered = apply_jitter(saturated, 1.0, 9);
  CHECK(jittered.size() == saturated.size());
}

void rotation_is_an_involution() {
  const HashNetwork net = small_network();
  const HashNetwork once = net.rotated(5);
  CHECK(once.seeds1 != net.seeds1);
  CHECK(once.seeds1[0][0] == static_cast<uint8_t>(net.seeds1[0][0] ^ 5U));
  CHECK(once.seeds1[0][31] == static_cast<uint8_t>(net.seeds1[0][31] ^ 36U));

  const HashNetwork twice = once.rotated(5);
  CHECK(twice.seeds1 == net.seeds1);
  CHECK(twice.seeds2 == net.seeds2);
  CHECK(twice.seeds_out == net.seeds_out);
}

void engine_clamps_settings() {
  const HashNetwork net = small_network();
  RecursiveEngine clamped(net, nullptr, 0, 5.0);
  CHECK(clamped.passes() == 1);
  CHECK(clamped.jitter() == 1.0);
  CHECK(!clamped.is_using_hardware());

  RecursiveEngine negative(net, nullptr, 3, -0.2);
  CHECK(negative.jitter() == 0.0);

  RecursiveEngine not_a_number(net, nullptr, 3, std::numeric_limits<double>::quiet_NaN());
  CHECK(not_a_number.jitter() == kDefaultInferenceJitter);
}

void software_inference_is_repeatable() {
  const HashNetwork net = small_network();
  const Bytes input = sample_input();

  RecursiveEngine engine(net, nullptr, 9, 0.05);
  const RecursiveResult first = engine.infer(input);
  const RecursiveResult second = engine.infer(input);

  CHECK(first.total_passes == 9);
  CHECK(first.valid_passes == 9);
  CHECK(first.passes.size() == 9);
  for (size_t i = 0; i < first.passes.size(); ++i) {
    CHECK(first.passes[i].pass_number == i);
    CHECK(first.passes[i].prediction == second.passes[i].prediction);
    CHECK(first.passes[i].confidence == second.passes[i].confidence);
    CHECK(first.passes[i].prediction < net.output_size);
  }
  CHECK(first.consensus.prediction == second.consensus.prediction);
  CHECK(first.consensus.vote_count == 9);
  CHECK(first.consensus.confidence > 0.0 && first.consensus.confidence <= 1.0);

  RecursiveEngine still(net, nullptr, 4, 0.0);
  const auto result = still.infer(input);
  const Prediction direct = net.predict(input);
  for (const auto& pass : result.passes) {
    CHECK(pass.prediction == direct.index);
    CHECK(pass.confidence == direct.confidence);
  }
  CHECK(result.consensus.confidence == 1.0);
}

void engine_owns_its_network() {
  const Bytes input = sample_input();
  RecursiveEngine from_temporary(small_network(), nullptr, 3, 0.02);

  HashNetwork net = small_network();
  RecursiveEngine from_copy(net, nullptr, 3, 0.02);
  net.seeds_out.clear();
  net.seeds1[0].fill(0xEE);

  CHECK(from_copy.network().seeds_out.size() == 4);
  const auto a = from_temporary.infer(input);
  const auto b = from_copy.infer(input);
  CHECK(a.valid_passes == 3);
  for (size_t i = 0; i < a.passes.size(); ++i) {
    CHECK(a.passes[i].prediction == b.passes[i].prediction);
    CHECK(a.passes[i].confidence == b.passes[i].confidence);
  }
}

void rotation_uses_pass_index() {
  const HashNetwork net = small_network();
  const Bytes input = sample_input();

  RecursiveEngine rotating(net, nullptr, 3, 0.0, true);
  CHECK(rotating.seed_rotation());
  const auto result = rotating.infer(input);
  CHECK(result.passes[1].confidence == net.rotated(1).predict(input).confidence);
  CHECK(result.passes[2].prediction == net.rotated(2).predict(input).index);
  CHECK(net.seeds1 == small_network().seeds1);
}

void hardware_path_agrees_with_software() {
  const HashNetwork net = small_network();
  const Bytes input = sample_input();
  test::FakeHardwareMethod hardware;

  RecursiveEngine on_device(net, &hardware, 5, 0.02, true);
  RecursiveEngine on_host(net, nullptr, 5, 0.02, true);
  CHECK(on_device.is_using_hardware());

  const auto device_result = on_device.infer(input);
  const auto host_result = on_host.infer(input);
  CHECK(hardware.calls.load() == 15);
  for (size_t i = 0; i < 5; ++i) {
    CHECK(device_result.passes[i].prediction == host_result.passes[i].prediction);
    CHECK(device_result.passes[i].confidence == host_result.passes[i].confidence);
  }
}

void bridged_device_agrees_with_software() {
  test::FakeHardwareMethod backend;
  HashServerOptions options;
  options.listen_host = "127.0.0.1";
  options.listen_port = 0;
  HashServer server(backend, options);
  server.start();

  DirectDeviceMethod device(std::make_unique<DeviceBridge>(server.address()));
  CHECK(device.is_available());
  device.initialize();

  const HashNetwork net = small_network(11);
  const Bytes input = sample_input();
  RecursiveEngine remote(net, &device, 3, 0.01);
  RecursiveEngine local(net, nullptr, 3, 0.01);
  CHECK(remote.is_using_hardware());

  const auto remote_result = remote.infer(input);
  const auto local_result = local.infer(input);
  CHECK(remote_result.valid_passes == 3);
  for (size_t i = 0; i < 3; ++i) {
    CHECK(remote_result.passes[i].confidence == local_result.passes[i].confidence);
  }
  device.shutdown();
}

void failed_passes_are_skipped() {
  const HashNetwork net = small_network();
  test::FakeHardwareMethod flaky;
  flaky.fail_first_calls = 3;

  clear_log_lines();
  RecursiveEngine engine(net, &flaky, 5, 0.0);
  const auto result = engine.infer(sample_input());
  CHECK(result.total_passes == 5);
  CHECK(result.valid_passes == 2);
  CHECK(result.passes[0].pass_number == 3);
  CHECK(result.passes[1].pass_number == 4);
  CHECK(result.consensus.vote_count == 2);
  CHECK(test::log_contains("inference pass 0 skipped"));

  test::FakeHardwareMethod dead;
  dead.fail_first_calls = 1000;
  RecursiveEngine doomed(net, &dead, 3, 0.0);
  CHECK_THROWS_AS(doomed.infer(sample_input()), NoValidPassesError);
}

void broken_probe_falls_back_to_software() {
  const HashNetwork net = small_network();
  BrokenCapabilitiesMethod broken;
  RecursiveEngine engine(net, &broken, 2, 0.0);
  CHECK(!engine.is_using_hardware());
  CHECK(test::log_contains("hardware check failed"));
  CHECK(engine.infer(sample_input()).valid_passes == 2);

  SoftwareMethod software;
  software.initialize();
  RecursiveEngine plain(net, &software, 2, 0.0);
  CHECK(!plain.is_using_hardware());
}

void vote_ties_keep_first_leader() {
  const auto consensus = RecursiveEngine::aggregate(
    {pass_of(1, 0.4), pass_of(2, 0.6), pass_of(2, 0.8), pass_of(1, 0.2)});
  CHECK(consensus.prediction == 2);
  CHECK(consensus.mode == 2);
  CHECK(consensus.vote_count == 4);
  CHECK(near(consensus.confidence, 0.5));
  CHECK(near(consensus.average_confidence, 0.5));

  const auto early = RecursiveEngine::aggregate({pass_of(3, 0.1), pass_of(1, 0.1)});
  CHECK(early.prediction == 3);
  CHECK_THROWS_AS(RecursiveEngine::aggregate({}), NoValidPassesError);
}

void summary_reports_variance() {
  RecursiveResult result;
  result.passes = {pass_of(0, 0.2), pass_of(1, 0.4), pass_of(1, 0.6)};
  const auto stats = result.statistical_summary();
  CHECK(near(stats.mean_confidence, 0.4));
  CHECK(near(stats.confidence_variance, 0.08 / 3.0));
  CHECK(stats.class_distribution.at(0) == 1);
  CHECK(stats.class_distribution.at(1) == 2);

  const auto empty = RecursiveResult{}.statistical_summary();
  CHECK(empty.mean_confidence == 0.0);
  CHECK(empty.class_distribution.empty());
}

void advantages_are_normalized() {
  const auto adv = calculate_advantage({1.0, 2.0, 3.0});
  const double stddev = std::sqrt(2.0 / 3.0);
  CHECK(adv.size() == 3);
  CHECK(near(adv[0], -1.0 / stddev));
  CHECK(near(adv[1], 0.0));
  CHECK(near(adv[2], 1.0 / stddev));

  CHECK(calculate_advantage({5.0, 5.0}) == (std::vector<double>{0.0, 0.0}));
  CHECK(calculate_advantage({}).empty());
}

void advantages_center_and_rise_with_reward() {
  SplitMix64 rng(2024);
  for (int group = 0; group < 200; ++group) {
    const size_t n = 1 + static_cast<size_t>(rng.next() % 8U);
    std::vector<double> rewards(n);
    for (auto& r : rewards) {
      r = rng.next_unit() * 10.0 - 5.0;
    }

    const auto adv = calculate_advantage(rewards);
    CHECK(adv.size() == n);
    double sum = 0.0;
    for (const double a : adv) {
      sum += a;
    }
    CHECK(std::fabs(sum / static_cast<double>(n)) < 1e-9);

    for (size_t i = 0; i < n; ++i) {
      std::vector<double> raised = rewards;
      raised[i] += 0.01 + rng.next_unit() * 3.0;
      CHECK(calculate_advantage(raised)[i] >= adv[i] - 1e-9);
    }
  }

  // One reward moving past a block of equal rewards.
  double previous = -std::numeric_limits<double>::infinity();
  for (double r = -2.0; r <= 4.0; r += 0.25) {
    const double a = calculate_advantage({1.0, 1.0, 1.0, r})[3];
    CHECK(a >= previous - 1e-9);
    previous = a;
  }
}

void network_file_round_trip() {
  const HashNetwork net = small_network(21);
  const auto path = std::filesystem::temp_directory_path() / "hashrig_test_network.json";
  save_network(net, path);
  const HashNetwork loaded = load_network(path);
  std::filesystem::remove(path);

  CHECK(loaded.input_size == net.input_size);
  CHECK(loaded.seeds1 == net.seeds1);
  CHECK(loaded.seeds2 == net.seeds2);
  CHECK(loaded.seeds_out == net.seeds_out);
  CHECK(loaded.predict(sample_input()).index == net.predict(sample_input()).index);

  CHECK_THROWS_AS(load_network(path), ConfigError);

  JsonValue::object mismatched = network_to_json(net).as_object();
  mismatched["hidden1"] = JsonValue(uint64_t{3});
  CHECK_THROWS_AS(network_from_json(JsonValue(mismatched)), ConfigError);

  JsonValue::object bad_seed = network_to_json(net).as_object();
  bad_seed["seeds_out"] = JsonValue(JsonValue::array{JsonValue("00ff")});
  CHECK_THROWS_AS(network_from_json(JsonValue(bad_seed)), ConfigError);
}

} // namespace

int main() {
  return hashrig::test::run_cases("inference", {
    {"random_networks_are_reproducible", random_networks_are_reproducible},
    {"neuron_reads_hash_prefix", neuron_reads_hash_prefix},
    {"floats_are_clamped_big_endian", floats_are_clamped_big_endian},
    {"argmax_keeps_first_tie", argmax_keeps_first_tie},
    {"forward_matches_layers", forward_matches_layers},
    {"jitter_is_deterministic", jitter_is_deterministic},
    {"rotation_is_an_involution", rotation_is_an_involution},
    {"engine_clamps_settings", engine_clamps_settings},
    {"software_inference_is_repeatable", software_inference_is_repeatable},
    {"engine_owns_its_network", engine_owns_its_network},
    {"rotation_uses_pass_index", rotation_uses_pass_index},
    {"hardware_path_agrees_with_software", hardware_path_agrees_with_software},
    {"bridged_device_agrees_with_software", bridged_device_agrees_with_software},
    {"failed_passes_are_skipped", failed_passes_are_skipped},
    {"broken_probe_falls_back_to_software", broken_probe_falls_back_to_software},
    {"vote_ties_keep_first_leader", vote_ties_keep_first_leader},
    {"summary_reports_variance", summary_reports_variance},
    {"advantages_are_normalized", advantages_are_normalized},
    {"advantages_center_and_rise_with_reward", advantages_center_and_rise_with_reward},
    {"network_file_round_trip", network_file_round_trip},
  });
}
