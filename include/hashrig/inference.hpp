#pragma once

#include "hashrig/hash_method.hpp"
#include "hashrig/network.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace hashrig {

constexpr uint32_t kDefaultInferencePasses = 21;
constexpr double kDefaultInferenceJitter = 0.01;

struct InferencePass {
  uint32_t pass_number = 0;
  size_t prediction = 0;
  double confidence = 0.0;
  // Time since the start of infer() when the pass finished.
  std::chrono::microseconds latency{0};
  std::chrono::microseconds pass_latency{0};
};

struct ConsensusResult {
  size_t prediction = 0;
  // Votes for the winner over valid passes.
  double confidence = 0.0;
  double average_confidence = 0.0;
  size_t vote_count = 0;
  size_t mode = 0;
};

struct StatisticalSummary {
  double mean_confidence = 0.0;
  double confidence_variance = 0.0;
  std::map<size_t, size_t> class_distribution;
};

struct RecursiveResult {
  std::vector<InferencePass> passes;
  ConsensusResult consensus;
  std::chrono::microseconds latency{0};
  size_t valid_passes = 0;
  size_t total_passes = 0;

  StatisticalSummary statistical_summary() const;
};

// Runs the network over several jittered passes and votes on the result.
// With a hardware-backed method each layer is one compute_batch call;
// otherwise the network is evaluated in software. The engine keeps its own
// copy of the network and never modifies it.
class RecursiveEngine {
public:
  RecursiveEngine(HashNetwork network, HashMethod* method, uint32_t passes = kDefaultInferencePasses,
                  double jitter = kDefaultInferenceJitter, bool seed_rotation = false);

  uint32_t passes() const { return passes_; }
  double jitter() const { return jitter_; }
  bool seed_rotation() const { return seed_rotation_; }
  const HashNetwork& network() const { return network_; }

  bool is_using_hardware() const;

  // Throws NoValidPassesError when every pass failed.
  RecursiveResult infer(const Bytes& input) const;

  static ConsensusResult aggregate(const std::vector<InferencePass>& passes);

private:
  Prediction run_pass(const Bytes& input, uint32_t pass) const;
  Prediction run_hardware(const HashNetwork& network, const Bytes& input) const;
  std::vector<double> hardware_layer(const Bytes& input, const std::vector<Seed>& seeds) const;

  HashNetwork network_;
  HashMethod* method_;
  uint32_t passes_;
  double jitter_;
  bool seed_rotation_;
};

// Deterministic per-byte perturbation seeded by the pass index. jitter == 0
// returns the input unchanged.
Bytes apply_jitter(const Bytes& input, double jitter, uint32_t pass);

// Group-normalized advantages: (r - mean) / stddev, or r - mean when all
// rewards are equal.
std::vector<double> calculate_advantage(const std::vector<double>& rewards);

} // namespace hashrig
