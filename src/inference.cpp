#include "hashrig/inference.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/log.hpp"
#include "hashrig/rng.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace hashrig {

namespace {

std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

Bytes apply_jitter(const Bytes& input, double jitter, uint32_t pass) {
  if (jitter == 0.0) {
    return input;
  }

  SplitMix64 rng(pass);
  Bytes out = input;
  for (auto& byte : out) {
    const int a = static_cast<int>(rng.next_unit() * jitter * 255.0);
    const int b = static_cast<int>(rng.next_unit() * jitter * 255.0);
    const int value = static_cast<int>(byte) + (a - b);
    byte = static_cast<uint8_t>(std::clamp(value, 0, 255));
  }
  return out;
}

std::vector<double> calculate_advantage(const std::vector<double>& rewards) {
  if (rewards.empty()) {
    return {};
  }

  double mean = 0.0;
  for (const double r : rewards) {
    mean += r;
  }
  mean /= static_cast<double>(rewards.size());

  double variance = 0.0;
  for (const double r : rewards) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(rewards.size());
  const double stddev = std::sqrt(variance);

  std::vector<double> out;
  out.reserve(rewards.size());
  for (const double r : rewards) {
    out.push_back(stddev > 0.0 ? (r - mean) / stddev : r - mean);
  }
  return out;
}

StatisticalSummary RecursiveResult::statistical_summary() const {
  StatisticalSummary summary;
  if (passes.empty()) {
    return summary;
  }

  for (const auto& pass : passes) {
    summary.mean_confidence += pass.confidence;
    ++summary.class_distribution[pass.prediction];
  }
  summary.mean_confidence /= static_cast<double>(passes.size());

  for (const auto& pass : passes) {
    const double diff = pass.confidence - summary.mean_confidence;
    summary.confidence_variance += diff * diff;
  }
  summary.confidence_variance /= static_cast<double>(passes.size());
  return summary;
}

RecursiveEngine::RecursiveEngine(HashNetwork network, HashMethod* method, uint32_t passes, double jitter,
                                 bool seed_rotation)
  : network_(std::move(network)),
    method_(method),
    passes_(std::max<uint32_t>(1U, passes)),
    jitter_(std::isnan(jitter) ? kDefaultInferenceJitter : std::clamp(jitter, 0.0, 1.0)),
    seed_rotation_(seed_rotation) {}

bool RecursiveEngine::is_using_hardware() const {
  if (method_ == nullptr) {
    return false;
  }
  try {
    return method_->is_available() && method_->capabilities().is_hardware;
  } catch (const std::exception& ex) {
    log_warn(std::string("hardware check failed, using software: ") + ex.what());
    return false;
  }
}

RecursiveResult RecursiveEngine::infer(const Bytes& input) const {
  const auto start = std::chrono::steady_clock::now();

  RecursiveResult result;
  result.total_passes = passes_;
  result.passes.reserve(passes_);

  for (uint32_t pass = 0; pass < passes_; ++pass) {
    const auto pass_start = std::chrono::steady_clock::now();
    try {
      const Prediction prediction = run_pass(input, pass);

      InferencePass record;
      record.pass_number = pass;
      record.prediction = prediction.index;
      record.confidence = prediction.confidence;
      record.pass_latency = elapsed_since(pass_start);
      record.latency = elapsed_since(start);
      result.passes.push_back(record);
    } catch (const std::exception& ex) {
      log_warn("inference pass " + std::to_string(pass) + " skipped: " + ex.what());
    }
  }

  if (result.passes.empty()) {
    throw NoValidPassesError();
  }

  result.valid_passes = result.passes.size();
  result.consensus = aggregate(result.passes);
  result.latency = elapsed_since(start);
  return result;
}

Prediction RecursiveEngine::run_pass(const Bytes& input, uint32_t pass) const {
  const Bytes jittered = apply_jitter(input, jitter_, pass);

  // The rotated copy lives only for this pass.
  if (seed_rotation_) {
    const HashNetwork rotated = network_.rotated(pass);
    return is_using_hardware() ? run_hardware(rotated, jittered) : rotated.predict(jittered);
  }
  return is_using_hardware() ? run_hardware(network_, jittered) : network_.predict(jittered);
}

std::vector<double> RecursiveEngine::hardware_layer(const Bytes& input, const std::vector<Seed>& seeds) const {
  std::vector<Bytes> jobs;
  jobs.reserve(seeds.size());
  for (const auto& seed : seeds) {
    Bytes job;
    job.reserve(input.size() + seed.size());
    job.insert(job.end(), input.begin(), input.end());
    job.insert(job.end(), seed.begin(), seed.end());
    jobs.push_back(std::move(job));
  }

  const auto hashes = method_->compute_batch(jobs);
  if (hashes.size() != seeds.size()) {
    throw HashError(HashErrorKind::OPERATION_FAILED,
                    "layer returned " + std::to_string(hashes.size()) + " hashes for " +
                      std::to_string(seeds.size()) + " seeds");
  }

  std::vector<double> out;
  out.reserve(hashes.size());
  for (const auto& hash : hashes) {
    out.push_back(hash_to_unit(hash));
  }
  return out;
}

Prediction RecursiveEngine::run_hardware(const HashNetwork& network, const Bytes& input) const {
  const auto layer1 = hardware_layer(input, network.seeds1);
  const auto layer2 = hardware_layer(floats_to_bytes(layer1), network.seeds2);
  return argmax(hardware_layer(floats_to_bytes(layer2), network.seeds_out));
}

ConsensusResult RecursiveEngine::aggregate(const std::vector<InferencePass>& passes) {
  if (passes.empty()) {
    throw NoValidPassesError();
  }

  std::map<size_t, size_t> votes;
  size_t max_votes = 0;
  size_t mode = 0;
  double total_confidence = 0.0;

  for (const auto& pass : passes) {
    const size_t count = ++votes[pass.prediction];
    // Strictly greater: a tie keeps the class that reached the count first.
    if (count > max_votes) {
      max_votes = count;
      mode = pass.prediction;
    }
    total_confidence += pass.confidence;
  }

  ConsensusResult consensus;
  consensus.prediction = mode;
  consensus.mode = mode;
  consensus.vote_count = passes.size();
  consensus.confidence = static_cast<double>(max_votes) / static_cast<double>(passes.size());
  consensus.average_confidence = total_confidence / static_cast<double>(passes.size());
  return consensus;
}

} // namespace hashrig
