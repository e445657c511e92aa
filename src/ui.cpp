#include "hashrig/ui.hpp"

#include <iomanip>
#include <sstream>

namespace hashrig {

namespace {

std::string colorize(const std::string& text, const char* code, bool enabled) {
  if (!enabled) {
    return text;
  }
  return std::string(code) + text + "\x1b[0m";
}

std::string fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

std::string rule(size_t width) {
  return std::string(width, '-') + '\n';
}

} // namespace

std::string human_hashrate(double rate) {
  static constexpr const char* suffixes[] = {"H/s", "KH/s", "MH/s", "GH/s", "TH/s"};
  size_t suffix_idx = 0;

  while (rate >= 1000.0 && suffix_idx + 1 < (sizeof(suffixes) / sizeof(suffixes[0]))) {
    rate /= 1000.0;
    ++suffix_idx;
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << rate << ' ' << suffixes[suffix_idx];
  return oss.str();
}

std::string pad_right(const std::string& text, size_t width) {
  if (text.size() >= width) {
    return text;
  }
  return text + std::string(width - text.size(), ' ');
}

std::string detection_summary(const DetectionReport& report, bool colorful) {
  constexpr size_t kWidth = 96;
  std::ostringstream out;

  out << "Hash methods (" << report.available_count << " of " << report.total_methods << " available)\n";
  out << rule(kWidth);
  out << pad_right("Prio", 6) << pad_right("Method", 16) << pad_right("Status", 13) << pad_right("Rate", 14)
      << pad_right("Kind", 10) << "Notes\n";
  out << rule(kWidth);

  for (const auto& status : report.methods) {
    const auto& caps = status.capabilities;
    const std::string prio = status.priority == kUnlistedMethodPriority ? "-" : std::to_string(status.priority);
    const std::string state = status.available
      ? colorize(pad_right("available", 13), "\x1b[32m", colorful)
      : colorize(pad_right("unavailable", 13), "\x1b[90m", colorful);
    const std::string kind = caps.is_hardware ? "hardware" : (caps.training_optimized ? "training" : "software");
    std::string notes = status.description;
    if (!status.available && !caps.reason.empty()) {
      notes += " (" + caps.reason + ")";
    }

    out << pad_right(prio, 6) << pad_right(status.name, 16) << state << pad_right(human_hashrate(caps.hash_rate), 14)
        << pad_right(kind, 10) << notes << '\n';
  }

  out << rule(kWidth);
  out << "Selected: " << colorize(report.best_method, "\x1b[1m", colorful);
  if (report.forced_fallback) {
    out << colorize(" (forced fallback)", "\x1b[33m", colorful);
  }
  out << '\n';
  return out.str();
}

std::string discovery_summary(const std::vector<DiscoveryResult>& results, bool colorful) {
  constexpr size_t kWidth = 88;
  std::ostringstream out;

  out << pad_right("Address", 24) << pad_right("Status", 10) << pad_right("Chips", 8) << pad_right("Latency", 12)
      << "Firmware / error\n";
  out << rule(kWidth);
  for (const auto& result : results) {
    out << pad_right(result.address, 24)
        << (result.responding ? colorize(pad_right("up", 10), "\x1b[32m", colorful) : pad_right("down", 10))
        << pad_right(result.responding ? std::to_string(result.chip_count) : "-", 8)
        << pad_right(fixed(result.latency_ms, 1) + " ms", 12)
        << (result.responding ? result.firmware_version : result.error) << '\n';
  }
  out << rule(kWidth);

  const auto best = find_best_server(results);
  if (best.has_value()) {
    out << "Best server: " << best->address << " (" << best->chip_count << " chips, " << fixed(best->latency_ms, 1)
        << " ms)\n";
  } else {
    out << "No devices found\n";
  }
  return out.str();
}

std::string inference_summary(const RecursiveResult& result, bool show_passes) {
  std::ostringstream out;

  if (show_passes) {
    out << pad_right("Pass", 6) << pad_right("Class", 8) << pad_right("Confidence", 12) << "Latency\n";
    for (const auto& pass : result.passes) {
      out << pad_right(std::to_string(pass.pass_number), 6) << pad_right(std::to_string(pass.prediction), 8)
          << pad_right(fixed(pass.confidence, 4), 12) << pass.pass_latency.count() << " us\n";
    }
    out << '\n';
  }

  const auto& c = result.consensus;
  const auto stats = result.statistical_summary();
  out << "Consensus: class " << c.prediction << " with " << fixed(c.confidence * 100.0, 1) << "% of "
      << c.vote_count << " votes\n";
  out << "Average confidence: " << fixed(c.average_confidence, 4) << " (variance " << fixed(stats.confidence_variance, 6)
      << ")\n";
  out << "Valid passes: " << result.valid_passes << "/" << result.total_passes << "  total " << result.latency.count()
      << " us\n";
  out << "Distribution:";
  for (const auto& [cls, count] : stats.class_distribution) {
    out << ' ' << cls << '=' << count;
  }
  out << '\n';
  return out.str();
}

} // namespace hashrig
