#pragma once

#include "hashrig/discovery.hpp"
#include "hashrig/inference.hpp"
#include "hashrig/method_factory.hpp"

#include <string>
#include <vector>

namespace hashrig {

std::string human_hashrate(double rate);
std::string pad_right(const std::string& text, size_t width);

std::string detection_summary(const DetectionReport& report, bool colorful = false);
std::string discovery_summary(const std::vector<DiscoveryResult>& results, bool colorful = false);
std::string inference_summary(const RecursiveResult& result, bool show_passes = true);

} // namespace hashrig
