#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hashrig {

struct AcceleratorDevice {
  std::string name;
  std::string kind; // gpu | coproc
  std::string vendor;
  std::string model;
};

uint32_t logical_cpu_count();
uint32_t physical_cpu_count();
// Worker count for parallel hashing lanes; never zero.
uint32_t recommended_hash_lanes();

// GPU and co-processor OS devices, in enumeration order.
std::vector<AcceleratorDevice> detect_accelerators();

std::string topology_source();
std::string cpu_runtime_summary();

} // namespace hashrig
