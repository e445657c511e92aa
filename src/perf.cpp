#include "hashrig/perf.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifdef HASHRIG_HAVE_HWLOC
#include <hwloc.h>
#endif

namespace hashrig {

namespace {

struct TopologyData {
  std::string source = "fallback";
  uint32_t logical_cpus = 0;
  uint32_t physical_cores = 0;
  std::vector<AcceleratorDevice> accelerators;
  bool accelerators_probed = false;
};

std::once_flag g_topology_once;
TopologyData g_topology;

uint32_t logical_cpu_count_fallback() {
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1U : hw;
}

#ifdef HASHRIG_HAVE_HWLOC
bool build_topology_hwloc(TopologyData* data) {
  hwloc_topology_t topology = nullptr;
  if (hwloc_topology_init(&topology) != 0 || topology == nullptr) {
    return false;
  }

  // OS devices (GPUs, co-processors) are filtered out of the default topology.
  (void)hwloc_topology_set_io_types_filter(topology, HWLOC_TYPE_FILTER_KEEP_IMPORTANT);

  if (hwloc_topology_load(topology) != 0) {
    hwloc_topology_destroy(topology);
    return false;
  }

  const int pu_count = hwloc_get_nbobjs_by_type(topology, HWLOC_OBJ_PU);
  const int core_count = hwloc_get_nbobjs_by_type(topology, HWLOC_OBJ_CORE);
  if (pu_count <= 0) {
    hwloc_topology_destroy(topology);
    return false;
  }

  data->logical_cpus = static_cast<uint32_t>(pu_count);
  data->physical_cores = core_count > 0 ? static_cast<uint32_t>(core_count) : data->logical_cpus;

  for (hwloc_obj_t obj = hwloc_get_next_osdev(topology, nullptr);
       obj != nullptr;
       obj = hwloc_get_next_osdev(topology, obj)) {
    if (obj->attr == nullptr) {
      continue;
    }
    const auto type = obj->attr->osdev.type;
    if (type != HWLOC_OBJ_OSDEV_GPU && type != HWLOC_OBJ_OSDEV_COPROC) {
      continue;
    }

    AcceleratorDevice device;
    device.name = obj->name == nullptr ? "" : obj->name;
    device.kind = type == HWLOC_OBJ_OSDEV_GPU ? "gpu" : "coproc";
    if (const char* vendor = hwloc_obj_get_info_by_name(obj, "GPUVendor")) {
      device.vendor = vendor;
    }
    if (const char* model = hwloc_obj_get_info_by_name(obj, "GPUModel")) {
      device.model = model;
    }
    data->accelerators.push_back(std::move(device));
  }

  data->accelerators_probed = true;
  data->source = "hwloc";
  hwloc_topology_destroy(topology);
  return true;
}
#endif

#if defined(__linux__)
bool parse_linux_cpu_index(const std::string& name, uint32_t* out) {
  if (name.size() < 4 || name.rfind("cpu", 0) != 0) {
    return false;
  }
  const std::string suffix = name.substr(3);
  if (!std::all_of(suffix.begin(), suffix.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
    return false;
  }
  *out = static_cast<uint32_t>(std::stoul(suffix));
  return true;
}

bool read_linux_topology_int(const std::filesystem::path& path, int* out) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  in >> *out;
  return in.good() || in.eof();
}

bool build_topology_linux(TopologyData* data) {
  std::set<std::pair<int, int>> cores;
  uint32_t logical = 0;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/sys/devices/system/cpu", ec)) {
    uint32_t cpu_index = 0;
    if (!entry.is_directory(ec) || !parse_linux_cpu_index(entry.path().filename().string(), &cpu_index)) {
      continue;
    }

    int core_id = static_cast<int>(cpu_index);
    int package_id = 0;
    (void)read_linux_topology_int(entry.path() / "topology" / "core_id", &core_id);
    (void)read_linux_topology_int(entry.path() / "topology" / "physical_package_id", &package_id);
    cores.emplace(package_id, core_id);
    ++logical;
  }

  if (logical == 0) {
    return false;
  }

  data->source = "linux-sysfs";
  data->logical_cpus = logical;
  data->physical_cores = static_cast<uint32_t>(cores.size());
  return true;
}

// Without hwloc, GPU presence is inferred from vendor device nodes.
void probe_linux_accelerators(TopologyData* data) {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/dev", ec)) {
    const std::string name = entry.path().filename().string();
    const bool nvidia = name.rfind("nvidia", 0) == 0 && name.size() > 6 &&
                        std::all_of(name.begin() + 6, name.end(), [](char ch) { return ch >= '0' && ch <= '9'; });
    if (nvidia) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());

  for (const auto& name : names) {
    AcceleratorDevice device;
    device.name = name;
    device.kind = "gpu";
    device.vendor = "NVIDIA";
    data->accelerators.push_back(std::move(device));
  }
  data->accelerators_probed = true;
}
#endif

const TopologyData& topology() {
  std::call_once(g_topology_once, []() {
    TopologyData data;
    bool built = false;
#ifdef HASHRIG_HAVE_HWLOC
    built = build_topology_hwloc(&data);
#endif
#if defined(__linux__)
    if (!built) {
      built = build_topology_linux(&data);
    }
    if (!data.accelerators_probed) {
      probe_linux_accelerators(&data);
    }
#endif
    if (!built || data.logical_cpus == 0) {
      data.source = "fallback";
      data.logical_cpus = logical_cpu_count_fallback();
      data.physical_cores = data.logical_cpus;
    }
    g_topology = std::move(data);
  });
  return g_topology;
}

} // namespace

uint32_t logical_cpu_count() {
  return topology().logical_cpus;
}

uint32_t physical_cpu_count() {
  const auto& data = topology();
  return data.physical_cores == 0 ? data.logical_cpus : data.physical_cores;
}

uint32_t recommended_hash_lanes() {
  return std::max<uint32_t>(1U, logical_cpu_count());
}

std::vector<AcceleratorDevice> detect_accelerators() {
  return topology().accelerators;
}

std::string topology_source() {
  return topology().source;
}

std::string cpu_runtime_summary() {
  const char* arch = "unknown";
#if defined(__x86_64__) || defined(_M_X64)
  arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  arch = "arm64";
#elif defined(__arm__) || defined(_M_ARM)
  arch = "arm";
#endif

  std::ostringstream out;
  out << "arch=" << arch
      << " physical=" << physical_cpu_count()
      << " logical=" << logical_cpu_count()
      << " accelerators=" << topology().accelerators.size()
      << " topology_source=" << topology_source();
  return out.str();
}

} // namespace hashrig
