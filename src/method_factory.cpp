#include "hashrig/method_factory.hpp"

#include "hashrig/errors.hpp"
#include "hashrig/hash_methods.hpp"
#include "hashrig/log.hpp"

#include <algorithm>
#include <exception>

namespace hashrig {

namespace {

std::vector<std::string> normalize_order(const std::vector<std::string>& order) {
  std::vector<std::string> out;
  out.reserve(order.size());
  for (const auto& name : order) {
    std::string canonical = canonical_method_name(name);
    if (std::find(out.begin(), out.end(), canonical) == out.end()) {
      out.push_back(std::move(canonical));
    }
  }
  return out;
}

} // namespace

std::vector<std::string> default_method_order() {
  return {kDirectDeviceMethod, kSoftwareMethod, kGpuSimMethod, kUbpfSimMethod, kEbpfSimMethod};
}

std::vector<std::string> training_method_order() {
  return {kGpuSimMethod, kDirectDeviceMethod, kSoftwareMethod, kUbpfSimMethod, kEbpfSimMethod};
}

HashMethodConfig default_hash_method_config() {
  HashMethodConfig config;
  config.preferred_order = default_method_order();
  return config;
}

HashMethodConfig training_hash_method_config() {
  HashMethodConfig config;
  config.preferred_order = training_method_order();
  config.training_mode = true;
  return config;
}

HashMethodFactory::HashMethodFactory(HashMethodConfig config)
  : config_(std::move(config)) {
  if (config_.preferred_order.empty()) {
    order_ = config_.training_mode ? training_method_order() : default_method_order();
  } else {
    order_ = normalize_order(config_.preferred_order);
  }

  build_methods();
  detect_all();
  select_best();
}

HashMethodFactory::~HashMethodFactory() {
  try {
    shutdown_all();
  } catch (const std::exception& ex) {
    log_warn(std::string("hash method shutdown failed: ") + ex.what());
  }
}

void HashMethodFactory::build_methods() {
  methods_.clear();
  methods_.push_back(std::make_unique<DirectDeviceMethod>(config_.device_address, config_.device_path, config_.device_timeouts));
  methods_.push_back(std::make_unique<SoftwareMethod>());
  methods_.push_back(std::make_unique<GpuSimulatorMethod>(config_.gpu_device));
  methods_.push_back(std::make_unique<KernelFilterMethod>(KernelFilterKind::UBPF));
  methods_.push_back(std::make_unique<KernelFilterMethod>(KernelFilterKind::EBPF));
}

void HashMethodFactory::detect_all() {
  availability_.assign(methods_.size(), false);
  for (size_t i = 0; i < methods_.size(); ++i) {
    try {
      availability_[i] = methods_[i]->detect();
    } catch (const std::exception& ex) {
      log_warn("detection of " + methods_[i]->name() + " failed: " + ex.what());
    }
    log_debug("detected " + methods_[i]->name() + (availability_[i] ? " available" : " unavailable"));
  }
}

void HashMethodFactory::select_best() {
  best_ = nullptr;
  forced_fallback_ = false;

  for (const auto& name : order_) {
    for (size_t i = 0; i < methods_.size(); ++i) {
      if (methods_[i]->name() == name && availability_[i] && methods_[i]->is_available()) {
        best_ = methods_[i].get();
        break;
      }
    }
    if (best_ != nullptr) {
      break;
    }
  }

  if (best_ == nullptr) {
    best_ = method(kSoftwareMethod);
    forced_fallback_ = true;
    log_warn("no preferred hash method available, forcing software fallback");
  }
  log_info("selected hash method: " + best_->name());
}

HashMethod* HashMethodFactory::method(const std::string& name) const {
  const std::string canonical = canonical_method_name(name);
  for (const auto& m : methods_) {
    if (m->name() == canonical) {
      return m.get();
    }
  }
  return nullptr;
}

std::vector<HashMethod*> HashMethodFactory::all_methods() const {
  std::vector<HashMethod*> out;
  out.reserve(methods_.size());
  for (const auto& m : methods_) {
    out.push_back(m.get());
  }
  return out;
}

std::vector<HashMethod*> HashMethodFactory::available_methods() const {
  std::vector<HashMethod*> out;
  for (size_t i = 0; i < methods_.size(); ++i) {
    if (availability_[i]) {
      out.push_back(methods_[i].get());
    }
  }
  return out;
}

int HashMethodFactory::priority_of(const std::string& name) const {
  const auto it = std::find(order_.begin(), order_.end(), name);
  if (it == order_.end()) {
    return kUnlistedMethodPriority;
  }
  return static_cast<int>(it - order_.begin());
}

std::string HashMethodFactory::describe(const HashMethod& method) const {
  const std::string name = method.name();
  if (name == kDirectDeviceMethod) {
    std::string text = "hash-compute device via bridge";
    if (!config_.external_tool_path.empty()) {
      text += ", tool " + config_.external_tool_path;
    }
    return text;
  }
  if (name == kSoftwareMethod) {
    return "host SHA-256 fallback";
  }
  if (name == kGpuSimMethod) {
    return "GPU simulator for training";
  }
  if (name == kUbpfSimMethod) {
    return "userspace packet-filter simulator";
  }
  return "kernel packet-filter simulator";
}

DetectionReport HashMethodFactory::detection_report() const {
  std::vector<size_t> indices(methods_.size());
  for (size_t i = 0; i < indices.size(); ++i) {
    indices[i] = i;
  }
  std::stable_sort(indices.begin(), indices.end(), [this](size_t a, size_t b) {
    return priority_of(methods_[a]->name()) < priority_of(methods_[b]->name());
  });

  DetectionReport report;
  report.best_method = best_ != nullptr ? best_->name() : std::string();
  report.forced_fallback = forced_fallback_;
  report.total_methods = methods_.size();

  for (const size_t i : indices) {
    MethodStatus status;
    status.name = methods_[i]->name();
    status.available = availability_[i];
    status.priority = priority_of(status.name);
    status.capabilities = methods_[i]->capabilities();
    status.description = describe(*methods_[i]);
    if (status.available) {
      ++report.available_count;
    }
    report.methods.push_back(std::move(status));
  }
  return report;
}

HashMethod& HashMethodFactory::initialize_best_method() {
  if (forced_fallback_ && !config_.allow_fallback) {
    throw HashError(HashErrorKind::HARDWARE_UNAVAILABLE,
                    "no preferred hash method available and fallback is disabled");
  }
  best_->initialize();
  return *best_;
}

void HashMethodFactory::shutdown_all() {
  std::string failures;
  for (const auto& m : methods_) {
    try {
      m->shutdown();
    } catch (const std::exception& ex) {
      if (!failures.empty()) {
        failures += "; ";
      }
      failures += m->name() + ": " + ex.what();
    }
  }
  if (!failures.empty()) {
    throw HashError(HashErrorKind::OPERATION_FAILED, "shutdown failed: " + failures);
  }
}

void HashMethodFactory::reinitialize_detection() {
  try {
    shutdown_all();
  } catch (const HashError& ex) {
    log_warn(std::string("re-detection: ") + ex.what());
  }
  best_ = nullptr;
  build_methods();
  detect_all();
  select_best();
}

void HashMethodFactory::register_device(std::unique_ptr<DeviceBridge> bridge) {
  if (!bridge) {
    throw HashError(HashErrorKind::INVALID_INPUT, "register_device needs a bridge");
  }

  for (size_t i = 0; i < methods_.size(); ++i) {
    if (methods_[i]->name() != kDirectDeviceMethod) {
      continue;
    }
    const std::string address = bridge->address();
    try {
      methods_[i]->shutdown();
    } catch (const std::exception& ex) {
      log_warn("direct-device shutdown before replacement failed: " + std::string(ex.what()));
    }
    best_ = nullptr;
    methods_[i] = std::make_unique<DirectDeviceMethod>(std::move(bridge), config_.device_path);
    availability_[i] = methods_[i]->is_available();
    log_info("registered device " + address + (availability_[i] ? "" : " (unavailable)"));
    break;
  }
  select_best();
}

} // namespace hashrig
