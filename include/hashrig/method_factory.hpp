#pragma once

#include "hashrig/device_bridge.hpp"
#include "hashrig/hash_method.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hashrig {

constexpr int kUnlistedMethodPriority = 999;

struct HashMethodConfig {
  // Empty means the default (or training) order.
  std::vector<std::string> preferred_order;
  std::string device_path = "/dev/hashrig0";
  std::string device_address = "localhost:8888";
  std::string external_tool_path;
  int gpu_device = 0;
  bool allow_fallback = true;
  bool training_mode = false;
  BridgeTimeouts device_timeouts;
};

HashMethodConfig default_hash_method_config();
HashMethodConfig training_hash_method_config();
std::vector<std::string> default_method_order();
std::vector<std::string> training_method_order();

struct MethodStatus {
  std::string name;
  bool available = false;
  int priority = kUnlistedMethodPriority;
  Capabilities capabilities;
  std::string description;
};

struct DetectionReport {
  std::vector<MethodStatus> methods;
  std::string best_method;
  size_t total_methods = 0;
  size_t available_count = 0;
  bool forced_fallback = false;
};

// Pointers handed out are invalidated by reinitialize_detection() and
// register_device().
class HashMethodFactory {
public:
  explicit HashMethodFactory(HashMethodConfig config = default_hash_method_config());
  ~HashMethodFactory();

  HashMethodFactory(const HashMethodFactory&) = delete;
  HashMethodFactory& operator=(const HashMethodFactory&) = delete;

  const HashMethodConfig& config() const { return config_; }
  const std::vector<std::string>& priority_order() const { return order_; }

  HashMethod* best_method() const { return best_; }
  bool used_forced_fallback() const { return forced_fallback_; }

  HashMethod* method(const std::string& name) const;
  std::vector<HashMethod*> all_methods() const;
  std::vector<HashMethod*> available_methods() const;

  DetectionReport detection_report() const;

  HashMethod& initialize_best_method();
  void shutdown_all();
  void reinitialize_detection();

  void register_device(std::unique_ptr<DeviceBridge> bridge);

private:
  void build_methods();
  void detect_all();
  void select_best();
  int priority_of(const std::string& name) const;
  std::string describe(const HashMethod& method) const;

  HashMethodConfig config_;
  std::vector<std::string> order_;
  std::vector<std::unique_ptr<HashMethod>> methods_;
  std::vector<bool> availability_;
  HashMethod* best_ = nullptr;
  bool forced_fallback_ = false;
};

} // namespace hashrig
