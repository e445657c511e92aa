#pragma once

#include "hashrig/crypto.hpp"
#include "hashrig/errors.hpp"
#include "hashrig/hash_method.hpp"
#include "hashrig/log.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace hashrig::test {

class Failure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using Case = std::pair<const char*, std::function<void()>>;

inline int run_cases(const char* suite, const std::vector<Case>& cases) {
  set_log_echo(false);
  int failures = 0;
  for (const auto& [name, fn] : cases) {
    try {
      fn();
      std::cout << "PASS " << suite << "." << name << '\n';
    } catch (const std::exception& ex) {
      ++failures;
      std::cout << "FAIL " << suite << "." << name << ": " << ex.what() << '\n';
    }
  }
  std::cout << suite << ": " << (cases.size() - static_cast<size_t>(failures)) << "/" << cases.size() << " passed\n";
  return failures == 0 ? 0 : 1;
}

inline bool log_contains(const std::string& needle) {
  for (const auto& line : recent_log_lines()) {
    if (line.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// Hardware-flavored backend that hashes on the host, for exercising the
// hardware code paths without a device.
class FakeHardwareMethod : public HashMethod {
public:
  std::string name() const override { return "fake-hardware"; }
  bool detect() override { return true; }
  bool is_available() const override { return true; }
  Capabilities capabilities() const override {
    Capabilities caps;
    caps.name = name();
    caps.is_hardware = true;
    caps.production_ready = true;
    caps.hash_rate = 1.0e9;
    caps.max_batch_size = 256;
    HardwareInfo hw;
    hw.device_path = "/dev/fake-hasher";
    hw.chip_count = 8;
    hw.version = "fake-1";
    hw.connection_type = "usb";
    caps.hardware = hw;
    return caps;
  }
  void initialize() override {}
  void shutdown() override {}

  Hash compute_hash(const Bytes& data) override {
    ++calls;
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    return sha256(data);
  }

  std::vector<Hash> compute_batch(const std::vector<Bytes>& items) override {
    const uint32_t call = ++calls;
    if (call <= fail_first_calls) {
      throw HashError(HashErrorKind::OPERATION_FAILED, "injected failure on call " + std::to_string(call));
    }
    std::vector<Hash> out;
    out.reserve(items.size());
    for (const auto& item : items) {
      out.push_back(sha256(item));
    }
    return out;
  }

  std::optional<uint64_t> mine_header(const Bytes& header, uint64_t start_nonce, uint64_t max_tries) override {
    const JobBytes job = require_valid_header(header);
    return search_nonce_range(job, start_nonce, nonce_range_end(start_nonce, max_tries));
  }

  std::atomic<uint32_t> calls{0};
  uint32_t fail_first_calls = 0;
  std::chrono::milliseconds delay{0};
};

} // namespace hashrig::test

#define CHECK(cond)                                                                                 \
  do {                                                                                              \
    if (!(cond)) {                                                                                  \
      throw ::hashrig::test::Failure(std::string(__FILE__) + ":" + std::to_string(__LINE__) +      \
                                     ": CHECK(" #cond ") failed");                                  \
    }                                                                                               \
  } while (0)

#define CHECK_THROWS_AS(expr, type)                                                                 \
  do {                                                                                              \
    bool thrown_ = false;                                                                           \
    try {                                                                                           \
      (void)(expr);                                                                                 \
    } catch (const type&) {                                                                         \
      thrown_ = true;                                                                               \
    }                                                                                               \
    if (!thrown_) {                                                                                 \
      throw ::hashrig::test::Failure(std::string(__FILE__) + ":" + std::to_string(__LINE__) +      \
                                     ": expected " #type " from " #expr);                           \
    }                                                                                               \
  } while (0)

#define CHECK_HASH_ERROR(expr, expected_kind)                                                       \
  do {                                                                                              \
    bool thrown_ = false;                                                                           \
    try {                                                                                           \
      (void)(expr);                                                                                 \
    } catch (const ::hashrig::HashError& ex_) {                                                     \
      thrown_ = ex_.kind() == (expected_kind);                                                      \
    }                                                                                               \
    if (!thrown_) {                                                                                 \
      throw ::hashrig::test::Failure(std::string(__FILE__) + ":" + std::to_string(__LINE__) +      \
                                     ": expected HashError " #expected_kind " from " #expr);        \
    }                                                                                               \
  } while (0)
