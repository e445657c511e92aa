#pragma once

#include "hashrig/header_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace hashrig {

// Data contract of a kernel-level packet-filter hasher: one pending job slot
// written by the host and a bounded ring of 4-byte nonce events written by
// the filter. A new job is refused until the pending one is taken.
class KernelFilterChannel {
public:
  explicit KernelFilterChannel(size_t event_capacity = 256);

  bool submit_job(const Bytes& job);
  bool submit_job(const JobBytes& job);
  std::optional<JobBytes> take_job();
  bool pending() const;

  bool post_nonce(uint32_t nonce);
  std::optional<uint32_t> poll_nonce();
  size_t event_count() const;
  size_t event_capacity() const { return events_.size(); }

  void clear();

private:
  mutable std::mutex mutex_;
  std::optional<JobBytes> job_;
  std::vector<uint32_t> events_;
  size_t head_ = 0;
  size_t tail_ = 0;
  size_t count_ = 0;
};

} // namespace hashrig
