#include "hashrig/kernel_filter.hpp"

#include "hashrig/errors.hpp"

namespace hashrig {

KernelFilterChannel::KernelFilterChannel(size_t event_capacity)
  : events_(event_capacity == 0 ? 1 : event_capacity) {}

bool KernelFilterChannel::submit_job(const Bytes& job) {
  if (!JobCodec::validate(job)) {
    throw HashError(HashErrorKind::INVALID_INPUT, "kernel filter job must be a valid 80-byte job");
  }
  return submit_job(job_from_bytes(job));
}

bool KernelFilterChannel::submit_job(const JobBytes& job) {
  if (!JobCodec::validate(job.data(), job.size())) {
    throw HashError(HashErrorKind::INVALID_INPUT, "kernel filter job must be a valid 80-byte job");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (job_.has_value()) {
    return false;
  }
  job_ = job;
  return true;
}

std::optional<JobBytes> KernelFilterChannel::take_job() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<JobBytes> out = job_;
  job_.reset();
  return out;
}

bool KernelFilterChannel::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return job_.has_value();
}

bool KernelFilterChannel::post_nonce(uint32_t nonce) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == events_.size()) {
    return false;
  }
  events_[tail_] = nonce;
  tail_ = (tail_ + 1) % events_.size();
  ++count_;
  return true;
}

std::optional<uint32_t> KernelFilterChannel::poll_nonce() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == 0) {
    return std::nullopt;
  }
  const uint32_t nonce = events_[head_];
  head_ = (head_ + 1) % events_.size();
  --count_;
  return nonce;
}

size_t KernelFilterChannel::event_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

void KernelFilterChannel::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  job_.reset();
  head_ = tail_ = count_ = 0;
}

} // namespace hashrig
