#include "hashrig/hash_method.hpp"

#include "hashrig/crypto.hpp"
#include "hashrig/errors.hpp"

#include <algorithm>
#include <cctype>

namespace hashrig {

namespace {

constexpr uint64_t kNonceSpace = 1ULL << 32U;

} // namespace

std::string canonical_method_name(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });

  if (lower == "asic" || lower == "direct" || lower == "device") {
    return kDirectDeviceMethod;
  }
  if (lower == "cuda" || lower == "gpu") {
    return kGpuSimMethod;
  }
  if (lower == "ubpf") {
    return kUbpfSimMethod;
  }
  if (lower == "ebpf") {
    return kEbpfSimMethod;
  }
  return lower;
}

JobBytes require_valid_header(const Bytes& header) {
  if (header.size() != kJobSize) {
    throw HashError(HashErrorKind::INVALID_INPUT,
                    "header must be exactly 80 bytes, got " + std::to_string(header.size()));
  }
  if (!JobCodec::validate(header)) {
    throw HashError(HashErrorKind::INVALID_INPUT, "header version or difficulty field is invalid");
  }
  return job_from_bytes(header);
}

uint64_t nonce_range_end(uint64_t start_nonce, uint64_t max_tries) {
  if (start_nonce >= kNonceSpace) {
    return start_nonce;
  }
  const uint64_t room = kNonceSpace - start_nonce;
  return start_nonce + std::min(room, max_tries);
}

std::optional<uint64_t> search_nonce_range(const JobBytes& header, uint64_t begin, uint64_t end) {
  JobBytes work = header;
  for (uint64_t nonce = begin; nonce < end; ++nonce) {
    store_u32_le(work.data() + kJobCandidateOffset, static_cast<uint32_t>(nonce));
    if (meets_difficulty_one(double_sha256(work.data(), work.size()))) {
      return nonce;
    }
  }
  return std::nullopt;
}

} // namespace hashrig
