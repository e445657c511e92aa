#pragma once

#include <stdexcept>
#include <string>

namespace hashrig {

enum class HashErrorKind {
  INVALID_INPUT,
  HARDWARE_UNAVAILABLE,
  NOT_INITIALIZED,
  OPERATION_FAILED,
  TIMEOUT,
  RESOURCE_BUSY,
};

inline const char* hash_error_kind_name(HashErrorKind kind) {
  switch (kind) {
    case HashErrorKind::INVALID_INPUT: return "invalid input";
    case HashErrorKind::HARDWARE_UNAVAILABLE: return "hardware unavailable";
    case HashErrorKind::NOT_INITIALIZED: return "not initialized";
    case HashErrorKind::OPERATION_FAILED: return "operation failed";
    case HashErrorKind::TIMEOUT: return "timeout";
    case HashErrorKind::RESOURCE_BUSY: return "resource busy";
  }
  return "unknown";
}

class HashError : public std::runtime_error {
public:
  HashError(HashErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(hash_error_kind_name(kind)) + ": " + message), kind_(kind) {}

  HashErrorKind kind() const { return kind_; }

private:
  HashErrorKind kind_;
};

// Bad subnet, bad dimensions, malformed config or seed text.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class TimeoutError : public TransportError {
public:
  using TransportError::TransportError;
};

// Error status returned by a hash-compute server.
class RpcError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NoValidPassesError : public std::runtime_error {
public:
  NoValidPassesError() : std::runtime_error("no valid inference passes completed") {}
};

} // namespace hashrig
