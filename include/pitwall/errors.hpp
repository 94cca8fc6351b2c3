#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pitwall {

// Decode-time failures. Non-fatal: counted and the buffer discarded.
enum class DecodeError : std::uint8_t {
  None = 0,
  MalformedPacket,
  VersionMismatch,
  ChecksumFailure,
};

inline const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::None:            return "None";
    case DecodeError::MalformedPacket: return "MalformedPacket";
    case DecodeError::VersionMismatch: return "VersionMismatch";
    case DecodeError::ChecksumFailure: return "ChecksumFailure";
  }
  return "Unknown";
}

// Per-sample computation fault; recorded in the outcome, pipeline continues.
class ProcessingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Cannot receive from or publish to an endpoint.
class TransportError : public std::runtime_error {
public:
  TransportError(const std::string& endpoint, const std::string& what)
    : std::runtime_error(endpoint + ": " + what), endpoint_(endpoint) {}

  const std::string& endpoint() const noexcept { return endpoint_; }

private:
  std::string endpoint_;
};

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace pitwall
