#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <pitwall/errors.hpp>
#include <pitwall/sample.hpp>

namespace pitwall {
namespace wire {

// Frame layout, little-endian, fixed size per version.
//   [0..2)  magic 'P','W'      [2] version     [3] flags (bit0: checksum)
//   [4..6)  car id             [6..10) seq     [10..18) source ts ms
//   [18]    wire priority      [19..93) channels
//   [93..97) XXH32 over [0..93) when flagged, zero otherwise
inline constexpr std::uint8_t kMagic0 = 'P';
inline constexpr std::uint8_t kMagic1 = 'W';
inline constexpr std::uint8_t kVersion = 1;
inline constexpr std::uint8_t kFlagChecksum = 0x01;

inline constexpr std::size_t kHeaderSize = 19;
inline constexpr std::size_t kChecksumOffset = 93;
inline constexpr std::size_t kFrameSize = 97;

using Frame = std::array<std::uint8_t, kFrameSize>;

struct DecodeOptions {
  bool verify_checksum = true;     // check XXH32 when the frame carries one
  bool require_checksum = false;   // reject frames without a checksum
  std::uint64_t now_ms = 0;        // receiver wall clock; 0 skips the horizon check
  std::uint64_t max_future_ms = 60'000;
};

struct DecodeResult;
DecodeResult decode(std::span<const std::uint8_t> bytes, const DecodeOptions& opt);

// Read-only view over a validated frame. Borrows the datagram buffer:
// valid only while that buffer is alive and unmodified.
class SampleView {
public:
  SampleView() = default;

  CarId car() const;
  std::uint32_t seq() const;
  std::uint64_t source_ts_ms() const;
  Priority wire_priority() const;
  bool has_checksum() const;

  // Copies the fixed-size channel block out of the frame.
  Channels channels() const;
  Sample to_sample() const;

  std::span<const std::uint8_t> bytes() const { return bytes_; }
  bool empty() const { return bytes_.empty(); }

private:
  friend DecodeResult decode(std::span<const std::uint8_t>, const DecodeOptions&);
  explicit SampleView(std::span<const std::uint8_t> frame) : bytes_(frame) {}

  std::span<const std::uint8_t> bytes_{};
};

struct DecodeResult {
  SampleView view{};
  DecodeError error = DecodeError::None;

  bool ok() const { return error == DecodeError::None; }
  explicit operator bool() const { return ok(); }
};

// Validates length, tag, version, checksum and field bounds before any
// field is read. Never throws.
DecodeResult decode(std::span<const std::uint8_t> bytes, const DecodeOptions& opt = {});

// Serializes a sample into a frame of the current version.
Frame encode(const Sample& s, bool with_checksum = true);

} // namespace wire
} // namespace pitwall
