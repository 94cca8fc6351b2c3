#include <pitwall/wire.hpp>
#include <bit>
#include <cmath>
#include <xxhash.h>

namespace pitwall {
namespace wire {

namespace {

// Channel offsets (see layout in wire.hpp).
constexpr std::size_t kOffCar      = 4;
constexpr std::size_t kOffSeq      = 6;
constexpr std::size_t kOffTs       = 10;
constexpr std::size_t kOffPrio     = 18;
constexpr std::size_t kOffSpeed    = 19;
constexpr std::size_t kOffThrottle = 21;
constexpr std::size_t kOffBrake    = 25;
constexpr std::size_t kOffSteering = 29;
constexpr std::size_t kOffGear     = 33;
constexpr std::size_t kOffRpm      = 34;
constexpr std::size_t kOffDrs      = 36;
constexpr std::size_t kOffOilP     = 37;
constexpr std::size_t kOffOilT     = 41;
constexpr std::size_t kOffWaterT   = 43;
constexpr std::size_t kOffTyreP    = 45;  // 4 x f32
constexpr std::size_t kOffTyreT    = 61;  // 4 x i16
constexpr std::size_t kOffErs      = 69;
constexpr std::size_t kOffMguk     = 73;
constexpr std::size_t kOffFuel     = 77;
constexpr std::size_t kOffPos      = 81;  // 3 x f32
static_assert(kOffPos + 12 == kChecksumOffset, "channel block must end at the checksum");
static_assert(kChecksumOffset + 4 == kFrameSize, "checksum must close the frame");

constexpr std::uint16_t kMaxSpeedKmh = 400;
constexpr std::int8_t   kMinGear = -1;
constexpr std::int8_t   kMaxGear = 8;
constexpr std::uint16_t kMaxRpm = 20000;
constexpr std::int16_t  kMinTempC = -40;     // ambient floor for every sensor
constexpr std::int16_t  kMaxFluidTempC = 200;
constexpr std::int16_t  kMaxTyreTempC = 250;

// Callers guarantee off + N <= p.size().
std::uint16_t rd_u16(std::span<const std::uint8_t> p, std::size_t off) {
  return static_cast<std::uint16_t>(p[off] | (p[off + 1] << 8));
}
std::uint32_t rd_u32(std::span<const std::uint8_t> p, std::size_t off) {
  return  static_cast<std::uint32_t>(p[off])
        | static_cast<std::uint32_t>(p[off + 1]) << 8
        | static_cast<std::uint32_t>(p[off + 2]) << 16
        | static_cast<std::uint32_t>(p[off + 3]) << 24;
}
std::uint64_t rd_u64(std::span<const std::uint8_t> p, std::size_t off) {
  return static_cast<std::uint64_t>(rd_u32(p, off))
       | static_cast<std::uint64_t>(rd_u32(p, off + 4)) << 32;
}
std::int16_t rd_i16(std::span<const std::uint8_t> p, std::size_t off) {
  return static_cast<std::int16_t>(rd_u16(p, off));
}
float rd_f32(std::span<const std::uint8_t> p, std::size_t off) {
  return std::bit_cast<float>(rd_u32(p, off));
}

void wr_u16(Frame& f, std::size_t off, std::uint16_t v) {
  f[off]     = static_cast<std::uint8_t>(v);
  f[off + 1] = static_cast<std::uint8_t>(v >> 8);
}
void wr_u32(Frame& f, std::size_t off, std::uint32_t v) {
  for (std::size_t i = 0; i < 4; ++i) f[off + i] = static_cast<std::uint8_t>(v >> (8 * i));
}
void wr_u64(Frame& f, std::size_t off, std::uint64_t v) {
  wr_u32(f, off, static_cast<std::uint32_t>(v));
  wr_u32(f, off + 4, static_cast<std::uint32_t>(v >> 32));
}
void wr_f32(Frame& f, std::size_t off, float v) {
  wr_u32(f, off, std::bit_cast<std::uint32_t>(v));
}

bool in_range(float v, float lo, float hi) {
  return std::isfinite(v) && v >= lo && v <= hi;
}
bool in_range(std::int16_t v, std::int16_t lo, std::int16_t hi) {
  return v >= lo && v <= hi;
}

std::uint32_t digest(std::span<const std::uint8_t> frame) {
  return XXH32(frame.data(), kChecksumOffset, 0);
}

// Bounds on every field. Runs on a frame whose length is already checked.
bool fields_plausible(std::span<const std::uint8_t> p, const DecodeOptions& opt) {
  if (!is_valid_priority(p[kOffPrio])) return false;
  if (p[kOffDrs] > 1) return false;

  const std::uint64_t ts = rd_u64(p, kOffTs);
  if (opt.now_ms != 0 && ts > opt.now_ms + opt.max_future_ms) return false;

  if (rd_u16(p, kOffSpeed) > kMaxSpeedKmh) return false;
  if (!in_range(rd_f32(p, kOffThrottle), 0.0f, 1.0f)) return false;
  if (!in_range(rd_f32(p, kOffBrake), 0.0f, 1.0f)) return false;
  if (!in_range(rd_f32(p, kOffSteering), -1.0f, 1.0f)) return false;

  const auto gear = static_cast<std::int8_t>(p[kOffGear]);
  if (gear < kMinGear || gear > kMaxGear) return false;
  if (rd_u16(p, kOffRpm) > kMaxRpm) return false;

  if (!in_range(rd_f32(p, kOffOilP), 0.0f, 20.0f)) return false;
  if (!in_range(rd_i16(p, kOffOilT), kMinTempC, kMaxFluidTempC)) return false;
  if (!in_range(rd_i16(p, kOffWaterT), kMinTempC, kMaxFluidTempC)) return false;
  for (std::size_t i = 0; i < 4; ++i) {
    if (!in_range(rd_f32(p, kOffTyreP + 4 * i), 0.0f, 60.0f)) return false;
    if (!in_range(rd_i16(p, kOffTyreT + 2 * i), kMinTempC, kMaxTyreTempC)) return false;
  }
  if (!std::isfinite(rd_f32(p, kOffErs))) return false;
  if (!std::isfinite(rd_f32(p, kOffMguk))) return false;
  if (!in_range(rd_f32(p, kOffFuel), 0.0f, 500.0f)) return false;
  for (std::size_t i = 0; i < 3; ++i) {
    if (!std::isfinite(rd_f32(p, kOffPos + 4 * i))) return false;
  }
  return true;
}

} // namespace

CarId SampleView::car() const { return rd_u16(bytes_, kOffCar); }
std::uint32_t SampleView::seq() const { return rd_u32(bytes_, kOffSeq); }
std::uint64_t SampleView::source_ts_ms() const { return rd_u64(bytes_, kOffTs); }
Priority SampleView::wire_priority() const { return static_cast<Priority>(bytes_[kOffPrio]); }
bool SampleView::has_checksum() const { return (bytes_[3] & kFlagChecksum) != 0; }

Channels SampleView::channels() const {
  Channels c{};
  c.speed_kmh        = rd_u16(bytes_, kOffSpeed);
  c.throttle         = rd_f32(bytes_, kOffThrottle);
  c.brake            = rd_f32(bytes_, kOffBrake);
  c.steering         = rd_f32(bytes_, kOffSteering);
  c.gear             = static_cast<std::int8_t>(bytes_[kOffGear]);
  c.rpm              = rd_u16(bytes_, kOffRpm);
  c.drs              = bytes_[kOffDrs] != 0;
  c.oil_pressure_bar = rd_f32(bytes_, kOffOilP);
  c.oil_temp_c       = rd_i16(bytes_, kOffOilT);
  c.water_temp_c     = rd_i16(bytes_, kOffWaterT);
  for (std::size_t i = 0; i < 4; ++i) {
    c.tyre_pressure_psi[i] = rd_f32(bytes_, kOffTyreP + 4 * i);
    c.tyre_temp_c[i]       = rd_i16(bytes_, kOffTyreT + 2 * i);
  }
  c.ers_store_j    = rd_f32(bytes_, kOffErs);
  c.mguk_power_w   = rd_f32(bytes_, kOffMguk);
  c.fuel_flow_kg_h = rd_f32(bytes_, kOffFuel);
  for (std::size_t i = 0; i < 3; ++i) {
    c.position_m[i] = rd_f32(bytes_, kOffPos + 4 * i);
  }
  return c;
}

Sample SampleView::to_sample() const {
  Sample s{};
  s.car = car();
  s.seq = seq();
  s.source_ts_ms = source_ts_ms();
  s.priority = wire_priority();
  s.ch = channels();
  return s;
}

DecodeResult decode(std::span<const std::uint8_t> bytes, const DecodeOptions& opt) {
  DecodeResult r{};
  // Tag first: anything too short to carry one, or carrying a foreign one,
  // is malformed.
  if (bytes.size() < kHeaderSize || bytes[0] != kMagic0 || bytes[1] != kMagic1) {
    r.error = DecodeError::MalformedPacket;
    return r;
  }
  if (bytes[2] != kVersion) {
    r.error = DecodeError::VersionMismatch;
    return r;
  }
  if (bytes.size() != kFrameSize) {
    r.error = DecodeError::MalformedPacket;
    return r;
  }

  const bool flagged = (bytes[3] & kFlagChecksum) != 0;
  if (!flagged && opt.require_checksum) {
    r.error = DecodeError::ChecksumFailure;
    return r;
  }
  if (flagged && opt.verify_checksum && digest(bytes) != rd_u32(bytes, kChecksumOffset)) {
    r.error = DecodeError::ChecksumFailure;
    return r;
  }

  if (!fields_plausible(bytes, opt)) {
    r.error = DecodeError::MalformedPacket;
    return r;
  }

  r.view = SampleView(bytes);
  return r;
}

Frame encode(const Sample& s, bool with_checksum) {
  Frame f{};
  f[0] = kMagic0;
  f[1] = kMagic1;
  f[2] = kVersion;
  f[3] = with_checksum ? kFlagChecksum : 0;
  wr_u16(f, kOffCar, s.car);
  wr_u32(f, kOffSeq, s.seq);
  wr_u64(f, kOffTs, s.source_ts_ms);
  f[kOffPrio] = static_cast<std::uint8_t>(s.priority);

  const Channels& c = s.ch;
  wr_u16(f, kOffSpeed, c.speed_kmh);
  wr_f32(f, kOffThrottle, c.throttle);
  wr_f32(f, kOffBrake, c.brake);
  wr_f32(f, kOffSteering, c.steering);
  f[kOffGear] = static_cast<std::uint8_t>(c.gear);
  wr_u16(f, kOffRpm, c.rpm);
  f[kOffDrs] = c.drs ? 1 : 0;
  wr_f32(f, kOffOilP, c.oil_pressure_bar);
  wr_u16(f, kOffOilT, static_cast<std::uint16_t>(c.oil_temp_c));
  wr_u16(f, kOffWaterT, static_cast<std::uint16_t>(c.water_temp_c));
  for (std::size_t i = 0; i < 4; ++i) {
    wr_f32(f, kOffTyreP + 4 * i, c.tyre_pressure_psi[i]);
    wr_u16(f, kOffTyreT + 2 * i, static_cast<std::uint16_t>(c.tyre_temp_c[i]));
  }
  wr_f32(f, kOffErs, c.ers_store_j);
  wr_f32(f, kOffMguk, c.mguk_power_w);
  wr_f32(f, kOffFuel, c.fuel_flow_kg_h);
  for (std::size_t i = 0; i < 3; ++i) {
    wr_f32(f, kOffPos + 4 * i, c.position_m[i]);
  }

  if (with_checksum) {
    wr_u32(f, kChecksumOffset, digest(f));
  }
  return f;
}

} // namespace wire
} // namespace pitwall
