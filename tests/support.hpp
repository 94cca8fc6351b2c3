#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include <pitwall/log.hpp>
#include <pitwall/sample.hpp>
#include <pitwall/transport.hpp>
#include <pitwall/wire.hpp>

namespace pitwall::test {

// A car at cruise: nothing in it triggers an event or an advisory.
inline Sample make_sample(CarId car, std::uint32_t seq, Priority p = Priority::Low) {
  Sample s{};
  s.car = car;
  s.seq = seq;
  s.source_ts_ms = 1000 + std::uint64_t{seq} * 10;
  s.priority = p;
  s.ch.speed_kmh = 250;
  s.ch.throttle = 0.9f;
  s.ch.brake = 0.0f;
  s.ch.steering = 0.05f;
  s.ch.gear = 7;
  s.ch.rpm = 11500;
  s.ch.oil_pressure_bar = 4.5f;
  s.ch.oil_temp_c = 110;
  s.ch.water_temp_c = 95;
  s.ch.tyre_pressure_psi = {22.5f, 22.5f, 21.0f, 21.0f};
  s.ch.tyre_temp_c = {95, 96, 92, 93};
  s.ch.ers_store_j = 3.2e6f;
  s.ch.mguk_power_w = 1.2e5f;
  s.ch.fuel_flow_kg_h = 100.0f;
  s.ch.position_m = {120.0f, -40.0f, 3.0f};
  return s;
}

inline std::vector<std::uint8_t> frame_bytes(const Sample& s, bool with_checksum = true) {
  const auto f = wire::encode(s, with_checksum);
  return {f.begin(), f.end()};
}

// Scripted datagram source. Returns queued datagrams in order, then times
// out for as long as asked.
class MemorySource final : public DatagramSource {
public:
  void push(std::vector<std::uint8_t> d) {
    std::lock_guard<std::mutex> lock(mu_);
    q_.push_back(Item{std::move(d), 0});
  }
  void push(const Sample& s, bool with_checksum = true) { push(frame_bytes(s, with_checksum)); }
  void push_error(int err) {
    std::lock_guard<std::mutex> lock(mu_);
    q_.push_back(Item{{}, err});
  }

  RecvResult receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!q_.empty()) {
        Item it = std::move(q_.front());
        q_.pop_front();
        ++calls_;
        if (it.error != 0) return RecvResult{RecvStatus::Error, 0, it.error};
        const std::size_t n = std::min(it.bytes.size(), buf.size());
        std::copy(it.bytes.begin(), it.bytes.begin() + static_cast<std::ptrdiff_t>(n), buf.begin());
        return RecvResult{RecvStatus::Data, n, 0};
      }
    }
    std::this_thread::sleep_for(timeout);
    return RecvResult{RecvStatus::Timeout, 0, 0};
  }

  std::string describe() const override { return "memory://test"; }

  std::size_t delivered() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

private:
  struct Item {
    std::vector<std::uint8_t> bytes;
    int error = 0;
  };
  mutable std::mutex mu_;
  std::deque<Item> q_;
  std::size_t calls_ = 0;
};

// Keeps every line it is given; can be told to refuse them.
class RecordingSink final : public LiveViewSink {
public:
  explicit RecordingSink(bool accept = true) : accept_(accept) {}

  bool send(std::string_view line) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++attempts_;
    if (!accept_) return false;
    lines_.emplace_back(line);
    return true;
  }
  std::string describe() const override { return "recording://test"; }

  std::vector<std::string> lines() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lines_;
  }
  std::size_t attempts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return attempts_;
  }

private:
  bool accept_;
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
  std::size_t attempts_ = 0;
};

// Stream buffer whose every flush stalls, like a blocked terminal or pipe.
class StallingBuf final : public std::streambuf {
public:
  explicit StallingBuf(std::chrono::milliseconds stall) : stall_(stall) {}
  std::size_t flushes() const { return flushes_; }

protected:
  int_type overflow(int_type c) override { return traits_type::not_eof(c); }
  std::streamsize xsputn(const char*, std::streamsize n) override { return n; }
  int sync() override {
    ++flushes_;
    std::this_thread::sleep_for(stall_);
    return 0;
  }

private:
  std::chrono::milliseconds stall_;
  std::size_t flushes_ = 0;
};

// Points the process logger at os for the lifetime of the object.
class ScopedLogOutput {
public:
  ScopedLogOutput(std::ostream& os, log::Level lvl)
    : prev_level_(log::Logger::instance().level()) {
    log::Logger::instance().set_output(&os);
    log::Logger::instance().set_level(lvl);
  }
  ~ScopedLogOutput() {
    log::Logger::instance().set_output(nullptr);
    log::Logger::instance().set_level(prev_level_);
  }
  ScopedLogOutput(const ScopedLogOutput&) = delete;
  ScopedLogOutput& operator=(const ScopedLogOutput&) = delete;

private:
  log::Level prev_level_;
};

} // namespace pitwall::test
