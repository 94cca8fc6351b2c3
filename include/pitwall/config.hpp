#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <pitwall/classify.hpp>
#include <pitwall/log.hpp>
#include <pitwall/processor.hpp>
#include <pitwall/retry.hpp>
#include <pitwall/sample.hpp>
#include <pitwall/strategy.hpp>
#include <pitwall/transport.hpp>

namespace pitwall {

struct PipelineConfig {
  // Ingestion endpoint
  std::string host = "127.0.0.1";
  std::uint16_t port = 20777;
  std::size_t recv_buffer = 2048;

  // Ingestion policy
  CarId target_car = 0;                // 0 = all cars
  bool verify_checksum = true;
  bool require_checksum = false;
  std::uint64_t max_future_ms = 60'000; // only with LatencyReference::Source
  PriorityMap priorities{};

  std::size_t capacity = 1024;
  std::chrono::milliseconds idle_timeout{5000};

  ProcessorConfig processor{};
  StrategyConfig strategy{};
  std::size_t latency_window = 1024;
  std::size_t throughput_window_s = 5;

  // Publishing
  std::chrono::milliseconds publish_interval{100};
  std::chrono::milliseconds summary_interval{2000};
  bool live_view = true;
  std::string view_host = "127.0.0.1";
  std::uint16_t view_port = 8765;
  LiveViewProtocol view_protocol = LiveViewProtocol::WebSocket;

  RetryPolicy retry{};
  log::Level log_level = log::Level::Info;

  // Throws ConfigError naming the first offending field.
  void validate() const;
};

std::ostream& operator<<(std::ostream& os, const PipelineConfig& c);

} // namespace pitwall
