#include <pitwall/cli.hpp>
#include <pitwall/errors.hpp>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace pitwall::cli {

namespace {

const auto priority_rule_validator = CLI::Validator(
  [](std::string& value) -> std::string {
    PriorityMap scratch{};
    if (apply_priority_rule(scratch, value)) return {};
    return "expected event=class with event in routine|hard_braking|drs|engine_alarm|tyre_alarm "
           "and class in low|medium|high|critical";
  },
  "EVENT=CLASS");

} // namespace

Parsed configure(int argc, const char* const* argv) {
  Parsed out{};
  PipelineConfig& c = out.config;

  CLI::App app{"pitwall: real-time car telemetry pipeline"};
  app.set_config("--config", "", "Read options from an INI/TOML file");

  int port = c.port;
  int car = c.target_car;
  long long budget_ms = c.processor.budget.count();
  long long idle_ms = c.idle_timeout.count();
  long long publish_ms = c.publish_interval.count();
  long long snapshot_ms = c.processor.snapshot_interval.count();
  long long summary_ms = c.summary_interval.count();
  long long work_us = c.processor.load.fixed.count();
  long long backoff_ms = c.retry.initial.count();
  long long backoff_max_ms = c.retry.max.count();
  int view_port = c.view_port;
  bool no_checksum = false;
  bool no_view = false;
  std::string latency_from = "arrival";
  std::string view_protocol = to_string(c.view_protocol);
  std::string log_level = "info";
  std::vector<std::string> rules;

  app.add_option("--host", c.host, "UDP listen address")->capture_default_str();
  app.add_option("-p,--port", port, "UDP listen port")->check(CLI::Range(1, 65535))->capture_default_str();
  app.add_option("--recv-buffer", c.recv_buffer, "Receive buffer size in bytes")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("-c,--car", car, "Only ingest this car (0 = all)")->check(CLI::Range(0, 65535))->capture_default_str();
  app.add_option("--max-cars", c.strategy.max_cars, "Cars tracked by the strategy consumer")->check(CLI::Range(1, 4096))->capture_default_str();
  app.add_option("--capacity", c.capacity, "Ring buffer capacity in samples")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--budget-ms", budget_ms, "Per-sample latency budget")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--idle-timeout-ms", idle_ms, "Shut down after this long without data")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--publish-ms", publish_ms, "Live view publish interval")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--snapshot-ms", snapshot_ms, "Processor snapshot interval")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--summary-ms", summary_ms, "Summary log interval")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--priority", rules, "Priority rule EVENT=CLASS (repeatable)")->check(priority_rule_validator);
  app.add_flag("--require-checksum", c.require_checksum, "Reject frames without a checksum");
  app.add_flag("--no-checksum", no_checksum, "Do not verify frame checksums");
  app.add_option("--latency-from", latency_from, "Latency reference: arrival | source")
    ->check(CLI::IsMember({"arrival", "source"}))->capture_default_str();
  app.add_option("--max-future-ms", c.max_future_ms, "Source timestamp horizon (source reference only)")->capture_default_str();
  app.add_flag("--simulate-load", c.processor.load.simulate, "Randomized per-class processing cost");
  app.add_option("--work-us", work_us, "Fixed processing cost added to every sample")->check(CLI::NonNegativeNumber)->capture_default_str();
  app.add_option("--seed", c.processor.load.seed, "Seed for the simulated load")->capture_default_str();
  app.add_option("--view-host", c.view_host, "Live view listen address")->capture_default_str();
  app.add_option("--view-port", view_port, "Live view listen port")->check(CLI::Range(1, 65535))->capture_default_str();
  app.add_option("--view-protocol", view_protocol, "Live view protocol: ws | ndjson")
    ->check(CLI::IsMember({"ws", "ndjson"}))->capture_default_str();
  app.add_flag("--no-view", no_view, "Disable the live view endpoint");
  app.add_option("--retry-attempts", c.retry.attempts, "Bind/receive attempts before giving up")->check(CLI::PositiveNumber)->capture_default_str();
  app.add_option("--retry-backoff-ms", backoff_ms, "Initial retry backoff")->check(CLI::NonNegativeNumber)->capture_default_str();
  app.add_option("--retry-backoff-max-ms", backoff_max_ms, "Maximum retry backoff")->check(CLI::NonNegativeNumber)->capture_default_str();
  app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error | fatal | off")
    ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"}))->capture_default_str();

  app.footer(
    "Wire frames are 97-byte datagrams (magic 'PW', version 1).\n"
    "Live view: open http://<view-host>:<view-port>/ in a browser, or connect a\n"
    "WebSocket client to /ws. With --view-protocol ndjson, raw TCP clients\n"
    "receive one JSON snapshot per line.");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    out.exit_now = true;
    out.exit_code = app.exit(e, std::cout, std::cerr);
    return out;
  }

  c.port = static_cast<std::uint16_t>(port);
  c.target_car = static_cast<CarId>(car);
  c.processor.budget = std::chrono::milliseconds(budget_ms);
  c.idle_timeout = std::chrono::milliseconds(idle_ms);
  c.publish_interval = std::chrono::milliseconds(publish_ms);
  c.processor.snapshot_interval = std::chrono::milliseconds(snapshot_ms);
  c.summary_interval = std::chrono::milliseconds(summary_ms);
  c.processor.load.fixed = std::chrono::microseconds(work_us);
  c.processor.reference = latency_from == "source" ? LatencyReference::Source : LatencyReference::Arrival;
  c.retry.initial = std::chrono::milliseconds(backoff_ms);
  c.retry.max = std::chrono::milliseconds(backoff_max_ms);
  c.view_port = static_cast<std::uint16_t>(view_port);
  c.live_view = !no_view;
  c.view_protocol = view_protocol == "ndjson" ? LiveViewProtocol::Ndjson : LiveViewProtocol::WebSocket;
  if (no_checksum) c.verify_checksum = false;

  for (const auto& r : rules) {
    if (!apply_priority_rule(c.priorities, r)) {
      throw ConfigError("invalid priority rule '" + r + "'");
    }
  }
  if (!log::parse_level(log_level, c.log_level)) {
    throw ConfigError("invalid log level '" + log_level + "'");
  }

  c.validate();
  return out;
}

} // namespace pitwall::cli
