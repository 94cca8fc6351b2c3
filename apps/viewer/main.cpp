#include <pitwall/cli.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/pipeline.hpp>
#include <pitwall/retry.hpp>
#include <pitwall/transport.hpp>
#include <pitwall/viewer/app.hpp>

#include <chrono>
#include <memory>
#include <thread>

using namespace pitwall;

int main(int argc, char** argv) {
  cli::Parsed parsed{};
  try {
    parsed = cli::configure(argc, argv);
  } catch (const ConfigError& e) {
    PW_ERROR("[CONFIG] " << e.what());
    return 2;
  }
  if (parsed.exit_now) return parsed.exit_code;

  PipelineConfig& cfg = parsed.config;
  log::Logger::instance().set_level(cfg.log_level);

  std::unique_ptr<UdpReceiver> source;
  try {
    source = retry_with_backoff(cfg.retry, "bind udp", [&] {
      return std::make_unique<UdpReceiver>(cfg.host, cfg.port);
    });
  } catch (const TransportError& e) {
    PW_FATAL("[UDP] cannot listen: " << e.what());
    return 3;
  }

  // The window replaces the idle shutdown: keep running until it closes.
  cfg.idle_timeout = std::chrono::hours(24 * 365);
  Pipeline pipeline(cfg);
  if (cfg.live_view) {
    try {
      pipeline.add_sink(std::make_unique<TcpLiveViewSink>(cfg.view_host, cfg.view_port, cfg.view_protocol));
    } catch (const TransportError& e) {
      PW_WARN("[VIEW] live view disabled: " << e.what());
    }
  }

  std::thread th([&] { pipeline.run(*source); });

  ViewerApp app(pipeline);
  const int code = app.run();

  pipeline.request_stop();
  th.join();
  return code;
}
