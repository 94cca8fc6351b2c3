#include <pitwall/cli.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/pipeline.hpp>
#include <pitwall/retry.hpp>
#include <pitwall/transport.hpp>

#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <unistd.h>

using namespace pitwall;

namespace {

std::atomic<Pipeline*> g_pipeline{nullptr};

void on_signal(int) {
  if (Pipeline* p = g_pipeline.load()) p->request_stop();
}

constexpr int kExitConfig = 2;
constexpr int kExitTransport = 3;

} // namespace

int main(int argc, char** argv) {
  cli::Parsed parsed{};
  try {
    parsed = cli::configure(argc, argv);
  } catch (const ConfigError& e) {
    PW_ERROR("[CONFIG] " << e.what());
    return kExitConfig;
  }
  if (parsed.exit_now) return parsed.exit_code;

  PipelineConfig& cfg = parsed.config;
  log::Logger::instance().set_level(cfg.log_level);
  log::Logger::instance().enable_color(::isatty(STDOUT_FILENO) != 0);

  std::unique_ptr<UdpReceiver> source;
  try {
    source = retry_with_backoff(cfg.retry, "bind udp://" + cfg.host + ":" + std::to_string(cfg.port), [&] {
      return std::make_unique<UdpReceiver>(cfg.host, cfg.port);
    });
  } catch (const TransportError& e) {
    PW_FATAL("[UDP] cannot listen: " << e.what());
    return kExitTransport;
  }

  Pipeline pipeline(cfg);

  if (cfg.live_view) {
    try {
      pipeline.add_sink(retry_with_backoff(cfg.retry, "bind live view", [&] {
        return std::make_unique<TcpLiveViewSink>(cfg.view_host, cfg.view_port, cfg.view_protocol);
      }));
    } catch (const TransportError& e) {
      PW_WARN("[VIEW] live view disabled: " << e.what());
    }
  }

  g_pipeline.store(&pipeline);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const ShutdownReason reason = pipeline.run(*source);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_pipeline.store(nullptr);

  // Runtime receive failures still drain and report; only startup failures
  // change the exit code.
  PW_INFO("[PIPELINE] shutdown: " << to_string(reason));
  return 0;
}
