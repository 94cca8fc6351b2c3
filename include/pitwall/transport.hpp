#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pitwall {

enum class RecvStatus : std::uint8_t {
  Data,
  Timeout,
  Error,
};

struct RecvResult {
  RecvStatus status = RecvStatus::Timeout;
  std::size_t size = 0;
  int error = 0;          // errno when status == Error
};

// Upstream boundary: one datagram per call, no ordering or delivery promise.
class DatagramSource {
public:
  virtual ~DatagramSource() = default;

  // Blocks for at most timeout waiting for one datagram. A datagram larger
  // than buf is truncated by the transport and reported with its
  // truncated size.
  virtual RecvResult receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) = 0;
  virtual std::string describe() const = 0;
};

// Downstream boundary: a live viewer. Implementations must not block.
class LiveViewSink {
public:
  virtual ~LiveViewSink() = default;

  // Hands one serialized snapshot to the viewer. Returns false if nothing
  // was delivered (no viewer, slow viewer, transport error).
  virtual bool send(std::string_view line) = 0;
  virtual std::string describe() const = 0;
};

// UDP socket bound to host:port. Throws TransportError if it cannot bind.
class UdpReceiver final : public DatagramSource {
public:
  UdpReceiver(const std::string& host, std::uint16_t port);
  ~UdpReceiver() override;

  UdpReceiver(const UdpReceiver&) = delete;
  UdpReceiver& operator=(const UdpReceiver&) = delete;

  RecvResult receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override;
  std::string describe() const override;

  std::uint16_t bound_port() const { return port_; }

private:
  int fd_ = -1;
  std::string host_;
  std::uint16_t port_ = 0;
};

enum class LiveViewProtocol : std::uint8_t {
  WebSocket,   // GET /ws upgrades, one text frame per snapshot; GET / serves a page
  Ndjson,      // one JSON line per snapshot on a raw TCP stream
};

const char* to_string(LiveViewProtocol p);

// Listens on host:port for one viewer at a time. Accept, read and write are
// all non-blocking; a frame that does not fit in the socket buffer is
// dropped rather than queued. A newer viewer replaces the current one. The
// handshake and any control frames are handled on the next send(). Throws
// TransportError if it cannot listen.
class TcpLiveViewSink final : public LiveViewSink {
public:
  TcpLiveViewSink(const std::string& host, std::uint16_t port,
                  LiveViewProtocol protocol = LiveViewProtocol::WebSocket);
  ~TcpLiveViewSink() override;

  TcpLiveViewSink(const TcpLiveViewSink&) = delete;
  TcpLiveViewSink& operator=(const TcpLiveViewSink&) = delete;

  bool send(std::string_view line) override;
  std::string describe() const override;

  // True once a viewer is connected and ready for snapshots.
  bool has_client() const { return client_fd_ >= 0 && open_; }
  std::uint16_t bound_port() const { return port_; }
  std::uint64_t frames_dropped() const { return frames_dropped_; }
  LiveViewProtocol protocol() const { return protocol_; }

private:
  void accept_pending_();
  bool read_input_();
  bool handshake_();
  bool control_frames_();
  bool write_all_(std::string_view bytes);
  void drop_client_(const char* why);

  int listen_fd_ = -1;
  int client_fd_ = -1;
  bool open_ = false;
  std::string host_;
  std::uint16_t port_ = 0;
  LiveViewProtocol protocol_;
  std::string in_;
  std::string frame_;
  std::uint64_t frames_dropped_ = 0;
};

} // namespace pitwall
