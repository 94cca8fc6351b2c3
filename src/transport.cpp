#include <pitwall/transport.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>
#include <pitwall/ws.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace pitwall {

namespace {

std::string endpoint_of(const std::string& host, std::uint16_t port) {
  return host + ":" + std::to_string(port);
}

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

sockaddr_in make_addr(const std::string& host, std::uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    throw TransportError(endpoint_of(host, port), "invalid IPv4 address");
  }
  return addr;
}

bool set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

// Port actually bound; differs from the requested one when that was 0.
std::uint16_t local_port(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
  return ntohs(addr.sin_port);
}

// Creates a socket of the given type bound to host:port. Closes the
// descriptor and throws TransportError on any failure.
int open_bound(int type, const std::string& host, std::uint16_t port) {
  const std::string ep = endpoint_of(host, port);
  const sockaddr_in addr = make_addr(host, port);

  const int fd = ::socket(AF_INET, type, 0);
  if (fd < 0) throw TransportError(ep, errno_text("socket"));

  try {
    int one = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
      throw TransportError(ep, errno_text("setsockopt(SO_REUSEADDR)"));
    }
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
      throw TransportError(ep, errno_text("bind"));
    }
    if (!set_nonblocking(fd)) {
      throw TransportError(ep, errno_text("fcntl(O_NONBLOCK)"));
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  return fd;
}

} // namespace

// ---------------------------------------------------------------------------
// UdpReceiver

UdpReceiver::UdpReceiver(const std::string& host, std::uint16_t port)
  : host_(host) {
  fd_ = open_bound(SOCK_DGRAM, host, port);
  port_ = local_port(fd_);
  PW_INFO("[UDP] listening on " << describe());
}

UdpReceiver::~UdpReceiver() {
  if (fd_ >= 0) ::close(fd_);
}

std::string UdpReceiver::describe() const {
  return "udp://" + endpoint_of(host_, port_);
}

RecvResult UdpReceiver::receive(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) {
  RecvResult r{};

  pollfd p{};
  p.fd = fd_;
  p.events = POLLIN;
  const int ready = ::poll(&p, 1, static_cast<int>(timeout.count()));
  if (ready == 0) {
    r.status = RecvStatus::Timeout;
    return r;
  }
  if (ready < 0) {
    if (errno == EINTR) {
      r.status = RecvStatus::Timeout;
      return r;
    }
    r.status = RecvStatus::Error;
    r.error = errno;
    return r;
  }

  const ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      r.status = RecvStatus::Timeout;
      return r;
    }
    r.status = RecvStatus::Error;
    r.error = errno;
    return r;
  }
  r.status = RecvStatus::Data;
  r.size = static_cast<std::size_t>(n);
  return r;
}

// ---------------------------------------------------------------------------
// TcpLiveViewSink

namespace {
// Bytes a viewer may have outstanding before it is dropped.
constexpr std::size_t kMaxViewerInput = 16 * 1024;
} // namespace

const char* to_string(LiveViewProtocol p) {
  switch (p) {
    case LiveViewProtocol::WebSocket: return "ws";
    case LiveViewProtocol::Ndjson:    return "ndjson";
  }
  return "unknown";
}

TcpLiveViewSink::TcpLiveViewSink(const std::string& host, std::uint16_t port, LiveViewProtocol protocol)
  : host_(host), protocol_(protocol) {
  listen_fd_ = open_bound(SOCK_STREAM, host, port);
  if (::listen(listen_fd_, 4) < 0) {
    const std::string msg = errno_text("listen");
    ::close(listen_fd_);
    listen_fd_ = -1;
    throw TransportError(endpoint_of(host, port), msg);
  }
  port_ = local_port(listen_fd_);
  PW_INFO("[VIEW] live view on " << describe());
}

TcpLiveViewSink::~TcpLiveViewSink() {
  if (client_fd_ >= 0) ::close(client_fd_);
  if (listen_fd_ >= 0) ::close(listen_fd_);
}

std::string TcpLiveViewSink::describe() const {
  if (protocol_ == LiveViewProtocol::WebSocket) return "ws://" + endpoint_of(host_, port_) + "/ws";
  return "tcp://" + endpoint_of(host_, port_);
}

void TcpLiveViewSink::drop_client_(const char* why) {
  if (client_fd_ < 0) return;
  if (open_) PW_INFO("[VIEW] viewer disconnected (" << why << ")");
  ::close(client_fd_);
  client_fd_ = -1;
  open_ = false;
  in_.clear();
}

void TcpLiveViewSink::accept_pending_() {
  while (true) {
    const int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) return;   // EAGAIN or a transient error; try again next frame
    if (!set_nonblocking(fd)) {
      PW_WARN("[VIEW] rejecting viewer: " << errno_text("fcntl(O_NONBLOCK)"));
      ::close(fd);
      continue;
    }
    if (client_fd_ >= 0) {
      // Newest viewer wins.
      drop_client_("replaced");
    }
    client_fd_ = fd;
    open_ = protocol_ == LiveViewProtocol::Ndjson;
    if (open_) PW_INFO("[VIEW] viewer connected");
  }
}

// Pulls whatever the viewer sent. Raw TCP viewers have nothing to say, so
// their bytes are discarded; WebSocket bytes are kept for parsing.
bool TcpLiveViewSink::read_input_() {
  char scratch[512];
  while (true) {
    const ssize_t n = ::recv(client_fd_, scratch, sizeof(scratch), MSG_DONTWAIT);
    if (n > 0) {
      if (protocol_ == LiveViewProtocol::Ndjson) continue;
      in_.append(scratch, static_cast<std::size_t>(n));
      if (in_.size() > kMaxViewerInput) {
        drop_client_("too much input");
        return false;
      }
      continue;
    }
    if (n == 0) {
      drop_client_("closed by peer");
      return false;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    if (errno == EINTR) continue;
    drop_client_(std::strerror(errno));
    return false;
  }
}

bool TcpLiveViewSink::write_all_(std::string_view bytes) {
  const ssize_t n = ::send(client_fd_, bytes.data(), bytes.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
  if (n == static_cast<ssize_t>(bytes.size())) return true;
  drop_client_(n < 0 ? std::strerror(errno) : "partial write");
  return false;
}

// Handles the HTTP request that opens a WebSocket connection. Returns true
// when the connection is ready for frames.
bool TcpLiveViewSink::handshake_() {
  const ws::HttpRequest req = ws::parse_request(in_);
  switch (req.kind) {
    case ws::RequestKind::Incomplete:
      return false;
    case ws::RequestKind::Invalid:
      if (write_all_(ws::status_response(400, "Bad Request"))) drop_client_("bad request");
      return false;
    case ws::RequestKind::Page:
      if (req.path == "/") {
        if (write_all_(ws::page_response(ws::index_page()))) drop_client_("page served");
      } else if (write_all_(ws::status_response(404, "Not Found"))) {
        drop_client_("not found");
      }
      return false;
    case ws::RequestKind::Upgrade:
      break;
  }
  if (req.path != "/ws") {
    if (write_all_(ws::status_response(404, "Not Found"))) drop_client_("not found");
    return false;
  }
  if (!write_all_(ws::upgrade_response(req.key))) return false;
  in_.erase(0, req.length);
  open_ = true;
  PW_INFO("[VIEW] viewer connected");
  return true;
}

// Answers pings and closes; data frames from the viewer are ignored.
bool TcpLiveViewSink::control_frames_() {
  ws::Frame f{};
  std::size_t used = 0;
  while (std::size_t n = ws::parse_frame(std::string_view(in_).substr(used), f)) {
    used += n;
    if (!f.masked) {
      drop_client_("unmasked client frame");
      return false;
    }
    if (f.op == ws::Opcode::Close) {
      std::string reply;
      ws::append_frame(reply, ws::Opcode::Close, f.payload.substr(0, std::min<std::size_t>(f.payload.size(), 2)));
      if (write_all_(reply)) drop_client_("closed by viewer");
      return false;
    }
    if (f.op == ws::Opcode::Ping) {
      std::string reply;
      ws::append_frame(reply, ws::Opcode::Pong, f.payload);
      if (!write_all_(reply)) return false;
    }
  }
  in_.erase(0, used);
  return true;
}

bool TcpLiveViewSink::send(std::string_view line) {
  accept_pending_();
  if (client_fd_ < 0) return false;
  if (!read_input_()) return false;

  frame_.clear();
  if (protocol_ == LiveViewProtocol::WebSocket) {
    if (!open_ && !handshake_()) return false;
    if (!control_frames_()) return false;
    ws::append_frame(frame_, ws::Opcode::Text, line);
  } else {
    frame_.assign(line.data(), line.size());
    frame_.push_back('\n');
  }

  const ssize_t n = ::send(client_fd_, frame_.data(), frame_.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
  if (n == static_cast<ssize_t>(frame_.size())) return true;

  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    ++frames_dropped_;
    return false;
  }
  if (n >= 0) {
    // A partial frame would corrupt the stream for the viewer.
    ++frames_dropped_;
    drop_client_("partial write");
    return false;
  }
  drop_client_(std::strerror(errno));
  return false;
}

} // namespace pitwall
