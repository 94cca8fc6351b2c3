#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Server side of the live-view WebSocket: the HTTP upgrade and RFC 6455
// framing. No I/O here; TcpLiveViewSink feeds it bytes.
namespace pitwall::ws {

enum class Opcode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

enum class RequestKind : std::uint8_t {
  Incomplete,   // header block not terminated yet
  Upgrade,      // GET with Upgrade: websocket and a key
  Page,         // plain GET
  Invalid,
};

struct HttpRequest {
  RequestKind kind = RequestKind::Incomplete;
  std::string path;
  std::string key;          // Sec-WebSocket-Key
  std::size_t length = 0;   // bytes of the header block, terminator included
};

// Largest header block accepted from a viewer.
constexpr std::size_t kMaxRequestBytes = 8192;

HttpRequest parse_request(std::string_view bytes);

// base64(SHA-1(key + RFC 6455 GUID)). Throws TransportError if the digest
// cannot be computed.
std::string accept_key(std::string_view client_key);

std::string upgrade_response(std::string_view client_key);
std::string page_response(std::string_view html);
std::string status_response(int code, std::string_view reason);

// The page served on "/": connects to /ws and prints each snapshot.
std::string_view index_page();

// Appends one unmasked, final server frame.
void append_frame(std::string& out, Opcode op, std::string_view payload);

struct Frame {
  Opcode op = Opcode::Continuation;
  bool fin = false;
  bool masked = false;
  std::string payload;      // unmasked
};

// Parses one frame from the front of bytes. Returns the bytes consumed, or 0
// if the frame is not complete yet.
std::size_t parse_frame(std::string_view bytes, Frame& out);

} // namespace pitwall::ws
