#include <pitwall/ws.hpp>
#include <pitwall/errors.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace pitwall::ws {

namespace {

constexpr std::string_view kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

constexpr std::string_view kIndex =
  "<!doctype html>\n"
  "<html><head><meta charset=\"utf-8\"><title>pitwall</title></head>\n"
  "<body style=\"font-family:monospace\">\n"
  "<h3>pitwall live view</h3><pre id=\"out\">connecting...</pre>\n"
  "<script>\n"
  "const out = document.getElementById('out');\n"
  "const ws = new WebSocket('ws://' + location.host + '/ws');\n"
  "ws.onmessage = (e) => { out.textContent = JSON.stringify(JSON.parse(e.data), null, 2); };\n"
  "ws.onclose = () => { out.textContent += '\\n[disconnected]'; };\n"
  "</script>\n"
  "</body></html>\n";

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// True if a comma-separated header value lists token.
bool has_token(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto comma = value.find(',');
    if (iequals(trim(value.substr(0, comma)), token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

} // namespace

HttpRequest parse_request(std::string_view bytes) {
  HttpRequest r{};
  const auto end = bytes.find("\r\n\r\n");
  if (end == std::string_view::npos) {
    r.kind = bytes.size() > kMaxRequestBytes ? RequestKind::Invalid : RequestKind::Incomplete;
    return r;
  }
  r.length = end + 4;
  std::string_view head = bytes.substr(0, end);

  auto eol = head.find("\r\n");
  const std::string_view request_line = head.substr(0, eol);
  head.remove_prefix(eol == std::string_view::npos ? head.size() : eol + 2);

  // GET <path> HTTP/1.x
  const auto sp1 = request_line.find(' ');
  const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || request_line.substr(0, sp1) != "GET" ||
      request_line.substr(sp2 + 1, 5) != "HTTP/") {
    r.kind = RequestKind::Invalid;
    return r;
  }
  r.path.assign(request_line.substr(sp1 + 1, sp2 - sp1 - 1));

  bool upgrade = false;
  bool connection_upgrade = false;
  while (!head.empty()) {
    eol = head.find("\r\n");
    const std::string_view line = head.substr(0, eol);
    head.remove_prefix(eol == std::string_view::npos ? head.size() : eol + 2);

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    const std::string_view name = trim(line.substr(0, colon));
    const std::string_view value = trim(line.substr(colon + 1));
    if (iequals(name, "Upgrade")) upgrade = iequals(value, "websocket");
    else if (iequals(name, "Connection")) connection_upgrade = has_token(value, "upgrade");
    else if (iequals(name, "Sec-WebSocket-Key")) r.key.assign(value);
  }

  if (upgrade || connection_upgrade) {
    r.kind = upgrade && connection_upgrade && !r.key.empty() ? RequestKind::Upgrade : RequestKind::Invalid;
  } else {
    r.kind = RequestKind::Page;
  }
  return r;
}

std::string accept_key(std::string_view client_key) {
  std::string input(client_key);
  input.append(kGuid);

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha1(), nullptr) != 1) {
    throw TransportError("websocket", "SHA-1 digest failed");
  }

  // 20 digest bytes encode to 28 characters plus the terminator.
  std::array<unsigned char, 4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1> encoded{};
  const int n = EVP_EncodeBlock(encoded.data(), digest.data(), static_cast<int>(digest_len));
  return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(n));
}

std::string upgrade_response(std::string_view client_key) {
  std::string r;
  r.reserve(160);
  r += "HTTP/1.1 101 Switching Protocols\r\n";
  r += "Upgrade: websocket\r\n";
  r += "Connection: Upgrade\r\n";
  r += "Sec-WebSocket-Accept: ";
  r += accept_key(client_key);
  r += "\r\n\r\n";
  return r;
}

std::string page_response(std::string_view html) {
  std::string r = "HTTP/1.1 200 OK\r\n"
                  "Content-Type: text/html; charset=utf-8\r\n"
                  "Connection: close\r\n"
                  "Content-Length: " + std::to_string(html.size()) + "\r\n\r\n";
  r.append(html);
  return r;
}

std::string status_response(int code, std::string_view reason) {
  std::string r = "HTTP/1.1 " + std::to_string(code) + " ";
  r.append(reason);
  r += "\r\nConnection: close\r\nContent-Length: 0\r\n\r\n";
  return r;
}

std::string_view index_page() { return kIndex; }

void append_frame(std::string& out, Opcode op, std::string_view payload) {
  const std::uint64_t len = payload.size();
  out.push_back(static_cast<char>(0x80 | static_cast<std::uint8_t>(op)));
  if (len < 126) {
    out.push_back(static_cast<char>(len));
  } else if (len <= 0xFFFF) {
    out.push_back(static_cast<char>(126));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
  } else {
    out.push_back(static_cast<char>(127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((len >> shift) & 0xFF));
    }
  }
  out.append(payload);
}

std::size_t parse_frame(std::string_view bytes, Frame& out) {
  const auto* p = reinterpret_cast<const std::uint8_t*>(bytes.data());
  if (bytes.size() < 2) return 0;

  std::size_t off = 2;
  std::uint64_t len = p[1] & 0x7F;
  if (len == 126) {
    if (bytes.size() < off + 2) return 0;
    len = (std::uint64_t{p[2]} << 8) | p[3];
    off += 2;
  } else if (len == 127) {
    if (bytes.size() < off + 8) return 0;
    len = 0;
    for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
    off += 8;
  }

  out.fin = (p[0] & 0x80) != 0;
  out.op = static_cast<Opcode>(p[0] & 0x0F);
  out.masked = (p[1] & 0x80) != 0;

  std::array<std::uint8_t, 4> mask{};
  if (out.masked) {
    if (bytes.size() < off + 4) return 0;
    std::copy(p + off, p + off + 4, mask.begin());
    off += 4;
  }
  if (bytes.size() - off < len) return 0;

  out.payload.assign(bytes.substr(off, static_cast<std::size_t>(len)));
  if (out.masked) {
    for (std::size_t i = 0; i < out.payload.size(); ++i) {
      out.payload[i] = static_cast<char>(static_cast<std::uint8_t>(out.payload[i]) ^ mask[i & 3]);
    }
  }
  return off + static_cast<std::size_t>(len);
}

} // namespace pitwall::ws
