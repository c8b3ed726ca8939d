// ============================================================================
// socket_io.cpp: implementation for socket_io.hpp
// For API/overview see the matching .hpp. For usage, tests/test_relay.cpp.
// ============================================================================
#include "platoon/transport/socket_io.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace platoon::transport {

namespace {

// ---------------------------------------------------------------------------
// tune_connected()
// Per-connection options: no Nagle delay, bounded blocking writes.
// ---------------------------------------------------------------------------
void tune_connected(int fd) {
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  timeval tv{};
  tv.tv_sec = 2;
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool set_nonblocking(int fd, bool on) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  const int next = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, next) == 0;
}

bool parse_port(const std::string& s, uint16_t& out) {
  if (s.empty()) return false;
  char* e = nullptr;
  const long v = std::strtol(s.c_str(), &e, 10);
  if (!e || *e) return false;
  if (v < 1 || v > 65535) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

} // namespace

const char* io_status_name(IoStatus s) {
  switch (s) {
    case IoStatus::Ok:      return "ok";
    case IoStatus::Timeout: return "timeout";
    case IoStatus::Closed:  return "closed";
    case IoStatus::Error:   return "error";
  }
  return "?";
}

// ---------------------------------------------------------------------------
// parse_address()
// "host:port" | "host" | ":port". Last ':' splits, so plain IPv4 and names work;
// bracketed IPv6 is not supported.
// ---------------------------------------------------------------------------
bool parse_address(const std::string& text, Address& out) {
  if (text.empty()) return false;
  Address a = out;
  const size_t colon = text.rfind(':');
  if (colon == std::string::npos) {
    a.host = text;
  } else {
    if (colon > 0) a.host = text.substr(0, colon);
    if (!parse_port(text.substr(colon + 1), a.port)) return false;
  }
  if (a.host.empty()) return false;
  out = a;
  return true;
}

// ---------------------------------------------------------------------------
// open_listener()
// SO_REUSEADDR so a restarted relay can rebind while old sockets sit in
// TIME_WAIT.
// ---------------------------------------------------------------------------
int open_listener(const std::string& host, uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  const char* node = (host.empty() || host == "*") ? nullptr : host.c_str();
  if (::getaddrinfo(node, service.c_str(), &hints, &res) != 0 || !res) return -1;

  int fd = -1;
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, backlog) == 0) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  return fd;
}

uint16_t local_port(int fd) {
  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) != 0) return 0;
  return ntohs(sa.sin_port);
}

int accept_peer(int listen_fd, int timeout_ms, std::string& peer_desc) {
  pollfd pfd{listen_fd, POLLIN, 0};
  const int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr <= 0 || !(pfd.revents & POLLIN)) return -1;

  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  const int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&sa), &len);
  if (fd < 0) return -1;

  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &sa.sin_addr, ip, sizeof(ip));
  peer_desc = std::string(ip) + ":" + std::to_string(ntohs(sa.sin_port));
  tune_connected(fd);
  return fd;
}

// ---------------------------------------------------------------------------
// connect_to()
// Non-blocking connect + poll gives a real timeout; the socket is switched back
// to blocking mode before it is handed out.
// ---------------------------------------------------------------------------
int connect_to(const Address& addr, int timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const std::string service = std::to_string(addr.port);
  if (::getaddrinfo(addr.host.c_str(), service.c_str(), &hints, &res) != 0 || !res) return -1;

  int fd = -1;
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    if (!set_nonblocking(fd, true)) { ::close(fd); fd = -1; continue; }

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      rc = -1;
      if (::poll(&pfd, 1, timeout_ms) == 1) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) rc = 0;
      }
    }
    if (rc == 0 && set_nonblocking(fd, false)) break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd >= 0) tune_connected(fd);
  return fd;
}

bool write_all(int fd, const uint8_t* data, size_t n) {
  size_t off = 0;
  while (off < n) {
    const ssize_t w = ::send(fd, data + off, n - off, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;           // EAGAIN here means the send timeout expired
    }
    off += static_cast<size_t>(w);
  }
  return true;
}

bool write_frame(int fd, const uint8_t* payload, size_t n) {
  std::vector<uint8_t> out;
  slip::encode(payload, n, out);
  return write_all(fd, out.data(), out.size());
}

IoStatus read_frames(int fd, slip::Decoder& dec, std::vector<std::vector<uint8_t>>& frames,
                     int timeout_ms) {
  pollfd pfd{fd, POLLIN, 0};
  const int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return IoStatus::Timeout;
  if (pr < 0) return errno == EINTR ? IoStatus::Timeout : IoStatus::Error;
  if (pfd.revents & POLLNVAL) return IoStatus::Error;

  uint8_t buf[4096];
  const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
  if (n == 0) return IoStatus::Closed;
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) return IoStatus::Timeout;
    return IoStatus::Error;
  }

  std::vector<uint8_t> frame;
  for (ssize_t i = 0; i < n; ++i) {
    if (dec.feed(buf[i], frame)) {
      frames.push_back(std::move(frame));
      frame.clear();
    }
  }
  return IoStatus::Ok;
}

void shutdown_socket(int fd) {
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void close_socket(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace platoon::transport
