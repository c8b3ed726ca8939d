/**
 * @file socket_io.hpp
 * @brief POSIX TCP helpers for moving SLIP-framed records between relay and peers.
 *
 * @details
 * PURPOSE
 * -------
 * The relay and the peer client share the same small set of socket calls:
 * resolve an address, listen or connect with a timeout, write one frame
 * completely, and pull whatever frames arrived within a poll window. Keeping
 * them as free functions on plain file descriptors keeps both sides boring.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   relay.cpp       -> open_listener() -> accept_peer() -> read_frames()/write_all()
 *   peer_client.cpp -> connect_to()    -> read_frames()/write_all()
 *                   \-> slip.hpp (framing)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Writes use MSG_NOSIGNAL so a vanished peer is an error return, never SIGPIPE.
 * - Connected sockets get TCP_NODELAY (records are tiny and latency matters)
 *   and a send timeout, so a wedged receiver cannot hold a writer forever.
 * - `read_frames()` polls once and reads what is there; a return of `Ok` with
 *   no frames is normal (partial record buffered in the decoder).
 * - Descriptors are not shared between threads without the caller's locking;
 *   `shutdown_socket()` is the one call meant to be made from another thread,
 *   to wake a reader blocked in poll.
 */
#pragma once

#include <stdint.h>
#include <string>
#include <vector>
#include "platoon/slip.hpp"

namespace platoon::transport {

/// Default relay port (inherited from the first platoon prototype).
static constexpr uint16_t DEFAULT_PORT = 52384;

struct Address {
  std::string host{"127.0.0.1"};
  uint16_t    port{DEFAULT_PORT};
};

enum class IoStatus : uint8_t {
  Ok = 0,
  Timeout,    ///< nothing arrived within the poll window
  Closed,     ///< orderly shutdown by the remote side
  Error,
};

const char* io_status_name(IoStatus s);

/**
 * @brief Parse "host:port", "host" or ":port".
 *
 * A missing part keeps the value already in @p out. Port must be 1..65535.
 */
bool parse_address(const std::string& text, Address& out);

/// Bind + listen. Port 0 picks an ephemeral port. Returns fd or -1.
int open_listener(const std::string& host, uint16_t port, int backlog = 16);

/// Port a bound socket actually listens on (0 on failure).
uint16_t local_port(int fd);

/**
 * @brief Wait up to @p timeout_ms for one inbound connection.
 * @return fd >= 0 on success, -1 on timeout or error. @p peer_desc gets "ip:port".
 */
int accept_peer(int listen_fd, int timeout_ms, std::string& peer_desc);

/// Resolve and connect within @p timeout_ms. Returns a blocking fd or -1.
int connect_to(const Address& addr, int timeout_ms);

/// Write all @p n bytes (loops over partial writes). False on any failure.
bool write_all(int fd, const uint8_t* data, size_t n);

/// SLIP-encode @p payload and write the whole frame.
bool write_frame(int fd, const uint8_t* payload, size_t n);

/**
 * @brief Poll once (up to @p timeout_ms), read what arrived, decode frames.
 *
 * Completed payloads are appended to @p frames. The decoder keeps partial
 * records across calls.
 */
IoStatus read_frames(int fd, slip::Decoder& dec, std::vector<std::vector<uint8_t>>& frames,
                     int timeout_ms);

/// shutdown(SHUT_RDWR); wakes any thread polling the descriptor.
void shutdown_socket(int fd);

/// Close if valid (>= 0).
void close_socket(int fd);

} // namespace platoon::transport
