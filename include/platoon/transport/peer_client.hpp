/**
 * @file peer_client.hpp
 * @brief Peer Client: one vehicle's connection to the relay.
 *
 * @details
 * PURPOSE
 * -------
 * Owns the TCP session to the relay and hides every transport wrinkle from the
 * vehicle session: the greeting handshake, reconnect with bounded exponential
 * backoff, a send path that never waits on the network, and an inbound stream
 * that keeps flowing across reconnects.
 *
 * CONNECTION LIFECYCLE
 * --------------------
 *   Idle ─connect()─► Connecting ─greeting─► Connected
 *                          │                     │ transport failure
 *                          │ retries exhausted   ▼
 *                          └──────────────► Reconnecting ─ok─► Connected
 *                                                │ retries exhausted
 *                                                ▼
 *                             Disconnected ◄── disconnect()
 *
 * A connect attempt is: TCP connect within `connect_timeout_ms`, then the
 * relay's `RELAY~<version>` greeting within `handshake_timeout_ms`. Failed
 * attempts are retried after 500 ms, 1 s, 2 s, ... capped at 8 s, up to
 * `retry_limit` times.
 *
 * THREADS
 * -------
 * - writer: drains the send queue onto the socket. Queue is FIFO, bounded
 *   (`send_queue_cap`); on overflow the oldest frame is dropped and logged.
 * - reader: decodes inbound frames into the stream and runs reconnects.
 * Sending therefore never waits for inbound data, and vice versa.
 *
 * STREAM SEMANTICS
 * ----------------
 * `receive()` returns the stream of the current connection. It survives
 * automatic reconnects, ends after `disconnect()` or retry exhaustion, and is
 * never restarted: a new `connect()` creates a new stream.
 */
#pragma once

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "platoon/message.hpp"
#include "platoon/slip.hpp"
#include "platoon/transport/link.hpp"
#include "platoon/transport/socket_io.hpp"

namespace platoon::transport {

enum class ConnectResult : uint8_t {
  Ok = 0,
  ConnectionError,   ///< retries exhausted
  BadAddress,
};

const char* connect_result_name(ConnectResult r);

struct ClientConfig {
  Address  relay{};
  uint32_t retry_limit{5};
  uint32_t backoff_initial_ms{500};
  uint32_t backoff_max_ms{8000};
  uint32_t connect_timeout_ms{2000};
  uint32_t handshake_timeout_ms{2000};
  uint32_t drain_timeout_ms{1000};
  size_t   send_queue_cap{256};
  int      poll_ms{100};
};

/// Delay before retry number @p attempt (0-based): initial · 2^attempt, capped.
uint32_t backoff_delay_ms(const ClientConfig& cfg, uint32_t attempt);

/**
 * @brief Lazy sequence of decoded inbound messages, in relay-forwarded order.
 *
 * Copies share the same underlying stream. A default-constructed stream is
 * already ended.
 */
class InboundStream {
public:
  InboundStream() = default;

  /// Wait up to @p timeout_ms for the next message. False on timeout or end.
  bool next(Message& out, int timeout_ms);

  /// Non-blocking variant of next().
  bool try_next(Message& out);

  /// True once the stream was closed and everything buffered was consumed.
  bool ended() const;

  size_t pending() const;

private:
  friend class PeerClient;

  struct State {
    mutable std::mutex      mu;
    std::condition_variable cv;
    std::deque<Message>     queue;
    bool                    closed{false};
  };

  explicit InboundStream(std::shared_ptr<State> st) : st_(std::move(st)) {}

  void push(const Message& m);
  void close();

  std::shared_ptr<State> st_;
};

class PeerClient : public Link {
public:
  using DisconnectHandler = std::function<void(const char* reason)>;

  explicit PeerClient(const ClientConfig& cfg = ClientConfig{});
  ~PeerClient() override;
  PeerClient(const PeerClient&) = delete;
  PeerClient& operator=(const PeerClient&) = delete;

  /// Establish a session with the configured relay (blocks through retries).
  ConnectResult connect();

  /// Same, with a "host:port" override.
  ConnectResult connect(const std::string& address);

  /// Drain pending sends (bounded by drain_timeout_ms), close, end the stream.
  void disconnect();

  /// Stream of the current connection (ended stream when never connected).
  InboundStream receive() const;

  /**
   * @brief Called from the reader thread once retries are exhausted.
   * Must not call disconnect() or connect() on this client.
   */
  void set_disconnect_handler(DisconnectHandler h);

  // Link
  bool        send(const Message& m) override;
  bool        poll(Message& out) override { return receive().try_next(out); }
  LinkState   state() const override { return state_.load(); }
  uint32_t    generation() const override { return generation_.load(); }
  void        close(uint32_t drain_ms) override;
  const char* name() const override { return "tcp"; }

  uint64_t dropped_sends() const { return dropped_.load(); }
  const ClientConfig& config() const { return cfg_; }

private:
  /// One connect + handshake attempt. Returns the fd, or -1 with @p why set.
  int attempt(const char*& why);

  /// attempt() with backoff; -1 after exhaustion or stop.
  int attempt_with_retries();

  void reader_loop();
  void writer_loop();

  /// Wait up to @p drain_ms for the send queue to empty, then shutdown_link().
  void drain_and_close(uint32_t drain_ms);

  /// Stop threads, close the socket, drop pending sends, end the stream.
  void shutdown_link();

  /// Interruptible sleep; false if stopping.
  bool backoff_sleep(uint32_t ms);

  void set_state(LinkState s);
  void deliver(const std::vector<uint8_t>& frame);

  ClientConfig cfg_;

  mutable std::mutex               mu_;
  std::condition_variable          cv_;
  std::deque<std::vector<uint8_t>> sendq_;   ///< SLIP-encoded frames
  int                              fd_{-1};
  bool                             stop_{false};
  bool                             writing_{false};
  std::shared_ptr<InboundStream::State> stream_;
  DisconnectHandler                on_disconnect_;

  std::atomic<LinkState> state_{LinkState::Idle};
  std::atomic<uint32_t>  generation_{0};
  std::atomic<uint64_t>  dropped_{0};

  slip::Decoder decoder_;   ///< reader thread only
  std::thread   reader_;
  std::thread   writer_;
};

} // namespace platoon::transport
