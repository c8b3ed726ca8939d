/**
 * @file relay.hpp
 * @brief Message Relay: accepts peers and fans every record out to all others.
 *
 * @details
 * The relay is deliberately dumb. It never decodes a platoon message, never
 * merges or drops one, and never invents one (no LEAVE on disconnect). Its only
 * contract:
 *
 * - Every frame read from connection C is queued, byte for byte, on every other
 *   connection's outbound queue before C's next frame is read. Per-sender order
 *   is therefore preserved at every receiver.
 * - A connection whose write fails (or whose queue overruns) is torn down alone;
 *   the others never wait on it.
 * - A newly accepted connection first receives `RELAY~<version>`, the greeting
 *   the peer client waits for before it calls the link up.
 *
 * ```
 *  peer A ─► reader(A) ──┬─► queue(B) ─► writer(B) ─► peer B
 *                        └─► queue(C) ─► writer(C) ─► peer C
 * ```
 *
 * Threads: one acceptor, plus a reader and a writer per connection. The peer set
 * is guarded by one mutex; each queue by its own.
 */
#pragma once

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace platoon::transport {

struct RelayConfig {
  std::string host{"0.0.0.0"};
  uint16_t    port{52384};          ///< 0 = ephemeral (tests)
  size_t      peer_queue_cap{4096}; ///< frames; overrun counts as a transport failure
  int         poll_ms{100};         ///< wake-up granularity for shutdown
};

class Relay {
public:
  explicit Relay(const RelayConfig& cfg = RelayConfig{});
  ~Relay() { stop(); }
  Relay(const Relay&) = delete;
  Relay& operator=(const Relay&) = delete;

  /// Bind, listen and start accepting. False if the socket cannot be bound.
  bool start();

  /// Stop accepting, close every connection, join all threads. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  /// Port actually bound (resolves port 0).
  uint16_t port() const { return port_; }

  size_t peer_count() const;
  uint64_t frames_forwarded() const { return forwarded_.load(); }

private:
  using Frame = std::shared_ptr<const std::vector<uint8_t>>;

  struct Peer {
    uint64_t                id{0};
    int                     fd{-1};
    std::string             desc;
    std::mutex              mu;
    std::condition_variable cv;
    std::deque<Frame>       queue;
    std::atomic<bool>       dead{false};
    std::thread             reader;
    std::thread             writer;
  };
  using PeerPtr = std::shared_ptr<Peer>;

  void accept_loop();
  void reader_loop(PeerPtr p);
  void writer_loop(PeerPtr p);

  /// Queue @p frame on every live peer except @p from.
  void fan_out(const Peer& from, const Frame& frame);

  /// Remove from the peer set and wake its threads. First caller wins.
  void retire(const PeerPtr& p, const char* reason);

  /// Join and close retired peers (never called from a peer's own thread).
  void reap();

  RelayConfig cfg_;
  int         listen_fd_{-1};
  uint16_t    port_{0};

  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> forwarded_{0};
  uint64_t              next_id_{1};
  std::thread           acceptor_;

  mutable std::mutex   peers_mu_;
  std::vector<PeerPtr> peers_;
  std::vector<PeerPtr> retired_;
};

} // namespace platoon::transport
