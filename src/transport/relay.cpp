// -----------------------------------------------------------------------------
// relay.cpp: Implementation of the Message Relay
//
// Contract & threading: see include/platoon/transport/relay.hpp
// Live tests: tests/test_relay.cpp
//
// Frames are forwarded as the canonical SLIP encoding of the payload the reader
// decoded, which is byte-identical to what any platoon peer put on the wire.
// -----------------------------------------------------------------------------
#include "platoon/transport/relay.hpp"

#include "platoon/log.hpp"
#include "platoon/message.hpp"
#include "platoon/slip.hpp"
#include "platoon/transport/socket_io.hpp"

namespace platoon::transport {

Relay::Relay(const RelayConfig& cfg)
: cfg_(cfg) {}

bool Relay::start() {
  if (running_.load()) return true;

  listen_fd_ = open_listener(cfg_.host, cfg_.port);
  if (listen_fd_ < 0) {
    log::error("relay_bind_failed", log::Fields().kv("host", cfg_.host).kv("port", cfg_.port));
    return false;
  }
  port_ = local_port(listen_fd_);

  running_.store(true);
  acceptor_ = std::thread(&Relay::accept_loop, this);
  log::info("relay_listening", log::Fields().kv("host", cfg_.host).kv("port", port_));
  return true;
}

void Relay::stop() {
  if (!running_.exchange(false)) return;

  if (acceptor_.joinable()) acceptor_.join();
  close_socket(listen_fd_);
  listen_fd_ = -1;

  std::vector<PeerPtr> live;
  {
    std::lock_guard<std::mutex> lk(peers_mu_);
    live = peers_;
  }
  for (const auto& p : live) retire(p, "relay_stopping");
  reap();
  log::info("relay_stopped", log::Fields().kv("forwarded", forwarded_.load()));
}

size_t Relay::peer_count() const {
  std::lock_guard<std::mutex> lk(peers_mu_);
  return peers_.size();
}

// ---------- acceptor ----------

void Relay::accept_loop() {
  // Greeting is encoded once; every new peer gets the same bytes.
  Text255 stamp;
  const MessageStatus ms = encode(Message::greeting(), stamp);
  if (ms != MessageStatus::Ok) {
    log::error("relay_greeting", log::Fields().kv("reason", status_name(ms)));
    return;
  }
  std::vector<uint8_t> hello;
  slip::encode(reinterpret_cast<const uint8_t*>(stamp.c_str()), stamp.size(), hello);
  const Frame greeting = std::make_shared<const std::vector<uint8_t>>(std::move(hello));

  while (running_.load()) {
    reap();

    std::string desc;
    const int fd = accept_peer(listen_fd_, cfg_.poll_ms, desc);
    if (fd < 0) continue;

    auto p = std::make_shared<Peer>();
    p->id = next_id_++;
    p->fd = fd;
    p->desc = desc;
    p->queue.push_back(greeting);      // first thing on the wire, never fanned out

    // Join the set before the reader runs so a fast sender's first frame
    // cannot race a half-registered peer.
    {
      std::lock_guard<std::mutex> lk(peers_mu_);
      peers_.push_back(p);
    }
    p->reader = std::thread(&Relay::reader_loop, this, p);
    p->writer = std::thread(&Relay::writer_loop, this, p);

    log::info("peer_connected", log::Fields().kv("conn", p->id).kv("addr", p->desc)
                                             .kv("peers", peer_count()));
  }
}

// ---------- per-peer threads ----------

void Relay::reader_loop(PeerPtr p) {
  slip::Decoder dec;
  std::vector<std::vector<uint8_t>> frames;

  while (running_.load() && !p->dead.load()) {
    frames.clear();
    const IoStatus st = read_frames(p->fd, dec, frames, cfg_.poll_ms);
    if (st == IoStatus::Timeout) continue;

    // Frames that completed in this read go out even if the socket then closed.
    for (const auto& payload : frames) {
      std::vector<uint8_t> wire;
      slip::encode(payload.data(), payload.size(), wire);
      fan_out(*p, std::make_shared<const std::vector<uint8_t>>(std::move(wire)));
    }

    if (st == IoStatus::Closed || st == IoStatus::Error) {
      retire(p, st == IoStatus::Closed ? "closed" : "read_error");
      return;
    }
  }
}

void Relay::writer_loop(PeerPtr p) {
  while (true) {
    Frame f;
    {
      std::unique_lock<std::mutex> lk(p->mu);
      p->cv.wait(lk, [&] { return p->dead.load() || !p->queue.empty(); });
      if (p->dead.load()) return;
      f = p->queue.front();
      p->queue.pop_front();
    }
    if (!write_all(p->fd, f->data(), f->size())) {
      retire(p, "write_error");
      return;
    }
  }
}

void Relay::fan_out(const Peer& from, const Frame& frame) {
  std::vector<PeerPtr> overrun;
  {
    std::lock_guard<std::mutex> lk(peers_mu_);
    for (const auto& to : peers_) {
      if (to.get() == &from || to->dead.load()) continue;
      std::lock_guard<std::mutex> qlk(to->mu);
      if (to->queue.size() >= cfg_.peer_queue_cap) {
        overrun.push_back(to);
        continue;
      }
      to->queue.push_back(frame);
      to->cv.notify_one();
    }
  }
  forwarded_.fetch_add(1);

  // retire() takes peers_mu_ itself.
  for (const auto& p : overrun) retire(p, "queue_overrun");
}

// ---------- teardown ----------

void Relay::retire(const PeerPtr& p, const char* reason) {
  if (p->dead.exchange(true)) return;

  shutdown_socket(p->fd);            // wakes the reader, fails a blocked write
  {
    std::lock_guard<std::mutex> qlk(p->mu);
    p->queue.clear();
  }
  p->cv.notify_all();

  size_t left = 0;
  {
    std::lock_guard<std::mutex> lk(peers_mu_);
    for (auto it = peers_.begin(); it != peers_.end(); ++it) {
      if (*it == p) { peers_.erase(it); break; }
    }
    retired_.push_back(p);
    left = peers_.size();
  }
  log::info("peer_disconnected", log::Fields().kv("conn", p->id).kv("addr", p->desc)
                                              .kv("reason", reason).kv("peers", left));
}

void Relay::reap() {
  std::vector<PeerPtr> done;
  {
    std::lock_guard<std::mutex> lk(peers_mu_);
    done.swap(retired_);
  }
  for (const auto& p : done) {
    if (p->reader.joinable()) p->reader.join();
    if (p->writer.joinable()) p->writer.join();
    close_socket(p->fd);
    p->fd = -1;
  }
}

} // namespace platoon::transport
