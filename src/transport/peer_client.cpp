// -----------------------------------------------------------------------------
// peer_client.cpp: Implementation of the Peer Client
//
// Lifecycle & stream semantics: see include/platoon/transport/peer_client.hpp
// Live tests: tests/test_peer_client.cpp
//
// Locking: mu_ guards the send queue, fd_, stop_, writing_, stream_ and the
// handler. The socket is only closed while no write is in flight (writing_),
// so the writer can never hit a descriptor number that was already reused.
// -----------------------------------------------------------------------------
#include "platoon/transport/peer_client.hpp"

#include "platoon/log.hpp"

#include <chrono>
#include <utility>

namespace platoon::transport {

namespace {

uint64_t steady_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

// ---------- names ----------

const char* link_state_name(LinkState s) {
  switch (s) {
    case LinkState::Idle:         return "idle";
    case LinkState::Connecting:   return "connecting";
    case LinkState::Connected:    return "connected";
    case LinkState::Reconnecting: return "reconnecting";
    case LinkState::Disconnected: return "disconnected";
  }
  return "?";
}

const char* connect_result_name(ConnectResult r) {
  switch (r) {
    case ConnectResult::Ok:              return "ok";
    case ConnectResult::ConnectionError: return "connection_error";
    case ConnectResult::BadAddress:      return "bad_address";
  }
  return "?";
}

uint32_t backoff_delay_ms(const ClientConfig& cfg, uint32_t attempt) {
  uint64_t d = cfg.backoff_initial_ms;
  for (uint32_t i = 0; i < attempt && d < cfg.backoff_max_ms; ++i) d *= 2;
  return static_cast<uint32_t>(d < cfg.backoff_max_ms ? d : cfg.backoff_max_ms);
}

// ---------- InboundStream ----------

bool InboundStream::next(Message& out, int timeout_ms) {
  if (!st_) return false;
  std::unique_lock<std::mutex> lk(st_->mu);
  st_->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                   [&] { return !st_->queue.empty() || st_->closed; });
  if (st_->queue.empty()) return false;
  out = st_->queue.front();
  st_->queue.pop_front();
  return true;
}

bool InboundStream::try_next(Message& out) {
  if (!st_) return false;
  std::lock_guard<std::mutex> lk(st_->mu);
  if (st_->queue.empty()) return false;
  out = st_->queue.front();
  st_->queue.pop_front();
  return true;
}

bool InboundStream::ended() const {
  if (!st_) return true;
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->closed && st_->queue.empty();
}

size_t InboundStream::pending() const {
  if (!st_) return 0;
  std::lock_guard<std::mutex> lk(st_->mu);
  return st_->queue.size();
}

void InboundStream::push(const Message& m) {
  if (!st_) return;
  {
    std::lock_guard<std::mutex> lk(st_->mu);
    if (st_->closed) return;
    st_->queue.push_back(m);
  }
  st_->cv.notify_all();
}

void InboundStream::close() {
  if (!st_) return;
  {
    std::lock_guard<std::mutex> lk(st_->mu);
    st_->closed = true;
  }
  st_->cv.notify_all();
}

// ---------- PeerClient: public ----------

PeerClient::PeerClient(const ClientConfig& cfg)
: cfg_(cfg) {}

PeerClient::~PeerClient() {
  shutdown_link();
}

ConnectResult PeerClient::connect(const std::string& address) {
  Address a = cfg_.relay;
  if (!parse_address(address, a)) {
    log::error("connect", log::Fields().kv("status", "error").kv("reason", "bad_address").kv("addr", address));
    return ConnectResult::BadAddress;
  }
  cfg_.relay = a;
  return connect();
}

ConnectResult PeerClient::connect() {
  // A previous session (if any) ends here, along with its stream.
  shutdown_link();
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = false;
    sendq_.clear();
    stream_ = std::make_shared<InboundStream::State>();
  }
  set_state(LinkState::Connecting);

  const int fd = attempt_with_retries();
  if (fd < 0) {
    set_state(LinkState::Disconnected);
    InboundStream(stream_).close();
    log::error("connect", log::Fields().kv("status", "error").kv("reason", "connection_error")
                                       .kv("relay", cfg_.relay.host + ":" + std::to_string(cfg_.relay.port))
                                       .kv("attempts", cfg_.retry_limit + 1));
    return ConnectResult::ConnectionError;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    fd_ = fd;
    generation_.fetch_add(1);
    state_.store(LinkState::Connected);
  }
  cv_.notify_all();

  reader_ = std::thread(&PeerClient::reader_loop, this);
  writer_ = std::thread(&PeerClient::writer_loop, this);
  log::info("connected", log::Fields().kv("relay", cfg_.relay.host + ":" + std::to_string(cfg_.relay.port)));
  return ConnectResult::Ok;
}

void PeerClient::disconnect() {
  drain_and_close(cfg_.drain_timeout_ms);
}

void PeerClient::close(uint32_t drain_ms) {
  drain_and_close(drain_ms);
}

InboundStream PeerClient::receive() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stream_ ? InboundStream(stream_) : InboundStream();
}

void PeerClient::set_disconnect_handler(DisconnectHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  on_disconnect_ = std::move(h);
}

bool PeerClient::send(const Message& m) {
  Text255 stamp;
  const MessageStatus ms = encode(m, stamp);
  if (ms != MessageStatus::Ok) {
    log::warn("encode_failed", log::Fields().kv("kind", kind_name(m.kind)).kv("reason", status_name(ms)));
    return false;
  }
  std::vector<uint8_t> wire;
  slip::encode(reinterpret_cast<const uint8_t*>(stamp.c_str()), stamp.size(), wire);

  bool dropped = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const LinkState s = state_.load();
    if (stop_ || s == LinkState::Idle || s == LinkState::Disconnected) return false;
    if (sendq_.size() >= cfg_.send_queue_cap) {
      sendq_.pop_front();
      dropped = true;
    }
    sendq_.push_back(std::move(wire));
  }
  cv_.notify_all();

  if (dropped) {
    const uint64_t n = dropped_.fetch_add(1) + 1;
    log::warn("send_queue_full", log::Fields().kv("dropped", "oldest").kv("total_dropped", n));
  }
  return true;
}

// ---------- PeerClient: connection attempts ----------

// One TCP connect + greeting. Anything that follows the greeting in the same
// read already belongs to the stream.
int PeerClient::attempt(const char*& why) {
  const int fd = connect_to(cfg_.relay, static_cast<int>(cfg_.connect_timeout_ms));
  if (fd < 0) { why = "connect_failed"; return -1; }

  decoder_.reset();
  const uint64_t deadline = steady_ms() + cfg_.handshake_timeout_ms;
  std::vector<std::vector<uint8_t>> frames;
  bool greeted = false;

  while (!greeted) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) { why = "stopped"; close_socket(fd); return -1; }
    }
    const uint64_t now = steady_ms();
    if (now >= deadline) { why = "handshake_timeout"; close_socket(fd); return -1; }
    const int wait = static_cast<int>(deadline - now < (uint64_t)cfg_.poll_ms ? deadline - now : cfg_.poll_ms);

    frames.clear();
    const IoStatus st = read_frames(fd, decoder_, frames, wait);
    for (const auto& f : frames) {
      if (greeted) { deliver(f); continue; }
      Message m;
      if (decode(reinterpret_cast<const char*>(f.data()), f.size(), m) != MessageStatus::Ok ||
          m.kind != MessageKind::Greeting) {
        why = "no_greeting";
        close_socket(fd);
        return -1;
      }
      if (m.version != PROTOCOL_VERSION) {
        why = "version_mismatch";
        close_socket(fd);
        return -1;
      }
      greeted = true;
    }
    if (!greeted && (st == IoStatus::Closed || st == IoStatus::Error)) {
      why = "closed_during_handshake";
      close_socket(fd);
      return -1;
    }
  }
  return fd;
}

int PeerClient::attempt_with_retries() {
  for (uint32_t n = 0;; ++n) {
    const char* why = "";
    const int fd = attempt(why);
    if (fd >= 0) return fd;

    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) return -1;
    }
    log::warn("connect_attempt_failed", log::Fields().kv("relay", cfg_.relay.host + ":" + std::to_string(cfg_.relay.port))
                                                     .kv("attempt", n + 1)
                                                     .kv("reason", why));
    if (n >= cfg_.retry_limit) return -1;
    if (!backoff_sleep(backoff_delay_ms(cfg_, n))) return -1;
  }
}

// ---------- PeerClient: threads ----------

void PeerClient::reader_loop() {
  int fd = -1;
  {
    std::lock_guard<std::mutex> lk(mu_);
    fd = fd_;
  }
  std::vector<std::vector<uint8_t>> frames;

  while (true) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) return;
    }
    frames.clear();
    const IoStatus st = read_frames(fd, decoder_, frames, cfg_.poll_ms);
    for (const auto& f : frames) deliver(f);
    if (st == IoStatus::Ok || st == IoStatus::Timeout) continue;

    // ---- transport failure: reconnect in place ----
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_) return;
    }
    log::warn("link_lost", log::Fields().kv("reason", io_status_name(st)));
    set_state(LinkState::Reconnecting);
    shutdown_socket(fd);
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] { return !writing_ || stop_; });
      if (stop_) return;
      close_socket(fd_);
      fd_ = -1;
    }

    fd = attempt_with_retries();
    if (fd < 0) {
      DisconnectHandler handler;
      {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) return;
        stop_ = true;                 // writer exits, send() refuses
        handler = on_disconnect_;
        state_.store(LinkState::Disconnected);
      }
      cv_.notify_all();
      InboundStream(stream_).close();
      log::error("link_down", log::Fields().kv("reason", "retries_exhausted").kv("retries", cfg_.retry_limit));
      if (handler) handler("retries_exhausted");
      return;
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      fd_ = fd;
      generation_.fetch_add(1);
      state_.store(LinkState::Connected);
    }
    cv_.notify_all();
    log::info("link_restored", log::Fields().kv("generation", generation_.load()));
  }
}

void PeerClient::writer_loop() {
  while (true) {
    std::vector<uint8_t> frame;
    int fd = -1;
    uint32_t gen = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] {
        return stop_ || (state_.load() == LinkState::Connected && fd_ >= 0 && !sendq_.empty());
      });
      if (stop_) return;
      frame = std::move(sendq_.front());
      sendq_.pop_front();
      fd = fd_;
      gen = generation_.load();
      writing_ = true;
    }

    const bool ok = write_all(fd, frame.data(), frame.size());
    if (!ok) shutdown_socket(fd);      // still ours: the reader waits on writing_

    {
      std::lock_guard<std::mutex> lk(mu_);
      writing_ = false;
      if (!ok) sendq_.push_front(std::move(frame));   // resend on the next connection
    }
    cv_.notify_all();

    if (!ok) {
      log::warn("send_failed", log::Fields().kv("generation", gen));
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] { return stop_ || generation_.load() != gen; });
    }
  }
}

// ---------- PeerClient: teardown ----------

void PeerClient::drain_and_close(uint32_t drain_ms) {
  {
    std::unique_lock<std::mutex> lk(mu_);
    const LinkState s = state_.load();
    if (s == LinkState::Connected || s == LinkState::Reconnecting) {
      const bool drained = cv_.wait_for(lk, std::chrono::milliseconds(drain_ms),
                                        [&] { return stop_ || (sendq_.empty() && !writing_); });
      if (!drained) {
        log::warn("drain_timeout", log::Fields().kv("pending", sendq_.size()).kv("waited_ms", drain_ms));
      }
    }
  }
  const bool was_idle = state_.load() == LinkState::Idle;
  shutdown_link();
  if (!was_idle) set_state(LinkState::Disconnected);
  log::info("disconnected", log::Fields().kv("relay", cfg_.relay.host + ":" + std::to_string(cfg_.relay.port)));
}

void PeerClient::shutdown_link() {
  int fd = -1;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
    fd = fd_;
  }
  cv_.notify_all();
  shutdown_socket(fd);

  if (reader_.joinable()) reader_.join();
  if (writer_.joinable()) writer_.join();

  std::shared_ptr<InboundStream::State> st;
  {
    std::lock_guard<std::mutex> lk(mu_);
    close_socket(fd_);
    fd_ = -1;
    sendq_.clear();
    st = stream_;
  }
  InboundStream(st).close();
}

bool PeerClient::backoff_sleep(uint32_t ms) {
  std::unique_lock<std::mutex> lk(mu_);
  return !cv_.wait_for(lk, std::chrono::milliseconds(ms), [&] { return stop_; });
}

void PeerClient::set_state(LinkState s) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    state_.store(s);
  }
  cv_.notify_all();
}

void PeerClient::deliver(const std::vector<uint8_t>& frame) {
  Message m;
  const MessageStatus ms = decode(reinterpret_cast<const char*>(frame.data()), frame.size(), m);
  if (ms != MessageStatus::Ok) {
    log::warn("bad_frame", log::Fields().kv("reason", status_name(ms)).kv("bytes", frame.size()));
    return;
  }
  if (m.kind == MessageKind::Greeting) return;    // only meaningful during the handshake

  std::shared_ptr<InboundStream::State> st;
  {
    std::lock_guard<std::mutex> lk(mu_);
    st = stream_;
  }
  InboundStream(st).push(m);
}

} // namespace platoon::transport
