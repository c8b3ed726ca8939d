#pragma once
/**
 * @file link.hpp
 * @brief Minimal, session-agnostic link interface between a vehicle and the platoon.
 *
 * The vehicle session never touches sockets. It sends records and drains
 * whatever arrived once per tick through this interface. `PeerClient` is the
 * TCP implementation; tests plug in an in-memory bus.
 *
 * Contract:
 *  - send(m) never blocks for long; false if the link cannot take records at all.
 *  - poll(m) pops one buffered inbound record, false when none is pending.
 *  - state() is safe to call from any thread.
 *  - generation() increments every time the link (re)establishes, so a caller
 *    can notice a reconnect it did not see happen.
 *  - close(drain_ms) flushes pending sends for at most drain_ms, then disconnects.
 */

#include <stdint.h>
#include "platoon/message.hpp"

namespace platoon::transport {

enum class LinkState : uint8_t {
  Idle = 0,       ///< never connected
  Connecting,
  Connected,
  Reconnecting,   ///< transport failed, backoff/retry in progress
  Disconnected,   ///< closed explicitly or retries exhausted
};

const char* link_state_name(LinkState s);

class Link {
public:
  virtual ~Link() = default;
  virtual bool        send(const Message& m) = 0;
  virtual bool        poll(Message& out) = 0;
  virtual LinkState   state() const = 0;
  virtual uint32_t    generation() const = 0;
  virtual void        close(uint32_t drain_ms) = 0;
  virtual const char* name() const = 0;
};

} // namespace platoon::transport
