/**
 * @file engine.hpp
 * @brief Platoon Protocol Engine: membership view, role, predecessor track.
 *
 * @details
 * ## Field Brief
 * The engine is the per-vehicle protocol brain. It does not own a socket and it
 * does not drive a vehicle. It only knows **messages in**, **role and track
 * out**, plus the occasional **roster reply** for a late joiner. The session
 * feeds it whatever the link delivered and asks it, once per tick, who is in
 * front and whether that data can still be trusted.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Link inbound]            [PlatoonEngine]                 [Session]
 *        │                         │                             │
 *   Message ── handle_inbound() ──►├─ STATE  : predecessor track │
 *        │                         ├─ JOIN   : append (idempotent)
 *        │                         ├─ LEAVE  : contract chain, relink
 *        │                         └─ ROSTER : catch-up (unsynced or resyncing)
 *        │                         │                             │
 *        │                    tick(now) ── discovery window      │
 *        │                         │                             │
 *        ◄──────── get_message() ── outbox (ROSTER replies)      │
 *                                  │                             │
 *                  current_role() / fail_safe_reason(now) ───────►
 * ```
 *
 * ---
 *
 * @par Membership & roles
 * - The chain is ordered by locally observed broadcast order. Index 0 leads,
 *   every other member follows the entry directly ahead of it.
 * - The relay never echoes a frame back to its sender, so this instance's own
 *   JOIN/LEAVE are applied locally by `request_join()` / `announce_leave()`.
 * - The role epoch increments whenever the role kind or predecessor identity
 *   changes. The controller resets its derivative state on a new epoch.
 *
 * ---
 *
 * @par Staleness (read before tuning tick rates)
 * - Window = `staleness_periods` × broadcast period (default 3 × 50 ms).
 * - Predecessor silent for longer than the window → `StalePredecessor`.
 * - After (re)linking and before the first STATE arrives →
 *   `AwaitingPredecessor`, which becomes `StalePredecessor` once a full window
 *   passed since the link time. Both put the controller in fail-safe.
 * - Relinking clears the timer, so a departed predecessor's silence never
 *   counts against the new one.
 *
 * ---
 *
 * @par Roster catch-up
 * A peer joining an existing platoon never saw the earlier JOINs. A leader
 * answers every JOIN from another peer with a ROSTER carrying its full view,
 * once it is *synced* or if it founded the platoon (index 0 of its own view
 * when it joined). An unsynced engine adopts the first roster sent by its own
 * first entry that lists itself. The roster replaces the local view; only peers
 * whose JOIN arrived after this engine's own join are appended behind it. With
 * no roster inside `discovery_window_ms` of its own join the engine declares
 * itself synced with what it has.
 *
 * After a reconnect the session calls `resync()`. The view stays usable, but
 * for one discovery window a roster from the leader is adopted again, so LEAVEs
 * missed while away drop out.
 *
 * ---
 *
 * @par Failure Model
 * - Duplicate JOIN / LEAVE of an absent peer: no-op, logged at debug.
 * - STATE with an old or repeated sequence: ignored.
 * - Records about this instance that arrive from the network (callsign clash):
 *   ignored and logged as a warning.
 * - Outbox full: oldest roster reply is dropped.
 */
#ifndef PLATOON_ENGINE_HPP
#define PLATOON_ENGINE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/deque.h"
#include "platoon/membership.hpp"
#include "platoon/message.hpp"
#include "platoon/types.hpp"

namespace platoon {

enum class RoleKind : uint8_t {
  Unassigned = 0,
  Leader,
  Follower,
};

/// This instance's place in the chain.
struct Role {
  RoleKind kind{RoleKind::Unassigned};
  PeerId   predecessor{};   ///< meaningful only for Follower
  size_t   position{0};     ///< chain index when assigned

  bool operator==(const Role& o) const {
    return kind == o.kind && predecessor == o.predecessor && position == o.position;
  }
  bool operator!=(const Role& o) const { return !(*this == o); }
};

/// Latest accepted state of the current predecessor.
struct PredecessorTrack {
  PeerId       peer{};
  VehicleState state{};
  bool         has_state{false};
  uint64_t     received_ms{0};   ///< local time of the last accepted STATE
  uint64_t     linked_ms{0};     ///< local time the predecessor was (re)assigned
};

/// Why the controller must not trust predecessor data this tick.
enum class FailSafeReason : uint8_t {
  None = 0,
  AwaitingPredecessor,   ///< linked, no STATE yet
  StalePredecessor,      ///< silent past the staleness window
  LinkDown,              ///< link not connected (set by the session)
};

const char* role_name(RoleKind k);
const char* fail_safe_name(FailSafeReason r);

/// What `handle_inbound()` did with a record.
enum class InboundResult : uint8_t {
  Applied = 0,
  Ignored,              ///< not relevant to this instance
  MembershipConflict,   ///< duplicate join / leave of an absent peer
  OutOfOrder,           ///< STATE not newer than the tracked one
};

const char* inbound_result_name(InboundResult r);

class PlatoonEngine {
public:
  static constexpr uint32_t BROADCAST_PERIOD_DEFAULT_MS = 50;
  static constexpr uint32_t STALENESS_PERIODS_DEFAULT   = 3;
  static constexpr uint32_t DISCOVERY_WINDOW_DEFAULT_MS = 500;
  static constexpr size_t   OUTBOX_CAP                  = 8;

  explicit PlatoonEngine(const PeerId& self);

  const PeerId& self_id() const { return self_; }

  /// Dispatch one inbound record. @p now_ms is the local monotonic clock.
  InboundResult handle_inbound(const Message& msg, uint64_t now_ms);

  /// Advance timers (discovery window, staleness episode logging).
  void tick(uint64_t now_ms);

  /// Append self to the local view and return the JOIN to broadcast.
  Message request_join(uint64_t now_ms, uint64_t wall_ms);

  /// Reopen roster catch-up for one discovery window (link came back).
  /// No-op when this instance is not a member.
  void resync(uint64_t now_ms);

  /// Remove self from the local view and return the LEAVE to broadcast.
  Message announce_leave(uint64_t now_ms, uint64_t wall_ms);

  /// Stamp @p s with this peer's id and the next sequence number.
  VehicleState make_state(const VehicleState& s);

  /// Pop the next outbound record (roster replies). False when empty.
  bool get_message(Message& out);

  Role current_role() const { return role_; }
  bool is_member() const { return membership_.contains(self_); }
  bool synced() const { return synced_; }
  bool catching_up() const { return !synced_ || catch_up_; }

  /// None while the predecessor track is fresh (or this instance is not a follower).
  FailSafeReason fail_safe_reason(uint64_t now_ms) const;
  bool predecessor_stale(uint64_t now_ms) const {
    return fail_safe_reason(now_ms) == FailSafeReason::StalePredecessor;
  }

  const PredecessorTrack& track() const { return track_; }
  const Membership& membership() const { return membership_; }
  uint32_t role_epoch() const { return role_epoch_; }
  uint32_t last_sequence() const { return sequence_; }

  // ---- policy knobs ----
  void set_staleness(uint32_t periods, uint32_t broadcast_period_ms) {
    staleness_window_ms_ = static_cast<uint64_t>(periods) * broadcast_period_ms;
  }
  uint64_t staleness_window_ms() const { return staleness_window_ms_; }
  void set_discovery_window_ms(uint32_t ms) { discovery_window_ms_ = ms; }
  uint32_t discovery_window_ms() const { return discovery_window_ms_; }

private:
  InboundResult on_state(const Message& msg, uint64_t now_ms);
  InboundResult on_join(const Message& msg, uint64_t now_ms);
  InboundResult on_leave(const Message& msg, uint64_t now_ms);
  InboundResult on_roster(const Message& msg, uint64_t now_ms);

  /// Recompute role from the view; new epoch + fresh track if it changed.
  void relink(uint64_t now_ms);
  void queue_roster(uint64_t wall_ms);
  void forget_recent(const PeerId& peer);

  PeerId           self_;
  Membership       membership_;
  Role             role_{};
  PredecessorTrack track_{};
  uint32_t         role_epoch_{0};
  uint32_t         sequence_{0};

  bool     synced_{false};
  bool     catch_up_{false};   ///< synced, but a roster is still welcome (after resync)
  bool     founder_{false};    ///< joined as index 0 of its own view
  PeerList recent_;            ///< JOINs applied since our own join / resync
  uint64_t joined_ms_{0};
  bool     stale_reported_{false};

  uint64_t staleness_window_ms_{static_cast<uint64_t>(STALENESS_PERIODS_DEFAULT) * BROADCAST_PERIOD_DEFAULT_MS};
  uint32_t discovery_window_ms_{DISCOVERY_WINDOW_DEFAULT_MS};

  etl::deque<Message, OUTBOX_CAP> outbox_;
};

} // namespace platoon

#endif // PLATOON_ENGINE_HPP
