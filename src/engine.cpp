// -----------------------------------------------------------------------------
// engine.cpp: Implementation of the Platoon Protocol Engine
//
// API, staleness and roster rules:
//   see include/platoon/engine.hpp
//
// Usage & scenarios:
//   see tests/test_engine.cpp
//
// Everything here runs on the session thread. No locks, no heap beyond the
// fixed ETL containers; logging goes through platoon::log.
// -----------------------------------------------------------------------------
#include "platoon/engine.hpp"

#include "platoon/log.hpp"

namespace platoon {

// ---------- names ----------

const char* role_name(RoleKind k) {
  switch (k) {
    case RoleKind::Unassigned: return "unassigned";
    case RoleKind::Leader:     return "leader";
    case RoleKind::Follower:   return "follower";
  }
  return "?";
}

const char* fail_safe_name(FailSafeReason r) {
  switch (r) {
    case FailSafeReason::None:                return "none";
    case FailSafeReason::AwaitingPredecessor: return "awaiting_predecessor";
    case FailSafeReason::StalePredecessor:    return "stale_predecessor";
    case FailSafeReason::LinkDown:            return "link_down";
  }
  return "?";
}

const char* inbound_result_name(InboundResult r) {
  switch (r) {
    case InboundResult::Applied:            return "applied";
    case InboundResult::Ignored:            return "ignored";
    case InboundResult::MembershipConflict: return "membership_conflict";
    case InboundResult::OutOfOrder:         return "out_of_order";
  }
  return "?";
}

// ---------- public ----------

PlatoonEngine::PlatoonEngine(const PeerId& self)
: self_(self) {}

InboundResult PlatoonEngine::handle_inbound(const Message& msg, uint64_t now_ms) {
  // PRE: records about ourselves only ever originate here
  if (msg.kind != MessageKind::Roster && msg.kind != MessageKind::Greeting && msg.peer == self_) {
    log::warn("peer_id_clash", log::Fields().kv("peer", self_.c_str()).kv("kind", kind_name(msg.kind)));
    return InboundResult::Ignored;
  }

  switch (msg.kind) {
    case MessageKind::State:    return on_state(msg, now_ms);
    case MessageKind::Join:     return on_join(msg, now_ms);
    case MessageKind::Leave:    return on_leave(msg, now_ms);
    case MessageKind::Roster:   return on_roster(msg, now_ms);
    case MessageKind::Greeting: return InboundResult::Ignored;   // link-level, never reaches here normally
  }
  return InboundResult::Ignored;
}

void PlatoonEngine::tick(uint64_t now_ms) {
  // Discovery window: nobody answered our JOIN, so our view is the platoon.
  if (catching_up() && is_member() && now_ms >= joined_ms_ + discovery_window_ms_) {
    synced_ = true;
    catch_up_ = false;
    recent_.clear();
    log::info("roster_synced", log::Fields().kv("source", "discovery_timeout")
                                            .kv("members", membership_.to_string()));
  }

  // Staleness is reported once per episode; recovery is logged in on_state().
  if (role_.kind == RoleKind::Follower && !stale_reported_ &&
      fail_safe_reason(now_ms) == FailSafeReason::StalePredecessor) {
    stale_reported_ = true;
    const uint64_t since = track_.has_state ? track_.received_ms : track_.linked_ms;
    log::warn("stale_predecessor", log::Fields().kv("peer", track_.peer.c_str())
                                                .kv("silent_ms", now_ms - since)
                                                .kv("window_ms", staleness_window_ms_));
  }
}

Message PlatoonEngine::request_join(uint64_t now_ms, uint64_t wall_ms) {
  const Membership::Change c = membership_.join(self_);
  if (c == Membership::Change::Applied) {
    synced_ = false;
    catch_up_ = false;
    founder_ = membership_.index_of(self_) == 0;
    joined_ms_ = now_ms;
    recent_.clear();
    relink(now_ms);
    log::info("join", log::Fields().kv("peer", self_.c_str()).kv("members", membership_.to_string()));
  } else {
    // Already a member: the JOIN is re-announced (e.g. after a reconnect) and
    // other engines treat it as a no-op. Full: nothing we can do but report.
    log::debug("join_repeat", log::Fields().kv("peer", self_.c_str()).kv("change", change_name(c)));
  }
  return Message::join(self_, wall_ms);
}

void PlatoonEngine::resync(uint64_t now_ms) {
  if (!is_member()) return;
  if (synced_) catch_up_ = true;
  joined_ms_ = now_ms;
  recent_.clear();
  log::info("resync", log::Fields().kv("members", membership_.to_string()));
}

Message PlatoonEngine::announce_leave(uint64_t now_ms, uint64_t wall_ms) {
  const Membership::Change c = membership_.leave(self_);
  if (c == Membership::Change::Applied) {
    synced_ = false;
    catch_up_ = false;
    founder_ = false;
    recent_.clear();
    relink(now_ms);
    log::info("leave", log::Fields().kv("peer", self_.c_str()).kv("members", membership_.to_string()));
  }
  return Message::leave(self_, wall_ms);
}

VehicleState PlatoonEngine::make_state(const VehicleState& s) {
  VehicleState out = s;
  out.peer = self_;
  out.sequence = ++sequence_;
  return out;
}

bool PlatoonEngine::get_message(Message& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

FailSafeReason PlatoonEngine::fail_safe_reason(uint64_t now_ms) const {
  if (role_.kind != RoleKind::Follower) return FailSafeReason::None;

  if (!track_.has_state) {
    // Timer starts at the link time, never at an old predecessor's last STATE.
    const uint64_t waited = now_ms > track_.linked_ms ? now_ms - track_.linked_ms : 0;
    return waited > staleness_window_ms_ ? FailSafeReason::StalePredecessor
                                         : FailSafeReason::AwaitingPredecessor;
  }

  const uint64_t silent = now_ms > track_.received_ms ? now_ms - track_.received_ms : 0;
  return silent > staleness_window_ms_ ? FailSafeReason::StalePredecessor : FailSafeReason::None;
}

// ---------- private: handlers ----------

// STATE: only the predecessor's records are kept; everything else is noise
// for this instance (the leader ignores all of them).
InboundResult PlatoonEngine::on_state(const Message& msg, uint64_t now_ms) {
  if (role_.kind != RoleKind::Follower || msg.peer != role_.predecessor) {
    return InboundResult::Ignored;
  }

  // POLICY: sequence is the only ordering key; equal means duplicate
  if (track_.has_state && msg.state.sequence <= track_.state.sequence) {
    log::debug("state_out_of_order", log::Fields().kv("peer", msg.peer.c_str())
                                                  .kv("seq", msg.state.sequence)
                                                  .kv("tracked", track_.state.sequence));
    return InboundResult::OutOfOrder;
  }

  track_.state = msg.state;
  track_.has_state = true;
  track_.received_ms = now_ms;

  if (stale_reported_) {
    stale_reported_ = false;
    log::info("predecessor_recovered", log::Fields().kv("peer", msg.peer.c_str())
                                                    .kv("seq", msg.state.sequence));
  }
  return InboundResult::Applied;
}

InboundResult PlatoonEngine::on_join(const Message& msg, uint64_t now_ms) {
  const Membership::Change c = membership_.join(msg.peer);

  // A leader answers every JOIN, repeated ones included: the repeat may come
  // from a peer that reconnected and lost its view. Before its own window
  // closes only the founder answers; anyone else may not know the real head.
  const bool leading = role_.kind == RoleKind::Leader && (synced_ || founder_);

  if (c == Membership::Change::Full) {
    log::warn("membership_full", log::Fields().kv("peer", msg.peer.c_str()).kv("cap", MAX_MEMBERS));
    return InboundResult::Ignored;
  }
  if (c == Membership::Change::AlreadyPresent) {
    log::debug("membership_conflict", log::Fields().kv("kind", "JOIN").kv("peer", msg.peer.c_str()));
    if (leading) queue_roster(msg.timestamp_ms);
    return InboundResult::MembershipConflict;
  }

  if (catching_up() && !recent_.full()) recent_.push_back(msg.peer);
  relink(now_ms);
  log::info("member_joined", log::Fields().kv("peer", msg.peer.c_str()).kv("members", membership_.to_string()));
  if (leading) queue_roster(msg.timestamp_ms);
  return InboundResult::Applied;
}

InboundResult PlatoonEngine::on_leave(const Message& msg, uint64_t now_ms) {
  const Membership::Change c = membership_.leave(msg.peer);
  if (c == Membership::Change::Absent) {
    log::debug("membership_conflict", log::Fields().kv("kind", "LEAVE").kv("peer", msg.peer.c_str()));
    return InboundResult::MembershipConflict;
  }

  forget_recent(msg.peer);

  // Chain contraction: if msg.peer was our predecessor, relink() moves us to
  // the departed peer's former predecessor and restarts the staleness timer.
  relink(now_ms);
  log::info("member_left", log::Fields().kv("peer", msg.peer.c_str()).kv("members", membership_.to_string()));
  return InboundResult::Applied;
}

InboundResult PlatoonEngine::on_roster(const Message& msg, uint64_t now_ms) {
  if (!catching_up() || !is_member()) return InboundResult::Ignored;
  if (msg.roster.empty() || msg.roster[0] != msg.peer) return InboundResult::Ignored;

  bool lists_self = false;
  for (const auto& p : msg.roster) {
    if (p == self_) { lists_self = true; break; }
  }
  if (!lists_self) return InboundResult::Ignored;

  // The roster replaces our view, then anyone we saw join after our own JOIN
  // that the leader had not seen yet when it answered, in observed order.
  PeerList merged = msg.roster;
  for (const auto& p : recent_) {
    bool listed = false;
    for (const auto& q : merged) {
      if (q == p) { listed = true; break; }
    }
    if (!listed && !merged.full()) merged.push_back(p);
  }

  membership_.assign(merged);
  synced_ = true;
  catch_up_ = false;
  recent_.clear();
  relink(now_ms);
  log::info("roster_synced", log::Fields().kv("source", msg.peer.c_str())
                                          .kv("members", membership_.to_string()));
  return InboundResult::Applied;
}

// ---------- private: helpers ----------

void PlatoonEngine::relink(uint64_t now_ms) {
  Role next;
  const int idx = membership_.index_of(self_);
  if (idx == 0) {
    next.kind = RoleKind::Leader;
  } else if (idx > 0) {
    next.kind = RoleKind::Follower;
    next.position = static_cast<size_t>(idx);
    next.predecessor = membership_[static_cast<size_t>(idx - 1)];
  }

  const bool changed = next.kind != role_.kind || next.predecessor != role_.predecessor;
  role_ = next;       // position may shift without a new epoch
  if (!changed) return;

  ++role_epoch_;
  track_ = PredecessorTrack{};
  track_.peer = role_.predecessor;
  track_.linked_ms = now_ms;
  stale_reported_ = false;

  log::info("role", log::Fields().kv("role", role_name(role_.kind))
                                 .kv("predecessor", role_.kind == RoleKind::Follower ? role_.predecessor.c_str() : "-")
                                 .kv("epoch", role_epoch_));
}

void PlatoonEngine::queue_roster(uint64_t wall_ms) {
  if (outbox_.full()) {
    outbox_.pop_front();
    log::warn("outbox_full", log::Fields().kv("dropped", "ROSTER"));
  }
  outbox_.push_back(Message::roster_snapshot(self_, wall_ms, membership_.members()));
}

void PlatoonEngine::forget_recent(const PeerId& peer) {
  for (auto it = recent_.begin(); it != recent_.end(); ++it) {
    if (*it == peer) {
      recent_.erase(it);
      return;
    }
  }
}

} // namespace platoon
