// -----------------------------------------------------------------------------
// session.cpp: Implementation of the Vehicle Session
//
// Tick order & exit statuses: see include/platoon/session.hpp
// Scenarios over an in-memory bus: tests/test_session.cpp
// -----------------------------------------------------------------------------
#include "platoon/session.hpp"

#include "platoon/log.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <thread>

namespace platoon {

namespace {

uint64_t steady_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

uint64_t wall_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

// ---------- names ----------

const char* session_status_name(SessionStatus s) {
  switch (s) {
    case SessionStatus::Running:     return "running";
    case SessionStatus::Left:        return "left";
    case SessionStatus::LinkLost:    return "link_lost";
    case SessionStatus::VehicleLost: return "vehicle_lost";
  }
  return "?";
}

int exit_code(SessionStatus s) {
  switch (s) {
    case SessionStatus::Running:     return 0;
    case SessionStatus::Left:        return 0;
    case SessionStatus::LinkLost:    return 1;
    case SessionStatus::VehicleLost: return 3;
  }
  return 1;
}

// ---------- CommandQueue ----------

void CommandQueue::push(const OperatorCommand& c) {
  std::lock_guard<std::mutex> lk(mu_);
  q_.push_back(c);
}

bool CommandQueue::pop(OperatorCommand& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.empty()) return false;
  out = q_.front();
  q_.pop_front();
  return true;
}

size_t CommandQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

// ---------- VehicleSession: public ----------

VehicleSession::VehicleSession(const PeerId& self, VehicleHandle& vehicle, transport::Link& link,
                               const SessionConfig& cfg)
: vehicle_(vehicle),
  link_(link),
  cfg_(cfg),
  engine_(self),
  controller_(cfg.gains, cfg.targets),
  link_generation_(link.generation()),
  console_(&std::cout) {
  engine_.set_staleness(cfg_.staleness_periods, cfg_.period_ms());
  engine_.set_discovery_window_ms(cfg_.discovery_window_ms);
}

SessionStatus VehicleSession::tick(uint64_t now_ms, uint64_t wall) {
  if (status_ != SessionStatus::Running) return status_;
  ++ticks_;

  // PRE: vehicle first; without it nothing else matters
  VehicleKinematics k;
  if (!vehicle_.get_state(k)) {
    log::error("vehicle_lost", log::Fields().kv("vehicle", vehicle_.name()).kv("op", "get_state"));
    status_ = SessionStatus::VehicleLost;
    return status_;
  }
  own_.peer = engine_.self_id();
  own_.position = k.position;
  own_.velocity = k.velocity;
  own_.heading = k.heading;
  own_.timestamp_ms = wall;
  own_.throttle = applied_.throttle;
  own_.brake = applied_.brake;

  // Publish. Silent lead-path steps skip the broadcast entirely.
  PathStep step;
  const bool muted = engine_.current_role().kind == RoleKind::Leader &&
                     path_.current(now_ms, step) && !step.broadcast;
  if (!muted) {
    own_ = engine_.make_state(own_);
    send(Message::state_update(own_));
  }

  // The link came back under us: re-announce, and let the leader's roster
  // reply replace whatever view we kept while we were away.
  const uint32_t gen = link_.generation();
  if (gen != link_generation_) {
    link_generation_ = gen;
    if (engine_.is_member()) {
      engine_.resync(now_ms);
      send(Message::join(engine_.self_id(), wall));
    }
  }

  Message in;
  while (link_.poll(in)) {
    const InboundResult r = engine_.handle_inbound(in, now_ms);
    if (r == InboundResult::OutOfOrder) {
      log::debug("inbound", log::Fields().kv("kind", kind_name(in.kind)).kv("result", inbound_result_name(r)));
    }
  }

  OperatorCommand cmd;
  while (status_ == SessionStatus::Running && commands_.pop(cmd)) apply_command(cmd, now_ms, wall);

  engine_.tick(now_ms);
  Message out;
  while (engine_.get_message(out)) send(out);

  last_out_ = compute(own_, now_ms);

  if (!vehicle_.apply_control(last_out_.command)) {
    log::error("vehicle_lost", log::Fields().kv("vehicle", vehicle_.name()).kv("op", "apply_control"));
    status_ = SessionStatus::VehicleLost;
    return status_;
  }
  applied_ = last_out_.command;

  if (status_ == SessionStatus::Running && link_.state() == transport::LinkState::Disconnected) {
    log::error("session_end", log::Fields().kv("status", "error").kv("reason", "link_lost"));
    status_ = SessionStatus::LinkLost;
  }
  return status_;
}

SessionStatus VehicleSession::run(const std::atomic<bool>& stop) {
  using clock = std::chrono::steady_clock;
  const auto period = std::chrono::milliseconds(cfg_.period_ms());
  auto next = clock::now();

  log::info("session_start", log::Fields().kv("id", engine_.self_id().c_str())
                                          .kv("tick_hz", cfg_.tick_hz)
                                          .kv("vehicle", vehicle_.name()));

  while (!stop.load()) {
    if (tick(steady_ms(), wall_ms()) != SessionStatus::Running) break;

    // Fixed cadence; after an overrun the next tick starts now, never in a burst.
    next += period;
    const auto t = clock::now();
    if (next < t) {
      next = t;
    } else {
      std::this_thread::sleep_until(next);
    }
  }

  if (status_ == SessionStatus::Running) leave(steady_ms(), wall_ms());

  log::info("session_end", log::Fields().kv("status", session_status_name(status_))
                                        .kv("ticks", ticks_)
                                        .kv("exit", exit_code(status_)));
  return status_;
}

bool VehicleSession::join(uint64_t now_ms, uint64_t wall) {
  const bool was_member = engine_.is_member();
  const Message m = engine_.request_join(now_ms, wall);
  if (!engine_.is_member()) {
    log::warn("join_rejected", log::Fields().kv("reason", "platoon_full").kv("members", engine_.membership().size()));
    return false;
  }
  if (was_member) log::info("join", log::Fields().kv("status", "already_member"));
  return send(m);
}

void VehicleSession::leave(uint64_t now_ms, uint64_t wall) {
  if (status_ != SessionStatus::Running) return;
  path_.cancel();
  if (engine_.is_member()) send(engine_.announce_leave(now_ms, wall));

  // Park before the link goes away; fail-safe level brake, no steer.
  last_out_ = controller_.idle();
  if (vehicle_.apply_control(last_out_.command)) applied_ = last_out_.command;

  link_.close(cfg_.drain_timeout_ms);
  status_ = SessionStatus::Left;
}

bool VehicleSession::set_target_gap(double meters) {
  if (!controller_.set_target_gap(meters)) {
    log::warn("set_target_gap", log::Fields().kv("status", "error").kv("reason", "out_of_range").kv("value", meters));
    return false;
  }
  log::info("set_target_gap", log::Fields().kv("gap_m", meters));
  return true;
}

bool VehicleSession::set_target_speed(double mps) {
  if (!controller_.set_target_speed(mps)) {
    log::warn("set_target_speed", log::Fields().kv("status", "error").kv("reason", "out_of_range").kv("value", mps));
    return false;
  }
  log::info("set_target_speed", log::Fields().kv("speed_mps", mps));
  return true;
}

bool VehicleSession::run_path(int n, uint64_t now_ms) {
  if (engine_.current_role().kind != RoleKind::Leader) {
    log::warn("path_rejected", log::Fields().kv("path", n).kv("reason", "not_leader"));
    return false;
  }
  if (!path_.start(n, now_ms)) {
    log::warn("path_rejected", log::Fields().kv("path", n).kv("reason", "unknown_path"));
    return false;
  }
  log::info("path_start", log::Fields().kv("path", n).kv("title", lead_path_title(n)));
  return true;
}

std::string VehicleSession::status_line(uint64_t now_ms) const {
  const Role role = engine_.current_role();
  char num[96];
  std::string s;
  s += "id=";
  s += engine_.self_id().c_str();
  s += " role=";
  s += role_name(role.kind);
  if (role.kind == RoleKind::Follower) {
    s += " predecessor=";
    s += role.predecessor.c_str();
  }
  s += " members=";
  s += engine_.membership().empty() ? "-" : engine_.membership().to_string();
  s += " synced=";
  s += engine_.synced() ? "1" : "0";
  s += " mode=";
  s += drive_mode_name(last_out_.mode);
  if (last_out_.mode == DriveMode::FailSafe) {
    s += " reason=";
    s += fail_safe_name(last_out_.reason);
  } else if (role.kind == RoleKind::Follower) {
    std::snprintf(num, sizeof(num), " gap_m=%.2f", last_out_.gap_m);
    s += num;
  }
  std::snprintf(num, sizeof(num), " speed_mps=%.2f target_gap_m=%.1f target_speed_mps=%.1f",
                own_.longitudinal_speed(), controller_.targets().gap_m, controller_.targets().speed_mps);
  s += num;
  if (path_.active()) {
    std::snprintf(num, sizeof(num), " path=%d", path_.number());
    s += num;
  }
  s += " link=";
  s += transport::link_state_name(link_.state());
  if (role.kind == RoleKind::Follower && engine_.track().has_state) {
    const uint64_t age = now_ms > engine_.track().received_ms ? now_ms - engine_.track().received_ms : 0;
    std::snprintf(num, sizeof(num), " track_age_ms=%llu", static_cast<unsigned long long>(age));
    s += num;
  }
  return s;
}

// ---------- VehicleSession: private ----------

void VehicleSession::apply_command(const OperatorCommand& c, uint64_t now_ms, uint64_t wall) {
  log::debug("operator_command", log::Fields().kv("cmd", operator_command_name(c.kind)));
  switch (c.kind) {
    case OperatorCommandKind::Join:     join(now_ms, wall); break;
    case OperatorCommandKind::Leave:    leave(now_ms, wall); break;
    case OperatorCommandKind::Quit:     leave(now_ms, wall); break;
    case OperatorCommandKind::SetGap:   set_target_gap(c.value); break;
    case OperatorCommandKind::SetSpeed: set_target_speed(c.value); break;
    case OperatorCommandKind::Path:     run_path(c.path, now_ms); break;
    case OperatorCommandKind::Status:
      if (console_) *console_ << status_line(now_ms) << std::endl;
      break;
    case OperatorCommandKind::Help:
      if (console_) *console_ << operator_help() << std::flush;
      break;
  }
}

bool VehicleSession::send(const Message& m) {
  if (link_.send(m)) return true;
  log::debug("send_skipped", log::Fields().kv("kind", kind_name(m.kind))
                                          .kv("link", transport::link_state_name(link_.state())));
  return false;
}

ControlOutput VehicleSession::compute(const VehicleState& own, uint64_t now_ms) {
  if (status_ == SessionStatus::Left) return last_out_;    // leave() already parked the car

  const transport::LinkState ls = link_.state();
  if (ls != transport::LinkState::Connected) return controller_.fail_safe(FailSafeReason::LinkDown);

  const Role role = engine_.current_role();
  switch (role.kind) {
    case RoleKind::Unassigned:
      path_.cancel();
      return controller_.idle();

    case RoleKind::Leader: {
      // Head of a view nobody confirmed yet; a roster may still put us behind
      // someone, so hold still until the discovery window settles it.
      if (!engine_.synced()) {
        path_.cancel();
        return controller_.idle();
      }
      PathStep step;
      if (path_.current(now_ms, step)) {
        return controller_.scripted(ControlCommand{step.throttle, step.brake, 0.0}, engine_.role_epoch());
      }
      if (path_.take_finished()) {
        // Profiles end on the brake; hold the car rather than cruising off again.
        controller_.set_target_speed(0.0);
        log::info("path_complete", log::Fields().kv("target_speed_mps", 0));
      }
      return controller_.lead(own, engine_.role_epoch());
    }

    case RoleKind::Follower: {
      path_.cancel();
      const FailSafeReason why = engine_.fail_safe_reason(now_ms);
      if (why != FailSafeReason::None) return controller_.fail_safe(why);
      return controller_.follow(own, engine_.track().state, engine_.role_epoch());
    }
  }
  return controller_.fail_safe(FailSafeReason::None);
}

} // namespace platoon
