// -----------------------------------------------------------------------------
// controller.cpp: Implementation of the gap-keeping controller
//
// Control law & constants: see include/platoon/controller.hpp
// Scenarios: tests/test_controller.cpp
//
// Every output goes through ControlCommand::normalized(), which is the single
// place that guarantees throttle and brake are never both non-zero.
// -----------------------------------------------------------------------------
#include "platoon/controller.hpp"

#include <algorithm>
#include <cmath>

namespace platoon {

namespace {

bool finite_nonneg(double v) { return std::isfinite(v) && v >= 0.0; }

double clampd(double v, double lo, double hi) { return std::min(hi, std::max(lo, v)); }

} // namespace

// ---------- gains / names ----------

bool ControllerGains::valid() const {
  if (!finite_nonneg(kp) || !finite_nonneg(kd)) return false;
  if (!finite_nonneg(heading_gain) || !finite_nonneg(lateral_gain)) return false;
  if (!finite_nonneg(vehicle_length_m) || !finite_nonneg(min_safe_gap_m)) return false;
  if (!finite_nonneg(gap_tolerance_m) || !finite_nonneg(brake_feedforward)) return false;
  if (!(max_accel > 0.0) || !(max_decel > 0.0) || !(max_gap_error_m > 0.0)) return false;
  if (!(failsafe_brake > 0.0 && failsafe_brake <= 1.0)) return false;
  if (!(dv_filter_alpha > 0.0 && dv_filter_alpha <= 1.0)) return false;
  return std::isfinite(max_accel) && std::isfinite(max_decel) && std::isfinite(max_gap_error_m);
}

const char* drive_mode_name(DriveMode m) {
  switch (m) {
    case DriveMode::Cruise:        return "cruise";
    case DriveMode::FullStop:      return "full_stop";
    case DriveMode::AdjustBack:    return "adjust_back";
    case DriveMode::AdjustForward: return "adjust_forward";
    case DriveMode::Maintain:      return "maintain";
    case DriveMode::FailSafe:      return "fail_safe";
    case DriveMode::Scripted:      return "scripted";
    case DriveMode::Idle:          return "idle";
  }
  return "?";
}

// ---------- public ----------

GapController::GapController(const ControllerGains& gains, const ControllerTargets& targets)
: gains_(gains), targets_(targets) {}

ControlOutput GapController::follow(const VehicleState& own, const VehicleState& pred, uint32_t epoch) {
  track_epoch(epoch);

  ControlOutput out;
  out.gap_m = longitudinal_gap(own, pred);
  const double d = targets_.gap_m;
  out.gap_error_m = clampd(std::max(out.gap_m, 0.0) - d, -d, gains_.max_gap_error_m);

  // PRE: filter relative speed; first sample after a reset seeds the filter
  const double dv = pred.velocity.x * std::cos(own.heading) + pred.velocity.y * std::sin(own.heading)
                  - own.longitudinal_speed();
  if (!have_dv_) {
    dv_filtered_ = dv;
    have_dv_ = true;
  } else {
    dv_filtered_ += gains_.dv_filter_alpha * (dv - dv_filtered_);
  }

  // Lateral: align heading, then pull toward the predecessor's track.
  const double dx = pred.position.x - own.position.x;
  const double dy = pred.position.y - own.position.y;
  const double lateral = -dx * std::sin(own.heading) + dy * std::cos(own.heading);
  const double steer = gains_.heading_gain * wrap_angle(pred.heading - own.heading)
                     + gains_.lateral_gain * lateral;

  // POLICY: FULL_STOP latches until the gap clears the release hysteresis
  const double stop_below = gains_.min_safe_gap_m +
                            (last_mode_ == DriveMode::FullStop ? FULL_STOP_RELEASE_M : 0.0);
  if (out.gap_m < stop_below) {
    out.mode = DriveMode::FullStop;
    out.accel = -gains_.max_decel;
    out.command = ControlCommand{0.0, 1.0, steer}.normalized();
    last_mode_ = out.mode;
    return out;
  }

  out.accel = clampd(gains_.kp * out.gap_error_m + gains_.kd * dv_filtered_,
                     -gains_.max_decel, gains_.max_accel);

  if (out.gap_error_m < -gains_.gap_tolerance_m)     out.mode = DriveMode::AdjustBack;
  else if (out.gap_error_m > gains_.gap_tolerance_m) out.mode = DriveMode::AdjustForward;
  else                                               out.mode = DriveMode::Maintain;

  ControlCommand cmd = map_accel(out.accel);
  // Predecessor already braking: never throttle into it, follow its lead softly.
  if (out.accel > 0.0 && pred.brake > 0.0) {
    cmd.throttle = 0.0;
    cmd.brake = gains_.brake_feedforward * pred.brake;
  }
  cmd.steer = steer;
  out.command = cmd.normalized();
  last_mode_ = out.mode;
  return out;
}

ControlOutput GapController::lead(const VehicleState& own, uint32_t epoch) {
  track_epoch(epoch);
  ControlOutput out;
  out.mode = DriveMode::Cruise;
  out.accel = clampd(gains_.kd * (targets_.speed_mps - own.longitudinal_speed()),
                     -gains_.max_decel, gains_.max_accel);
  out.command = map_accel(out.accel).normalized();
  last_mode_ = out.mode;
  return out;
}

ControlOutput GapController::scripted(const ControlCommand& step, uint32_t epoch) {
  track_epoch(epoch);
  ControlOutput out;
  out.mode = DriveMode::Scripted;
  out.command = ControlCommand{step.throttle, step.brake, 0.0}.normalized();
  out.accel = out.command.brake > 0.0 ? -out.command.brake * gains_.max_decel
                                      : out.command.throttle * gains_.max_accel;
  last_mode_ = out.mode;
  return out;
}

ControlOutput GapController::idle() {
  reset();
  ControlOutput out;
  out.mode = DriveMode::Idle;
  out.command = ControlCommand{0.0, gains_.failsafe_brake, 0.0}.normalized();
  last_mode_ = out.mode;
  return out;
}

ControlOutput GapController::fail_safe(FailSafeReason reason) {
  reset();
  ControlOutput out;
  out.mode = DriveMode::FailSafe;
  out.reason = reason;
  out.command = ControlCommand{0.0, gains_.failsafe_brake, 0.0}.normalized();
  out.accel = -gains_.failsafe_brake * gains_.max_decel;
  last_mode_ = out.mode;
  return out;
}

void GapController::reset() {
  have_dv_ = false;
  dv_filtered_ = 0.0;
  last_mode_ = DriveMode::FailSafe;
}

bool GapController::set_target_gap(double meters) {
  if (!std::isfinite(meters) || meters <= 0.0 || meters > MAX_TARGET_GAP_M) return false;
  targets_.gap_m = meters;
  return true;
}

bool GapController::set_target_speed(double mps) {
  if (!std::isfinite(mps) || mps < 0.0 || mps > MAX_TARGET_SPEED_MPS) return false;
  targets_.speed_mps = mps;
  return true;
}

double GapController::longitudinal_gap(const VehicleState& own, const VehicleState& pred) const {
  const double dx = pred.position.x - own.position.x;
  const double dy = pred.position.y - own.position.y;
  return dx * std::cos(own.heading) + dy * std::sin(own.heading) - gains_.vehicle_length_m;
}

// ---------- private ----------

void GapController::track_epoch(uint32_t epoch) {
  if (!have_epoch_ || epoch != epoch_) {
    reset();
    epoch_ = epoch;
    have_epoch_ = true;
  }
}

ControlCommand GapController::map_accel(double a) const {
  ControlCommand c;
  if (a > 0.0)      c.throttle = std::min(1.0, a / gains_.max_accel);
  else if (a < 0.0) c.brake = std::min(1.0, -a / gains_.max_decel);
  return c;
}

} // namespace platoon
