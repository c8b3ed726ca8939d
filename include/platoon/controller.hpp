/**
 * @file controller.hpp
 * @brief Gap-keeping controller: PD longitudinal law plus heading steer.
 *
 * One call per control tick. The controller is a pure function of its inputs
 * and a small amount of filter state (last Δv, last drive mode), reset whenever
 * the engine's role epoch changes or fail-safe is entered.
 *
 * ```
 *   gap = (pred.pos - own.pos) · own_heading_unit  - vehicle_length
 *   e   = clamp(max(gap, 0) - d_target, -d_target, max_gap_error)
 *   Δv  = lowpass(pred.speed - own.speed)            (speeds along own heading)
 *   a   = clamp(kp·e + kd·Δv, -max_decel, max_accel)
 *   a>0 → throttle = min(1, a/max_accel)   a<0 → brake = min(1, -a/max_decel)
 * ```
 *
 * Drive modes follow the follower state machine of the first platoon prototype:
 * FULL_STOP below the minimum safe gap (0.2 m release hysteresis), ADJUST_BACK /
 * ADJUST_FORWARD outside the tolerance band, MAINTAIN inside it. When the
 * predecessor reports braking while we would accelerate, we brake at half its
 * strength instead (`brake_feedforward`).
 */
#ifndef PLATOON_CONTROLLER_HPP
#define PLATOON_CONTROLLER_HPP

#include <stdint.h>
#include "platoon/engine.hpp"
#include "platoon/types.hpp"

namespace platoon {

/// Operator limits for the targets (also enforced by the console parser).
static constexpr double MAX_TARGET_GAP_M     = 200.0;
static constexpr double MAX_TARGET_SPEED_MPS = 60.0;

/// Hysteresis added to `min_safe_gap_m` before FULL_STOP is released.
static constexpr double FULL_STOP_RELEASE_M  = 0.2;

struct ControllerGains {
  double kp{0.5};                 ///< (m/s²) per metre of gap error
  double kd{0.6};                 ///< (m/s²) per m/s of relative speed
  double max_accel{3.0};          ///< m/s²
  double max_decel{6.0};          ///< m/s²
  double failsafe_brake{0.6};
  double min_safe_gap_m{1.5};
  double gap_tolerance_m{0.5};
  double vehicle_length_m{4.5};
  double heading_gain{1.0};       ///< steer per radian of heading error
  double lateral_gain{0.1};       ///< steer per metre of lateral offset
  double brake_feedforward{0.5};
  double dv_filter_alpha{0.5};    ///< weight of the newest Δv sample, (0, 1]
  double max_gap_error_m{20.0};

  /// All gains finite and non-negative, limits positive, alpha in (0, 1].
  bool valid() const;
};

struct ControllerTargets {
  double gap_m{10.0};
  double speed_mps{10.0};
};

enum class DriveMode : uint8_t {
  Cruise = 0,       ///< leader speed regulation
  FullStop,
  AdjustBack,
  AdjustForward,
  Maintain,
  FailSafe,
  Scripted,         ///< leader running a lead path
  Idle,             ///< not in a platoon, holding still
};

const char* drive_mode_name(DriveMode m);

struct ControlOutput {
  ControlCommand command{};
  DriveMode      mode{DriveMode::FailSafe};
  FailSafeReason reason{FailSafeReason::None};
  double         gap_m{0.0};        ///< followers only
  double         gap_error_m{0.0};  ///< followers only
  double         accel{0.0};        ///< commanded acceleration before mapping
};

class GapController {
public:
  explicit GapController(const ControllerGains& gains = ControllerGains{},
                         const ControllerTargets& targets = ControllerTargets{});

  /// Follower tick against a fresh predecessor state.
  ControlOutput follow(const VehicleState& own, const VehicleState& pred, uint32_t epoch);

  /// Leader tick: speed regulation to the target speed, no steering.
  ControlOutput lead(const VehicleState& own, uint32_t epoch);

  /// Leader tick with a lead-path step supplying throttle/brake.
  ControlOutput scripted(const ControlCommand& step, uint32_t epoch);

  /// Outside the platoon: no throttle, parking brake at the fail-safe level.
  ControlOutput idle();

  /// Constant fail-safe command; also clears filter state.
  ControlOutput fail_safe(FailSafeReason reason);

  /// Drop derivative/filter state and mode memory.
  void reset();

  bool set_target_gap(double meters);
  bool set_target_speed(double mps);
  const ControllerTargets& targets() const { return targets_; }

  void set_gains(const ControllerGains& g) { gains_ = g; reset(); }
  const ControllerGains& gains() const { return gains_; }

  /// Gap along own heading, bumper to bumper (may be negative on overlap).
  double longitudinal_gap(const VehicleState& own, const VehicleState& pred) const;

private:
  void track_epoch(uint32_t epoch);
  ControlCommand map_accel(double a) const;

  ControllerGains   gains_;
  ControllerTargets targets_;

  bool      have_dv_{false};
  double    dv_filtered_{0.0};
  DriveMode last_mode_{DriveMode::FailSafe};
  bool      have_epoch_{false};
  uint32_t  epoch_{0};
};

} // namespace platoon

#endif // PLATOON_CONTROLLER_HPP
