/**
 * @file vehicle.hpp
 * @brief Vehicle handle seam + a kinematic stand-in for running without a simulator.
 *
 * The session only ever talks to `VehicleHandle`. A simulator binding implements
 * the same two calls against its actor; `KinematicVehicle` is the built-in
 * implementation used by `platoon-vehicle` and the tests.
 *
 * Model (per `step(dt)`):
 * - longitudinal: a = throttle·max_accel − brake·max_brake − drag·v|v|,
 *   speed never reverses under braking.
 * - heading: kinematic bicycle, yaw rate = v · tan(steer·max_steer) / wheelbase.
 *
 * After `destroy()` every call fails, the way a simulator reports a despawned
 * actor. The session treats that as `VehicleLost`.
 */
#ifndef PLATOON_VEHICLE_HPP
#define PLATOON_VEHICLE_HPP

#include <stdint.h>
#include <memory>
#include <string>
#include "platoon/types.hpp"

namespace platoon {

/// Raw pose/velocity read back from a vehicle.
struct VehicleKinematics {
  Vec3     position{};
  Vec3     velocity{};
  double   heading{0.0};
  uint64_t timestamp_ms{0};
};

class VehicleHandle {
public:
  virtual ~VehicleHandle() = default;

  /// Read the current state. False if the vehicle is gone.
  virtual bool get_state(VehicleKinematics& out) = 0;

  /// Apply throttle/brake/steer. False if the vehicle is gone.
  virtual bool apply_control(const ControlCommand& cmd) = 0;

  virtual const char* name() const = 0;
};

struct VehicleLimits {
  double max_accel{3.0};          ///< m/s² at full throttle
  double max_brake{6.0};          ///< m/s² at full brake
  double drag{0.0005};            ///< quadratic drag, 1/m
  double wheelbase_m{2.7};
  double max_steer_rad{0.610865}; ///< 35 degrees
  double max_speed{60.0};
};

class KinematicVehicle : public VehicleHandle {
public:
  KinematicVehicle(const std::string& blueprint, const Vec3& location, double heading,
                   const VehicleLimits& limits = VehicleLimits{});

  bool get_state(VehicleKinematics& out) override;
  bool apply_control(const ControlCommand& cmd) override;
  const char* name() const override { return blueprint_.c_str(); }

  /// Integrate @p dt_s seconds with the last applied command.
  void step(double dt_s);

  /// Advance by wall time elapsed since the previous read on every get_state().
  void set_realtime(bool on);

  /// Despawn: all later calls fail.
  void destroy() { alive_ = false; }
  bool alive() const { return alive_; }

  /// Seed a forward speed along the current heading.
  void set_speed(double mps) { speed_ = mps; }
  double speed() const { return speed_; }
  const ControlCommand& last_control() const { return control_; }
  const VehicleLimits& limits() const { return limits_; }

private:
  std::string    blueprint_;
  VehicleLimits  limits_;
  Vec3           position_;
  double         heading_;
  double         speed_{0.0};
  ControlCommand control_{};
  uint64_t       sim_ms_{0};
  bool           alive_{true};
  bool           realtime_{false};
  uint64_t       last_wall_ms_{0};
};

/// Default blueprint, the sedan the platoon prototype spawned.
static constexpr const char* DEFAULT_BLUEPRINT = "vehicle.toyota.prius";

/// Limits for a known blueprint. False if the name is not in the catalogue.
bool blueprint_limits(const std::string& blueprint, VehicleLimits& out);

/// Spawn a kinematic vehicle; nullptr for an unknown blueprint.
std::unique_ptr<KinematicVehicle> spawn(const std::string& blueprint, const Vec3& location, double heading);

} // namespace platoon

#endif // PLATOON_VEHICLE_HPP
