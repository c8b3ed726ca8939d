// ============================================================================
// vehicle.cpp: kinematic stand-in vehicle and blueprint catalogue
// ============================================================================
#include "platoon/vehicle.hpp"

#include <chrono>
#include <cmath>

namespace platoon {

namespace {

struct Blueprint {
  const char*   name;
  VehicleLimits limits;
};

// Sedan, hatchback and a box truck; the truck accelerates and brakes softer
// and turns on a longer wheelbase.
const Blueprint kCatalogue[] = {
  {"vehicle.toyota.prius",           {3.0, 6.0, 0.0005, 2.7, 0.610865, 60.0}},
  {"vehicle.tesla.model3",           {4.0, 7.0, 0.0004, 2.9, 0.610865, 60.0}},
  {"vehicle.carlamotors.carlacotruck", {1.5, 4.5, 0.0008, 4.2, 0.523599, 30.0}},
};

uint64_t steady_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

KinematicVehicle::KinematicVehicle(const std::string& blueprint, const Vec3& location, double heading,
                                   const VehicleLimits& limits)
: blueprint_(blueprint), limits_(limits), position_(location), heading_(wrap_angle(heading)) {}

bool KinematicVehicle::get_state(VehicleKinematics& out) {
  if (!alive_) return false;

  if (realtime_) {
    const uint64_t now = steady_ms();
    if (now > last_wall_ms_) step(static_cast<double>(now - last_wall_ms_) / 1000.0);
    last_wall_ms_ = now;
  }

  out.position = position_;
  out.velocity = Vec3{speed_ * std::cos(heading_), speed_ * std::sin(heading_), 0.0};
  out.heading = heading_;
  out.timestamp_ms = sim_ms_;
  return true;
}

bool KinematicVehicle::apply_control(const ControlCommand& cmd) {
  if (!alive_) return false;
  control_ = cmd.normalized();
  return true;
}

void KinematicVehicle::step(double dt_s) {
  if (!alive_ || !(dt_s > 0.0)) return;

  // Longitudinal. Braking and drag only ever bring the car to rest.
  const double drive = control_.throttle * limits_.max_accel;
  const double resist = control_.brake * limits_.max_brake + limits_.drag * speed_ * speed_;
  double v = speed_ + drive * dt_s;
  if (v > 0.0) {
    v -= resist * dt_s;
    if (v < 0.0) v = 0.0;
  }
  if (v > limits_.max_speed) v = limits_.max_speed;

  // Lateral: kinematic bicycle on the mean speed of the step.
  const double v_mid = 0.5 * (speed_ + v);
  const double yaw_rate = limits_.wheelbase_m > 0.0
      ? v_mid * std::tan(control_.steer * limits_.max_steer_rad) / limits_.wheelbase_m
      : 0.0;
  const double h_mid = heading_ + 0.5 * yaw_rate * dt_s;

  position_.x += v_mid * std::cos(h_mid) * dt_s;
  position_.y += v_mid * std::sin(h_mid) * dt_s;
  heading_ = wrap_angle(heading_ + yaw_rate * dt_s);
  speed_ = v;
  sim_ms_ += static_cast<uint64_t>(std::llround(dt_s * 1000.0));
}

void KinematicVehicle::set_realtime(bool on) {
  realtime_ = on;
  last_wall_ms_ = steady_ms();
}

bool blueprint_limits(const std::string& blueprint, VehicleLimits& out) {
  for (const auto& bp : kCatalogue) {
    if (blueprint == bp.name) {
      out = bp.limits;
      return true;
    }
  }
  return false;
}

std::unique_ptr<KinematicVehicle> spawn(const std::string& blueprint, const Vec3& location, double heading) {
  VehicleLimits limits;
  if (!blueprint_limits(blueprint, limits)) return nullptr;
  return std::make_unique<KinematicVehicle>(blueprint, location, heading, limits);
}

} // namespace platoon
