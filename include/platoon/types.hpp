/**
 * @file types.hpp
 * @brief Platoon value types: peer identity, vehicle state, control command.
 *
 * These are the small, copyable records every other module passes around:
 *
 *  - `PeerId`        : fixed-capacity callsign (ETL string, no heap).
 *  - `Vec3`          : position / velocity triple in metres or metres per second.
 *  - `VehicleState`  : what a vehicle broadcasts about itself on every tick.
 *  - `ControlCommand`: throttle / brake / steer handed to the vehicle handle.
 *
 * ## Conventions
 * - World frame is right-handed, metres. `heading` is in radians, counter-clockwise
 *   from +x. Steer +1 turns toward increasing heading (left).
 * - Timestamps are milliseconds. `timestamp_ms` in `VehicleState` is wall clock
 *   (sender side); local bookkeeping uses a monotonic millisecond counter.
 * - `ControlCommand` never carries throttle and brake at the same time. Use
 *   `normalized()` before handing a command to a vehicle.
 */
#ifndef PLATOON_TYPES_HPP
#define PLATOON_TYPES_HPP

#include <stdint.h>
#include <stddef.h>
#include <cmath>
#include "etl/string.h"
#include "etl/vector.h"

namespace platoon {

/// Callsign capacity; 1..6 characters are used, two spare for headroom.
static constexpr size_t PEER_ID_MAX = 8;

/// Upper bound on platoon size (membership view and roster messages).
static constexpr size_t MAX_MEMBERS = 16;

/// Process-unique peer identity (uppercase callsign, e.g. "LEAD01").
using PeerId = etl::string<PEER_ID_MAX>;

/// Ordered list of peers, index 0 first.
using PeerList = etl::vector<PeerId, MAX_MEMBERS>;

struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator*(double k)      const { return {x * k, y * k, z * k}; }

  /// Planar length (x, y); vehicles move on the ground plane.
  double norm_xy() const { return std::sqrt(x * x + y * y); }
};

/**
 * @brief Self-reported vehicle state, broadcast once per control tick.
 *
 * `sequence` increases strictly per sender and is the only ordering key receivers
 * use; `throttle` / `brake` echo the command the sender applied last tick so
 * followers can react to a braking predecessor before the gap closes.
 */
struct VehicleState {
  PeerId   peer{};
  Vec3     position{};
  Vec3     velocity{};
  double   heading{0.0};       ///< radians, CCW from +x
  uint32_t sequence{0};
  uint64_t timestamp_ms{0};    ///< sender wall clock
  double   throttle{0.0};
  double   brake{0.0};

  /// Speed along the vehicle's own heading (negative when rolling backwards).
  double longitudinal_speed() const {
    return velocity.x * std::cos(heading) + velocity.y * std::sin(heading);
  }
};

/// Control output for one tick.
struct ControlCommand {
  double throttle{0.0};  ///< [0, 1]
  double brake{0.0};     ///< [0, 1]
  double steer{0.0};     ///< [-1, 1]

  /// Clamp every channel and resolve throttle/brake overlap in favour of brake.
  ControlCommand normalized() const {
    ControlCommand c;
    c.throttle = clamp(throttle, 0.0, 1.0);
    c.brake    = clamp(brake, 0.0, 1.0);
    c.steer    = clamp(steer, -1.0, 1.0);
    if (c.brake > 0.0) c.throttle = 0.0;
    return c;
  }

  static double clamp(double v, double lo, double hi) {
    if (std::isnan(v)) return 0.0;
    return v < lo ? lo : (v > hi ? hi : v);
  }
};

/// Wrap an angle to (-pi, pi].
inline double wrap_angle(double a) {
  constexpr double kPi = 3.14159265358979323846;
  if (!std::isfinite(a)) return 0.0;
  double r = std::remainder(a, 2.0 * kPi);
  if (r <= -kPi) r += 2.0 * kPi;
  return r;
}

} // namespace platoon

#endif // PLATOON_TYPES_HPP
