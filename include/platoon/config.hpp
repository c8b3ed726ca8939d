/**
 * @file config.hpp
 * @brief Vehicle configuration: defaults, optional JSON file, validation.
 *
 * Precedence, lowest first:
 *   1. in-memory defaults (the structs below)
 *   2. JSON file: `--config FILE`, else `$XDG_CONFIG_HOME/platoon/vehicle.json`
 *      (fallback `~/.config/platoon/vehicle.json`) when it exists
 *   3. command line options (applied by the executable after loading)
 *
 * File layout (every key optional, unknown keys ignored):
 * @code
 * {
 *   "id": "TRUCK2", "relay_host": "10.0.0.5", "relay_port": 52384,
 *   "tick_hz": 20, "target_gap_m": 10, "target_speed_mps": 10,
 *   "staleness_periods": 3, "discovery_window_ms": 500,
 *   "retry_limit": 5, "backoff_initial_ms": 500, "backoff_max_ms": 8000,
 *   "connect_timeout_ms": 2000, "handshake_timeout_ms": 2000,
 *   "drain_timeout_ms": 1000, "log_level": "info",
 *   "blueprint": "vehicle.toyota.prius", "spawn_x": -20, "spawn_y": -15,
 *   "heading": 0, "auto_join": false,
 *   "controller": { "kp": 0.5, "kd": 0.6, ... }
 * }
 * @endcode
 *
 * Nothing is ever written back to disk.
 */
#pragma once

#include <stdint.h>
#include <string>

#include "platoon/session.hpp"
#include "platoon/transport/peer_client.hpp"

namespace platoon {

struct VehicleConfig {
  std::string               id{};            ///< empty → random callsign at startup
  std::string               log_level{"info"};
  transport::ClientConfig   link{};
  SessionConfig             session{};
  std::string               blueprint{"vehicle.toyota.prius"};
  double                    spawn_x{-20.0};
  double                    spawn_y{-15.0};
  double                    heading{0.0};
  bool                      auto_join{false};
};

enum class ConfigStatus : uint8_t {
  Ok = 0,
  NotFound,
  ParseError,   ///< not JSON, or not a JSON object
  TypeError,    ///< a known key holds the wrong type
  Invalid,      ///< well-typed but out of range
};

const char* config_status_name(ConfigStatus s);

/// Overlay the JSON document @p text onto @p cfg. On failure @p err names the key.
ConfigStatus parse_config(const std::string& text, VehicleConfig& cfg, std::string& err);

/// Read @p path and parse_config() it.
ConfigStatus load_config_file(const std::string& path, VehicleConfig& cfg, std::string& err);

/// `$XDG_CONFIG_HOME/platoon/vehicle.json`, or `~/.config/platoon/vehicle.json`.
std::string default_config_path();

/// Range checks on the merged configuration (after CLI overrides).
ConfigStatus validate(const VehicleConfig& cfg, std::string& err);

std::string to_upper_ascii(std::string s);

/// Six characters from A-Z0-9; always a valid callsign.
std::string random_callsign(uint64_t seed);

} // namespace platoon
