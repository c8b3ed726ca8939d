// =============================================================================
// config.cpp: JSON overlay, defaults path, validation
//
// nlohmann_json is parsed in non-throwing mode; every key is type-checked before
// it is read, so no exception leaves this file.
// =============================================================================
#include "platoon/config.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

#include "platoon/log.hpp"
#include "platoon/message.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace platoon {

namespace {

// ---------- typed readers; absent key leaves the default untouched ----------

bool read_double(const json& j, const char* key, double& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number()) { err = std::string(key) + ": expected number"; return false; }
  out = it->get<double>();
  return true;
}

template <class U>
bool read_unsigned(const json& j, const char* key, U& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_unsigned()) { err = std::string(key) + ": expected unsigned integer"; return false; }
  const uint64_t v = it->get<uint64_t>();
  if (v > static_cast<uint64_t>(static_cast<U>(~U{0}))) { err = std::string(key) + ": too large"; return false; }
  out = static_cast<U>(v);
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string(key) + ": expected string"; return false; }
  out = it->get<std::string>();
  return true;
}

bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { err = std::string(key) + ": expected boolean"; return false; }
  out = it->get<bool>();
  return true;
}

bool read_gains(const json& j, ControllerGains& g, std::string& err) {
  return read_double(j, "kp", g.kp, err)
      && read_double(j, "kd", g.kd, err)
      && read_double(j, "max_accel", g.max_accel, err)
      && read_double(j, "max_decel", g.max_decel, err)
      && read_double(j, "failsafe_brake", g.failsafe_brake, err)
      && read_double(j, "min_safe_gap_m", g.min_safe_gap_m, err)
      && read_double(j, "gap_tolerance_m", g.gap_tolerance_m, err)
      && read_double(j, "vehicle_length_m", g.vehicle_length_m, err)
      && read_double(j, "heading_gain", g.heading_gain, err)
      && read_double(j, "lateral_gain", g.lateral_gain, err)
      && read_double(j, "brake_feedforward", g.brake_feedforward, err)
      && read_double(j, "dv_filter_alpha", g.dv_filter_alpha, err)
      && read_double(j, "max_gap_error_m", g.max_gap_error_m, err);
}

} // namespace

const char* config_status_name(ConfigStatus s) {
  switch (s) {
    case ConfigStatus::Ok:         return "ok";
    case ConfigStatus::NotFound:   return "not_found";
    case ConfigStatus::ParseError: return "parse_error";
    case ConfigStatus::TypeError:  return "type_error";
    case ConfigStatus::Invalid:    return "invalid";
  }
  return "?";
}

ConfigStatus parse_config(const std::string& text, VehicleConfig& cfg, std::string& err) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) { err = "not valid JSON"; return ConfigStatus::ParseError; }
  if (!j.is_object())   { err = "top level must be an object"; return ConfigStatus::ParseError; }

  // Work on a copy so a half-applied file never leaks out.
  VehicleConfig c = cfg;
  uint32_t port = c.link.relay.port;

  const bool ok =
         read_string(j, "id", c.id, err)
      && read_string(j, "log_level", c.log_level, err)
      && read_string(j, "relay_host", c.link.relay.host, err)
      && read_unsigned(j, "relay_port", port, err)
      && read_unsigned(j, "retry_limit", c.link.retry_limit, err)
      && read_unsigned(j, "backoff_initial_ms", c.link.backoff_initial_ms, err)
      && read_unsigned(j, "backoff_max_ms", c.link.backoff_max_ms, err)
      && read_unsigned(j, "connect_timeout_ms", c.link.connect_timeout_ms, err)
      && read_unsigned(j, "handshake_timeout_ms", c.link.handshake_timeout_ms, err)
      && read_unsigned(j, "drain_timeout_ms", c.session.drain_timeout_ms, err)
      && read_unsigned(j, "tick_hz", c.session.tick_hz, err)
      && read_unsigned(j, "staleness_periods", c.session.staleness_periods, err)
      && read_unsigned(j, "discovery_window_ms", c.session.discovery_window_ms, err)
      && read_double(j, "target_gap_m", c.session.targets.gap_m, err)
      && read_double(j, "target_speed_mps", c.session.targets.speed_mps, err)
      && read_string(j, "blueprint", c.blueprint, err)
      && read_double(j, "spawn_x", c.spawn_x, err)
      && read_double(j, "spawn_y", c.spawn_y, err)
      && read_double(j, "heading", c.heading, err)
      && read_bool(j, "auto_join", c.auto_join, err);
  if (!ok) return ConfigStatus::TypeError;

  if (port == 0 || port > 65535) { err = "relay_port: out of range"; return ConfigStatus::Invalid; }
  c.link.relay.port = static_cast<uint16_t>(port);
  c.link.drain_timeout_ms = c.session.drain_timeout_ms;

  auto ctl = j.find("controller");
  if (ctl != j.end()) {
    if (!ctl->is_object()) { err = "controller: expected object"; return ConfigStatus::TypeError; }
    if (!read_gains(*ctl, c.session.gains, err)) {
      err = "controller." + err;
      return ConfigStatus::TypeError;
    }
  }

  cfg = c;
  return ConfigStatus::Ok;
}

ConfigStatus load_config_file(const std::string& path, VehicleConfig& cfg, std::string& err) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) { err = path + ": no such file"; return ConfigStatus::NotFound; }
  std::ifstream in(path);
  if (!in) { err = path + ": cannot open"; return ConfigStatus::NotFound; }
  std::ostringstream ss;
  ss << in.rdbuf();
  const ConfigStatus st = parse_config(ss.str(), cfg, err);
  if (st != ConfigStatus::Ok) err = path + ": " + err;
  return st;
}

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base;
  if (xdg && *xdg)        base = fs::path(xdg);
  else if (home && *home) base = fs::path(home) / ".config";
  else                    base = fs::path(".config");
  return (base / "platoon" / "vehicle.json").string();
}

ConfigStatus validate(const VehicleConfig& cfg, std::string& err) {
  if (!cfg.id.empty() && !valid_peer_id(cfg.id.c_str(), cfg.id.size())) {
    err = "id: invalid callsign '" + cfg.id + "' (1-6 of A-Z 0-9 - _)";
    return ConfigStatus::Invalid;
  }
  log::Level lvl;
  if (!log::parse_level(cfg.log_level, lvl)) { err = "log_level: unknown level"; return ConfigStatus::Invalid; }
  if (cfg.session.tick_hz == 0 || cfg.session.tick_hz > 1000) { err = "tick_hz: must be 1..1000"; return ConfigStatus::Invalid; }
  if (cfg.session.staleness_periods == 0) { err = "staleness_periods: must be positive"; return ConfigStatus::Invalid; }
  if (!cfg.session.gains.valid()) { err = "controller: gains must be finite and non-negative"; return ConfigStatus::Invalid; }

  const ControllerTargets& t = cfg.session.targets;
  if (!std::isfinite(t.gap_m) || t.gap_m <= 0.0 || t.gap_m > MAX_TARGET_GAP_M) {
    err = "target_gap_m: must be in (0, 200]";
    return ConfigStatus::Invalid;
  }
  if (!std::isfinite(t.speed_mps) || t.speed_mps < 0.0 || t.speed_mps > MAX_TARGET_SPEED_MPS) {
    err = "target_speed_mps: must be in [0, 60]";
    return ConfigStatus::Invalid;
  }
  if (cfg.link.relay.host.empty()) { err = "relay_host: empty"; return ConfigStatus::Invalid; }
  if (cfg.link.backoff_initial_ms == 0 || cfg.link.backoff_max_ms < cfg.link.backoff_initial_ms) {
    err = "backoff: need 0 < backoff_initial_ms <= backoff_max_ms";
    return ConfigStatus::Invalid;
  }
  if (!std::isfinite(cfg.spawn_x) || !std::isfinite(cfg.spawn_y) || !std::isfinite(cfg.heading)) {
    err = "spawn: coordinates must be finite";
    return ConfigStatus::Invalid;
  }
  return ConfigStatus::Ok;
}

std::string to_upper_ascii(std::string s) {
  for (char& c : s) if (c >= 'a' && c <= 'z') c = char(c - 'a' + 'A');
  return s;
}

std::string random_callsign(uint64_t seed) {
  static const char* ALPH = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  auto rnd = [&seed]() {
    seed = seed * 6364136223846793005ull + 1;   // LCG
    return static_cast<uint32_t>(seed >> 33);
  };
  std::string s;
  s.reserve(6);
  for (int i = 0; i < 6; ++i) s.push_back(ALPH[rnd() % 36]);
  return s;
}

} // namespace platoon
