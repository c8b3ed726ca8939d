/**
 * @file main.cpp
 * @brief platoon-vehicle: one platoon member: kinematic vehicle + relay link + console.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and overlay them on the JSON config
 *    (`--config FILE`, else ~/.config/platoon/vehicle.json when present).
 *  - Ensure a callsign exists; generate a random one when none was given.
 *  - Spawn the vehicle, connect to the relay, run the session at the tick rate.
 *  - Read operator commands from stdin on a separate thread and hand them to the
 *    session through its command queue.
 *
 * Exit codes:
 *   0  left the platoon (leave / quit / SIGINT / SIGTERM)
 *   1  relay unreachable, or link lost after retries
 *   2  bad command line or configuration
 *   3  vehicle lost
 */

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "CLI/CLI11.hpp"

#include "platoon/config.hpp"
#include "platoon/log.hpp"
#include "platoon/operator_commands.hpp"
#include "platoon/session.hpp"
#include "platoon/transport/peer_client.hpp"
#include "platoon/vehicle.hpp"

using namespace platoon;

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

// ---------- console ----------

// stdin is polled so the thread notices shutdown without a pending line.
static void console_loop(CommandQueue& q, const std::atomic<bool>& done) {
  std::string buf;
  char chunk[256];
  while (!done.load()) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, 100);
    if (pr < 0) {
      if (errno == EINTR) continue;
      log::warn("console", log::Fields().kv("status", "error").kv("reason", "poll_failed"));
      return;
    }
    if (pr == 0) continue;

    const ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      log::warn("console", log::Fields().kv("status", "error").kv("reason", "read_failed"));
      return;
    }
    if (n == 0) {
      log::debug("console", log::Fields().kv("status", "eof"));
      return;
    }
    buf.append(chunk, static_cast<size_t>(n));

    size_t nl;
    while ((nl = buf.find('\n')) != std::string::npos) {
      const std::string line = buf.substr(0, nl);
      buf.erase(0, nl + 1);

      OperatorCommand cmd;
      std::string err;
      if (!parse_operator_command(line, cmd, err)) {
        if (err != "empty") std::cerr << "status=error reason=" << err << " (try: help)\n";
        continue;
      }
      q.push(cmd);
    }
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_relay;
  std::string opt_id;
  std::string opt_config;
  uint32_t    opt_tick_hz = 0;
  double      opt_gap = 0.0;
  double      opt_speed = 0.0;
  double      opt_spawn_x = 0.0;
  double      opt_spawn_y = 0.0;
  double      opt_heading = 0.0;
  std::string opt_blueprint;
  bool        opt_auto_join = false;
  std::string opt_log_level;

  CLI::App app{"Platoon vehicle: joins a platoon through a relay and keeps the gap"};
  auto* o_relay   = app.add_option("--relay", opt_relay, "Relay address host:port (default 127.0.0.1:52384)");
  auto* o_id      = app.add_option("--id", opt_id, "Callsign, 1-6 of A-Z 0-9 - _ (random if unset)");
  auto* o_config  = app.add_option("--config", opt_config, "JSON config file");
  auto* o_tick    = app.add_option("--tick-hz", opt_tick_hz, "Control loop rate (default 20)");
  auto* o_gap     = app.add_option("--gap", opt_gap, "Target gap in metres (default 10)");
  auto* o_speed   = app.add_option("--speed", opt_speed, "Leader target speed in m/s (default 10)");
  auto* o_spawn_x = app.add_option("--spawn-x", opt_spawn_x, "Spawn x (default -20)");
  auto* o_spawn_y = app.add_option("--spawn-y", opt_spawn_y, "Spawn y (default -15)");
  auto* o_heading = app.add_option("--heading", opt_heading, "Spawn heading in radians (default 0)");
  auto* o_bp      = app.add_option("--blueprint", opt_blueprint, "Vehicle blueprint (default vehicle.toyota.prius)");
  auto* o_join    = app.add_flag("--auto-join", opt_auto_join, "Join the platoon right after connecting");
  auto* o_level   = app.add_option("--log-level", opt_log_level, "debug|info|warn|error");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  // Config file, then CLI overrides.
  VehicleConfig cfg;
  std::string err;
  if (o_config->count() > 0) {
    const ConfigStatus st = load_config_file(opt_config, cfg, err);
    if (st != ConfigStatus::Ok) {
      std::cerr << "status=error reason=config_" << config_status_name(st) << " detail=\"" << err << "\"\n";
      return 2;
    }
  } else {
    const std::string def = default_config_path();
    const ConfigStatus st = load_config_file(def, cfg, err);
    if (st != ConfigStatus::Ok && st != ConfigStatus::NotFound) {
      std::cerr << "status=error reason=config_" << config_status_name(st) << " detail=\"" << err << "\"\n";
      return 2;
    }
  }

  if (o_relay->count() > 0 && !transport::parse_address(opt_relay, cfg.link.relay)) {
    std::cerr << "status=error reason=bad_relay_address value=" << opt_relay << "\n";
    return 2;
  }
  if (o_id->count() > 0)      cfg.id = opt_id;
  if (o_tick->count() > 0)    cfg.session.tick_hz = opt_tick_hz;
  if (o_gap->count() > 0)     cfg.session.targets.gap_m = opt_gap;
  if (o_speed->count() > 0)   cfg.session.targets.speed_mps = opt_speed;
  if (o_spawn_x->count() > 0) cfg.spawn_x = opt_spawn_x;
  if (o_spawn_y->count() > 0) cfg.spawn_y = opt_spawn_y;
  if (o_heading->count() > 0) cfg.heading = opt_heading;
  if (o_bp->count() > 0)      cfg.blueprint = opt_blueprint;
  if (o_join->count() > 0)    cfg.auto_join = opt_auto_join;
  if (o_level->count() > 0)   cfg.log_level = opt_log_level;

  if (cfg.id.empty()) {
    const auto seed = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    cfg.id = random_callsign(seed);
    std::cout << "generated id: " << cfg.id << "\n";
  }
  cfg.id = to_upper_ascii(cfg.id);

  if (validate(cfg, err) != ConfigStatus::Ok) {
    std::cerr << "status=error reason=invalid_config detail=\"" << err << "\"\n";
    return 2;
  }
  log::Level lvl = log::Level::Info;
  if (log::parse_level(cfg.log_level, lvl)) log::set_level(lvl);

  auto vehicle = spawn(cfg.blueprint, Vec3{cfg.spawn_x, cfg.spawn_y, 0.0}, cfg.heading);
  if (!vehicle) {
    std::cerr << "status=error reason=unknown_blueprint value=" << cfg.blueprint << "\n";
    return 2;
  }
  vehicle->set_realtime(true);

  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  transport::PeerClient client(cfg.link);
  const transport::ConnectResult cr = client.connect();
  if (cr != transport::ConnectResult::Ok) {
    std::cerr << "status=error reason=" << transport::connect_result_name(cr)
              << " relay=" << cfg.link.relay.host << ":" << cfg.link.relay.port << "\n";
    return 1;
  }

  VehicleSession session(PeerId(cfg.id.c_str()), *vehicle, client, cfg.session);
  if (cfg.auto_join) {
    OperatorCommand join;
    join.kind = OperatorCommandKind::Join;
    session.commands().push(join);
  }

  std::cout << "id=" << cfg.id << " relay=" << cfg.link.relay.host << ":" << cfg.link.relay.port
            << " vehicle=" << vehicle->name() << " (type 'help' for commands)\n" << std::flush;

  std::atomic<bool> console_done{false};
  std::thread console(console_loop, std::ref(session.commands()), std::cref(console_done));

  const SessionStatus final_status = session.run(g_stop);

  console_done.store(true);
  console.join();
  if (client.state() != transport::LinkState::Disconnected) client.disconnect();

  if (final_status == SessionStatus::LinkLost) {
    std::cerr << "status=error reason=link_lost\n";
  } else if (final_status == SessionStatus::VehicleLost) {
    std::cerr << "status=error reason=vehicle_lost\n";
  }
  return exit_code(final_status);
}
