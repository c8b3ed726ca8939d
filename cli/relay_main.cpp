/**
 * @file relay_main.cpp
 * @brief platoon-relay: standalone fan-out hub for platoon vehicles.
 *
 * Usage:
 *   platoon-relay [--host 0.0.0.0] [--port 52384] [--log-level info]
 *
 * Exit codes:
 *   0  stopped by SIGINT / SIGTERM
 *   1  listen socket could not be bound
 *   2  bad command line
 */

#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <chrono>
#include <thread>

#include "CLI/CLI11.hpp"

#include "platoon/log.hpp"
#include "platoon/transport/relay.hpp"

using namespace platoon;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

int main(int argc, char** argv) {
  transport::RelayConfig cfg;
  std::string log_level = "info";

  CLI::App app{"Platoon relay: forwards every record to every other connected vehicle"};
  app.add_option("--host", cfg.host, "Listen address")->capture_default_str();
  app.add_option("--port", cfg.port, "Listen port")->capture_default_str()
     ->check(CLI::Range(uint16_t{1}, uint16_t{65535}));
  app.add_option("--log-level", log_level, "debug|info|warn|error")->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  log::Level lvl;
  if (!log::parse_level(log_level, lvl)) {
    std::cerr << "status=error reason=bad_log_level value=" << log_level << "\n";
    return 2;
  }
  log::set_level(lvl);

  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  transport::Relay relay(cfg);
  if (!relay.start()) {
    std::cerr << "status=error reason=bind_failed host=" << cfg.host << " port=" << cfg.port << "\n";
    return 1;
  }

  while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(100));

  log::info("relay_stopping", log::Fields().kv("peers", relay.peer_count())
                                           .kv("forwarded", relay.frames_forwarded()));
  relay.stop();
  return 0;
}
