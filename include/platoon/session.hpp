/**
 * @file session.hpp
 * @brief Vehicle Session: one vehicle's control loop, wired to a link and a handle.
 *
 * @details
 * ## Field Brief
 * The session is the only writer of engine and controller state. Everything
 * else reaches it through a queue: the link buffers inbound records, the console
 * thread pushes operator commands. Once per tick it pulls both, so no lock is
 * ever held across control code.
 *
 * ---
 *
 * @par One tick
 * ```
 *  tick(now)
 *   ├─ vehicle.get_state()           failure → VehicleLost (exit 3)
 *   ├─ publish STATE                 (muted during silent lead-path steps)
 *   ├─ link.poll() → engine          every buffered record, in order
 *   ├─ command queue → operator ops  join / leave / set-gap / set-speed / path
 *   ├─ engine.tick(now)              discovery window, staleness episodes
 *   ├─ engine outbox → link          roster replies
 *   └─ controller → vehicle.apply_control()
 * ```
 * While the link is not `Connected` the controller is forced into fail-safe.
 * Once the link reports `Disconnected` the session applies fail-safe for that
 * tick and ends with `LinkLost` (exit 1).
 *
 * ---
 *
 * @par Timing
 * `run()` ticks at a fixed period. Ticks never overlap; an overrunning tick is
 * followed immediately by the next one, without trying to catch up the ticks
 * it missed. A stop request leaves the platoon cleanly (LEAVE, drain, close).
 */
#ifndef PLATOON_SESSION_HPP
#define PLATOON_SESSION_HPP

#include <stdint.h>
#include <atomic>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <string>

#include "platoon/controller.hpp"
#include "platoon/engine.hpp"
#include "platoon/lead_paths.hpp"
#include "platoon/operator_commands.hpp"
#include "platoon/transport/link.hpp"
#include "platoon/vehicle.hpp"

namespace platoon {

enum class SessionStatus : uint8_t {
  Running = 0,
  Left,          ///< explicit leave / operator quit / stop request
  LinkLost,      ///< link disconnected after retry exhaustion
  VehicleLost,   ///< vehicle handle stopped answering
};

const char* session_status_name(SessionStatus s);

/// Process exit code for a final status (Running maps to 0).
int exit_code(SessionStatus s);

struct SessionConfig {
  uint32_t          tick_hz{20};
  uint32_t          staleness_periods{PlatoonEngine::STALENESS_PERIODS_DEFAULT};
  uint32_t          discovery_window_ms{PlatoonEngine::DISCOVERY_WINDOW_DEFAULT_MS};
  uint32_t          drain_timeout_ms{1000};
  ControllerTargets targets{};
  ControllerGains   gains{};

  uint32_t period_ms() const { return tick_hz ? 1000u / tick_hz : 50u; }
};

/// Mutex-guarded FIFO between the console thread and the session thread.
class CommandQueue {
public:
  void push(const OperatorCommand& c);
  bool pop(OperatorCommand& out);
  size_t size() const;

private:
  mutable std::mutex          mu_;
  std::deque<OperatorCommand> q_;
};

class VehicleSession {
public:
  VehicleSession(const PeerId& self, VehicleHandle& vehicle, transport::Link& link,
                 const SessionConfig& cfg = SessionConfig{});

  /// Run one control tick. @p now_ms is monotonic, @p wall_ms stamps outbound records.
  SessionStatus tick(uint64_t now_ms, uint64_t wall_ms);

  /// Fixed-period loop until a terminal status or @p stop becomes true.
  SessionStatus run(const std::atomic<bool>& stop);

  // ---- operator surface (session thread; the console goes through commands()) ----
  bool join(uint64_t now_ms, uint64_t wall_ms);
  void leave(uint64_t now_ms, uint64_t wall_ms);
  bool set_target_gap(double meters);
  bool set_target_speed(double mps);
  bool run_path(int n, uint64_t now_ms);

  /// Single key=value line describing role, chain, mode and link.
  std::string status_line(uint64_t now_ms) const;

  CommandQueue& commands() { return commands_; }

  /// Where `status` / `help` output goes (default std::cout).
  void set_console(std::ostream* out) { console_ = out; }

  SessionStatus status() const { return status_; }
  const PlatoonEngine& engine() const { return engine_; }
  const GapController& controller() const { return controller_; }
  const ControlOutput& last_output() const { return last_out_; }
  const PeerId& self_id() const { return engine_.self_id(); }
  uint64_t ticks() const { return ticks_; }

private:
  void apply_command(const OperatorCommand& c, uint64_t now_ms, uint64_t wall_ms);
  bool send(const Message& m);
  ControlOutput compute(const VehicleState& own, uint64_t now_ms);

  VehicleHandle&   vehicle_;
  transport::Link& link_;
  SessionConfig    cfg_;

  PlatoonEngine  engine_;
  GapController  controller_;
  LeadPathRunner path_;
  CommandQueue   commands_;

  SessionStatus  status_{SessionStatus::Running};
  ControlOutput  last_out_{};
  ControlCommand applied_{};
  VehicleState   own_{};
  uint32_t       link_generation_{0};
  uint64_t       ticks_{0};
  std::ostream*  console_{nullptr};
};

} // namespace platoon

#endif // PLATOON_SESSION_HPP
