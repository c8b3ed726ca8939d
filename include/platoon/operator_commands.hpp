#pragma once
/**
 * @file operator_commands.hpp
 * @brief Operator console lines → typed commands for the vehicle session.
 *
 * @details
 * PURPOSE
 * -------
 * The console thread reads one line at a time and hands it here. Parsing,
 * synonym handling and range validation all happen before anything touches the
 * session's command queue, so a typo is reported on stderr and never reaches
 * the control loop.
 *
 * VOCABULARY
 * ----------
 *   join                     request a place at the tail of the platoon
 *   leave                    announce leave, drain, disconnect, exit 0
 *   set-gap <meters>         target gap, 0 < d <= 200      (alias: gap)
 *   set-speed <m/s>          target speed, 0 <= v <= 60    (alias: speed)
 *   path <1-9>               run a lead path (leader only)
 *   status                   one-line status report
 *   help                     list commands                 (alias: ?)
 *   quit                     leave if joined, then exit    (alias: exit)
 *
 * Names are case-insensitive. Errors come back as short tokens in the same
 * style the CLI prints: `bad_value:set-gap`, `unknown_command:foo`.
 */

#include <stdint.h>
#include <string>

namespace platoon {

enum class OperatorCommandKind : uint8_t {
  Join = 0,
  Leave,
  SetGap,
  SetSpeed,
  Path,
  Status,
  Help,
  Quit,
};

struct OperatorCommand {
  OperatorCommandKind kind{OperatorCommandKind::Status};
  double value{0.0};   ///< SetGap / SetSpeed
  int    path{0};      ///< Path
};

/// Parse one console line. Blank lines fail with err "empty".
bool parse_operator_command(const std::string& line, OperatorCommand& out, std::string& err);

const char* operator_command_name(OperatorCommandKind k);

/// Multi-line help text for the `help` command.
const char* operator_help();

} // namespace platoon
