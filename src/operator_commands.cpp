// -----------------------------------------------------------------------------
// Implementation for operator_commands.hpp
//
// Tokenising is whitespace based; numbers go through strtod / strtol with an
// end-pointer check so "10m" or "3.5.1" are rejected instead of truncated.
// Tests: tests/test_operator_commands.cpp
// -----------------------------------------------------------------------------
#include "platoon/operator_commands.hpp"

#include "platoon/controller.hpp"
#include "platoon/lead_paths.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace platoon {

// ---------- local parsing helpers (no exceptions) ----------

static std::string lower(std::string s) {
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

static bool parse_real(const std::string& s, double& out) {
  char* e = nullptr;
  const double v = std::strtod(s.c_str(), &e);
  if (!e || *e || e == s.c_str()) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

static bool parse_int(const std::string& s, int& out, long lo, long hi) {
  char* e = nullptr;
  const long v = std::strtol(s.c_str(), &e, 10);
  if (!e || *e || e == s.c_str()) return false;
  if (v < lo || v > hi) return false;
  out = (int)v;
  return true;
}

// ---------- parse ----------

bool parse_operator_command(const std::string& line, OperatorCommand& out, std::string& err) {
  std::istringstream in(line);
  std::vector<std::string> words;
  for (std::string w; in >> w;) words.push_back(w);

  if (words.empty()) { err = "empty"; return false; }

  const std::string name = lower(words[0]);
  OperatorCommand cmd;

  // Argument-less verbs
  auto bare = [&](OperatorCommandKind k) {
    if (words.size() != 1) { err = "unexpected_value:" + name; return false; }
    cmd.kind = k;
    return true;
  };

  bool ok = false;
  if (name == "join")                         ok = bare(OperatorCommandKind::Join);
  else if (name == "leave")                   ok = bare(OperatorCommandKind::Leave);
  else if (name == "status")                  ok = bare(OperatorCommandKind::Status);
  else if (name == "help" || name == "?")     ok = bare(OperatorCommandKind::Help);
  else if (name == "quit" || name == "exit")  ok = bare(OperatorCommandKind::Quit);
  else if (name == "set-gap" || name == "gap" ||
           name == "set-speed" || name == "speed" || name == "path") {
    const std::string canon = (name == "gap") ? "set-gap" : (name == "speed") ? "set-speed" : name;
    if (words.size() < 2) { err = "missing_value:" + canon; return false; }
    if (words.size() > 2) { err = "unexpected_value:" + canon; return false; }

    if (canon == "set-gap") {
      cmd.kind = OperatorCommandKind::SetGap;
      ok = parse_real(words[1], cmd.value) && cmd.value > 0.0 && cmd.value <= MAX_TARGET_GAP_M;
    } else if (canon == "set-speed") {
      cmd.kind = OperatorCommandKind::SetSpeed;
      ok = parse_real(words[1], cmd.value) && cmd.value >= 0.0 && cmd.value <= MAX_TARGET_SPEED_MPS;
    } else {
      cmd.kind = OperatorCommandKind::Path;
      ok = parse_int(words[1], cmd.path, 1, LEAD_PATH_COUNT);
    }
    if (!ok) { err = "bad_value:" + canon; return false; }
  } else {
    err = "unknown_command:" + name;
    return false;
  }

  if (!ok) return false;
  out = cmd;
  return true;
}

const char* operator_command_name(OperatorCommandKind k) {
  switch (k) {
    case OperatorCommandKind::Join:     return "join";
    case OperatorCommandKind::Leave:    return "leave";
    case OperatorCommandKind::SetGap:   return "set-gap";
    case OperatorCommandKind::SetSpeed: return "set-speed";
    case OperatorCommandKind::Path:     return "path";
    case OperatorCommandKind::Status:   return "status";
    case OperatorCommandKind::Help:     return "help";
    case OperatorCommandKind::Quit:     return "quit";
  }
  return "?";
}

const char* operator_help() {
  return
    "commands:\n"
    "  join                 join the platoon at the tail\n"
    "  leave                leave the platoon and exit\n"
    "  set-gap <meters>     target gap to the vehicle ahead (0 < d <= 200)\n"
    "  set-speed <m/s>      target cruise speed (0 <= v <= 60)\n"
    "  path <1-9>           run a lead path (leader only)\n"
    "  status               print role, gap and link state\n"
    "  help                 this text\n"
    "  quit                 leave if joined, then exit\n";
}

} // namespace platoon
