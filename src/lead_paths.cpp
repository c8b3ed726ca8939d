// ============================================================================
// lead_paths.cpp: lead path tables and the step runner
// ============================================================================
#include "platoon/lead_paths.hpp"

namespace platoon {

namespace {

PathStep throttle(uint32_t ms, double t, bool broadcast = true) { return PathStep{ms, t, 0.0, broadcast}; }
PathStep coast(uint32_t ms, bool broadcast = true)              { return PathStep{ms, 0.0, 0.0, broadcast}; }
PathStep brake(uint32_t ms, double b, bool broadcast = true)    { return PathStep{ms, 0.0, b, broadcast}; }

} // namespace

bool lead_path(int n, std::vector<PathStep>& out) {
  out.clear();
  switch (n) {
    case 1: out = {throttle(10000, 1.0), coast(6000), brake(6000, 0.3)}; break;
    case 2: out = {throttle(10000, 1.0), brake(8000, 0.3)}; break;
    case 3: out = {throttle(10000, 1.0), coast(6000), brake(6000, 1.0)}; break;
    case 4: out = {throttle(10000, 1.0), brake(8000, 1.0)}; break;
    case 5: out = {throttle(10000, 1.0), coast(6000, false), brake(6000, 1.0)}; break;
    case 6: out = {throttle(10000, 1.0), coast(6000), brake(6000, 1.0, false)}; break;
    case 7: out = {throttle(10000, 1.0), brake(8000, 1.0, false)}; break;
    case 8:
      for (int i = 1; i <= 20; ++i) out.push_back(throttle(200, 0.05 * i));
      out.back().duration_ms += 6000;      // hold full throttle
      out.push_back(brake(6000, 1.0));
      break;
    case 9:
      out.push_back(throttle(6000, 1.0));
      for (int i = 0; i < 5; ++i) {
        out.push_back(brake(300, 1.0));
        out.push_back(throttle(1000, 1.0));
      }
      out.push_back(brake(6000, 1.0));
      break;
    default:
      return false;
  }
  return true;
}

const char* lead_path_title(int n) {
  switch (n) {
    case 1: return "throttle, cruise, soft brake";
    case 2: return "throttle, soft brake";
    case 3: return "throttle, cruise, hard brake";
    case 4: return "throttle, hard brake";
    case 5: return "throttle, cruise (no broadcast), brake";
    case 6: return "throttle, cruise, brake (no broadcast)";
    case 7: return "throttle, brake (no broadcast)";
    case 8: return "slow acceleration";
    case 9: return "repeated braking";
    default: return "unknown";
  }
}

// ---------- runner ----------

bool LeadPathRunner::start(int n, uint64_t now_ms) {
  std::vector<PathStep> steps;
  if (!lead_path(n, steps)) return false;
  steps_.swap(steps);
  number_ = n;
  started_ms_ = now_ms;
  finished_ = false;
  return true;
}

void LeadPathRunner::cancel() {
  steps_.clear();
  number_ = 0;
  finished_ = false;
}

bool LeadPathRunner::current(uint64_t now_ms, PathStep& out) {
  if (number_ == 0) return false;

  uint64_t elapsed = now_ms > started_ms_ ? now_ms - started_ms_ : 0;
  for (const auto& s : steps_) {
    if (elapsed < s.duration_ms) {
      out = s;
      return true;
    }
    elapsed -= s.duration_ms;
  }

  // Ran off the end of the table.
  steps_.clear();
  number_ = 0;
  finished_ = true;
  return false;
}

} // namespace platoon
