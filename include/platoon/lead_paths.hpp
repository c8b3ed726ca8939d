#pragma once
/**
 * @file lead_paths.hpp
 * @brief Scripted leader drive profiles for exercising the followers.
 *
 * Nine fixed profiles, numbered as on the operator console. A profile is a list
 * of timed steps; a step with `broadcast == false` keeps the leader silent for
 * its whole duration so followers have to ride out a stale predecessor.
 *
 * | # | profile                                       |
 * |---|-----------------------------------------------|
 * | 1 | throttle, cruise, soft brake                  |
 * | 2 | throttle, soft brake                          |
 * | 3 | throttle, cruise, hard brake                  |
 * | 4 | throttle, hard brake                          |
 * | 5 | throttle, cruise (muted), brake               |
 * | 6 | throttle, cruise, brake (muted)               |
 * | 7 | throttle, brake (muted)                       |
 * | 8 | slow acceleration, hold, brake                |
 * | 9 | repeated braking                              |
 */

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace platoon {

static constexpr int LEAD_PATH_COUNT = 9;

struct PathStep {
  uint32_t duration_ms{0};
  double   throttle{0.0};
  double   brake{0.0};
  bool     broadcast{true};
};

/// Steps of profile @p n (1..9). False for any other number.
bool lead_path(int n, std::vector<PathStep>& out);

/// One-line description for the console; "unknown" outside 1..9.
const char* lead_path_title(int n);

/**
 * @brief Plays one profile against the session clock.
 *
 * `current()` is polled once per tick. When the last step has run out the
 * runner goes idle and reports `finished()` exactly once.
 */
class LeadPathRunner {
public:
  bool start(int n, uint64_t now_ms);
  void cancel();

  /// Step active at @p now_ms. False when idle (never started, cancelled, done).
  bool current(uint64_t now_ms, PathStep& out);

  bool active() const { return number_ != 0; }
  int  number() const { return number_; }

  /// True once after a profile ran to completion.
  bool take_finished() {
    const bool f = finished_;
    finished_ = false;
    return f;
  }

private:
  std::vector<PathStep> steps_;
  int      number_{0};
  uint64_t started_ms_{0};
  bool     finished_{false};
};

} // namespace platoon
