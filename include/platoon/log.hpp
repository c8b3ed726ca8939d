#pragma once
/**
 * @file log.hpp
 * @brief Key=value event lines on stderr.
 *
 * Output matches the CLI's existing `status=error reason=...` convention so logs
 * stay greppable and shell friendly:
 *
 * @code
 * level=warn event=stale_predecessor peer=LEAD01 silent_ms=180
 * @endcode
 *
 * Thread safe: relay and client threads log concurrently, a single mutex keeps
 * each line intact.
 */

#include <cstdint>
#include <sstream>
#include <string>

namespace platoon {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Set the minimum level that reaches stderr (default Info).
void set_level(Level lvl);
Level level();

/// Parse "debug|info|warn|error" (case-insensitive). Returns false if unknown.
bool parse_level(const std::string& name, Level& out);

/// True if a line at @p lvl would be written.
bool enabled(Level lvl);

/// Write one line: `level=<lvl> event=<event> <fields>`.
void write(Level lvl, const char* event, const std::string& fields);

/**
 * @brief Small builder for the `k=v k=v` tail of a line.
 *
 * Values containing spaces are quoted so the line still splits on whitespace.
 */
class Fields {
public:
  template <class T>
  Fields& kv(const char* key, const T& value) {
    std::ostringstream v;
    v << value;
    append(key, v.str());
    return *this;
  }

  const std::string& str() const { return out_; }

private:
  void append(const char* key, const std::string& value);
  std::string out_;
};

inline void debug(const char* event, const Fields& f = Fields{}) { if (enabled(Level::Debug)) write(Level::Debug, event, f.str()); }
inline void info (const char* event, const Fields& f = Fields{}) { if (enabled(Level::Info))  write(Level::Info,  event, f.str()); }
inline void warn (const char* event, const Fields& f = Fields{}) { if (enabled(Level::Warn))  write(Level::Warn,  event, f.str()); }
inline void error(const char* event, const Fields& f = Fields{}) { if (enabled(Level::Error)) write(Level::Error, event, f.str()); }

} // namespace log
} // namespace platoon
