// ============================================================================
// log.cpp: implementation for log.hpp
// For the line format see the matching .hpp.
// ============================================================================
#include "platoon/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace platoon {
namespace log {

static std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::Info)};
static std::mutex g_write_mu;

static const char* level_name(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
  }
  return "info";
}

void set_level(Level lvl) { g_level.store(static_cast<uint8_t>(lvl)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level lvl) { return static_cast<uint8_t>(lvl) >= g_level.load(); }

bool parse_level(const std::string& name, Level& out) {
  std::string s = name;
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  if (s == "debug") { out = Level::Debug; return true; }
  if (s == "info")  { out = Level::Info;  return true; }
  if (s == "warn" || s == "warning") { out = Level::Warn; return true; }
  if (s == "error") { out = Level::Error; return true; }
  return false;
}

void write(Level lvl, const char* event, const std::string& fields) {
  std::lock_guard<std::mutex> lk(g_write_mu);
  std::cerr << "level=" << level_name(lvl) << " event=" << (event ? event : "-");
  if (!fields.empty()) std::cerr << ' ' << fields;
  std::cerr << '\n';
}

void Fields::append(const char* key, const std::string& value) {
  if (!out_.empty()) out_ += ' ';
  out_ += key;
  out_ += '=';
  bool quote = value.empty() || value.find(' ') != std::string::npos;
  if (quote) out_ += '"';
  out_ += value;
  if (quote) out_ += '"';
}

} // namespace log
} // namespace platoon
