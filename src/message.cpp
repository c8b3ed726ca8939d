// -----------------------------------------------------------------------------
// message.cpp: stamp encoding / decoding for platoon records
//
// API & stamp grammar: see include/platoon/message.hpp
// Usage: tests/test_message.cpp
//
// Parsing is strtod/strtoull based with explicit end-pointer checks; nothing
// here throws and a failed decode leaves the output untouched.
// -----------------------------------------------------------------------------
#include "platoon/message.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace platoon {

namespace {

struct Field {
  const char* p{nullptr};
  size_t      n{0};
};

static constexpr size_t MAX_FIELDS = 10;

// Split on '~'. Returns the number of fields, or MAX_FIELDS + 1 if there are more.
size_t split(const char* data, size_t len, Field* out) {
  size_t count = 0;
  size_t start = 0;
  for (size_t i = 0; i <= len; ++i) {
    if (i == len || data[i] == '~') {
      if (count == MAX_FIELDS) return MAX_FIELDS + 1;
      out[count].p = data + start;
      out[count].n = i - start;
      ++count;
      start = i + 1;
    }
  }
  return count;
}

bool equals(const Field& f, const char* tag) {
  const size_t n = std::strlen(tag);
  return f.n == n && std::memcmp(f.p, tag, n) == 0;
}

// Copy a field into a NUL-terminated scratch buffer for the C parsers.
bool to_cstr(const Field& f, char* buf, size_t cap) {
  if (f.n == 0 || f.n >= cap) return false;
  std::memcpy(buf, f.p, f.n);
  buf[f.n] = '\0';
  return true;
}

bool parse_real(const Field& f, double& out) {
  char buf[48];
  if (!to_cstr(f, buf, sizeof(buf))) return false;
  char* e = nullptr;
  const double v = std::strtod(buf, &e);
  if (e != buf + f.n) return false;       // trailing junk
  if (!std::isfinite(v)) return false;    // no nan/inf on the wire
  out = v;
  return true;
}

bool parse_u64(const Field& f, uint64_t& out) {
  char buf[24];
  if (!to_cstr(f, buf, sizeof(buf))) return false;
  for (size_t i = 0; i < f.n; ++i) {
    if (buf[i] < '0' || buf[i] > '9') return false;   // strtoull would accept "-1"
  }
  char* e = nullptr;
  const unsigned long long v = std::strtoull(buf, &e, 10);
  if (e != buf + f.n) return false;
  out = static_cast<uint64_t>(v);
  return true;
}

bool parse_u32(const Field& f, uint32_t& out) {
  uint64_t v = 0;
  if (!parse_u64(f, v) || v > 0xFFFFFFFFull) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

bool parse_vec3(const Field& f, Vec3& out) {
  Field parts[3];
  size_t count = 0;
  size_t start = 0;
  for (size_t i = 0; i <= f.n; ++i) {
    if (i == f.n || f.p[i] == ',') {
      if (count == 3) return false;
      parts[count].p = f.p + start;
      parts[count].n = i - start;
      ++count;
      start = i + 1;
    }
  }
  if (count != 3) return false;
  Vec3 v;
  if (!parse_real(parts[0], v.x) || !parse_real(parts[1], v.y) || !parse_real(parts[2], v.z)) return false;
  out = v;
  return true;
}

bool parse_peer(const Field& f, PeerId& out) {
  if (!valid_peer_id(f.p, f.n)) return false;
  out.assign(f.p, f.n);
  return true;
}

bool parse_roster(const Field& f, PeerList& out) {
  PeerList list;
  size_t start = 0;
  for (size_t i = 0; i <= f.n; ++i) {
    if (i == f.n || f.p[i] == ',') {
      Field id{f.p + start, i - start};
      PeerId peer;
      if (!parse_peer(id, peer)) return false;
      for (const auto& existing : list) {
        if (existing == peer) return false;     // a chain never lists a peer twice
      }
      if (list.full()) return false;
      list.push_back(peer);
      start = i + 1;
    }
  }
  if (list.empty()) return false;
  out = list;
  return true;
}

MessageStatus finish(const char* buf, int n, Text255& out) {
  if (n < 0 || static_cast<size_t>(n) > out.max_size()) return MessageStatus::Overflow;
  out.assign(buf, static_cast<size_t>(n));
  return MessageStatus::Ok;
}

} // namespace

// ---------- builders ----------

Message Message::state_update(const VehicleState& s) {
  Message m;
  m.kind = MessageKind::State;
  m.peer = s.peer;
  m.timestamp_ms = s.timestamp_ms;
  m.state = s;
  return m;
}

Message Message::join(const PeerId& peer, uint64_t timestamp_ms) {
  Message m;
  m.kind = MessageKind::Join;
  m.peer = peer;
  m.timestamp_ms = timestamp_ms;
  return m;
}

Message Message::leave(const PeerId& peer, uint64_t timestamp_ms) {
  Message m;
  m.kind = MessageKind::Leave;
  m.peer = peer;
  m.timestamp_ms = timestamp_ms;
  return m;
}

Message Message::roster_snapshot(const PeerId& leader, uint64_t timestamp_ms, const PeerList& members) {
  Message m;
  m.kind = MessageKind::Roster;
  m.peer = leader;
  m.timestamp_ms = timestamp_ms;
  m.roster = members;
  return m;
}

Message Message::greeting(uint32_t version) {
  Message m;
  m.kind = MessageKind::Greeting;
  m.version = version;
  return m;
}

// ---------- encode ----------

MessageStatus encode(const Message& m, Text255& out) {
  char buf[320];
  int n = -1;
  const unsigned long long ts = static_cast<unsigned long long>(m.timestamp_ms);

  switch (m.kind) {
    case MessageKind::State: {
      const VehicleState& s = m.state;
      if (!valid_peer_id(s.peer)) return MessageStatus::BadPeerId;
      n = std::snprintf(buf, sizeof(buf),
                        "STATE~%s~%u~%llu~%.9g,%.9g,%.9g~%.9g,%.9g,%.9g~%.9g~%.9g~%.9g",
                        s.peer.c_str(), s.sequence,
                        static_cast<unsigned long long>(s.timestamp_ms),
                        s.position.x, s.position.y, s.position.z,
                        s.velocity.x, s.velocity.y, s.velocity.z,
                        s.heading, s.throttle, s.brake);
      break;
    }
    case MessageKind::Join:
    case MessageKind::Leave:
      if (!valid_peer_id(m.peer)) return MessageStatus::BadPeerId;
      n = std::snprintf(buf, sizeof(buf), "%s~%s~%llu", kind_name(m.kind), m.peer.c_str(), ts);
      break;

    case MessageKind::Roster: {
      if (!valid_peer_id(m.peer)) return MessageStatus::BadPeerId;
      if (m.roster.empty()) return MessageStatus::FieldCount;
      n = std::snprintf(buf, sizeof(buf), "ROSTER~%s~%llu~", m.peer.c_str(), ts);
      if (n < 0) return MessageStatus::Overflow;
      size_t used = static_cast<size_t>(n);
      for (size_t i = 0; i < m.roster.size(); ++i) {
        if (!valid_peer_id(m.roster[i])) return MessageStatus::BadPeerId;
        const int w = std::snprintf(buf + used, sizeof(buf) - used, "%s%s",
                                    i == 0 ? "" : ",", m.roster[i].c_str());
        if (w < 0 || used + static_cast<size_t>(w) >= sizeof(buf)) return MessageStatus::Overflow;
        used += static_cast<size_t>(w);
      }
      n = static_cast<int>(used);
      break;
    }
    case MessageKind::Greeting:
      n = std::snprintf(buf, sizeof(buf), "RELAY~%u", m.version);
      break;
  }

  return finish(buf, n, out);
}

// ---------- decode ----------

MessageStatus decode(const char* data, size_t len, Message& out) {
  if (!data || len == 0) return MessageStatus::Empty;
  if (len > STAMP_MAX) return MessageStatus::Overflow;

  Field f[MAX_FIELDS];
  const size_t count = split(data, len, f);

  Message m;
  if (equals(f[0], "STATE")) {
    if (count != 9) return MessageStatus::FieldCount;
    m.kind = MessageKind::State;
    VehicleState s;
    if (!parse_peer(f[1], s.peer)) return MessageStatus::BadPeerId;
    if (!parse_u32(f[2], s.sequence))        return MessageStatus::BadNumber;
    if (!parse_u64(f[3], s.timestamp_ms))    return MessageStatus::BadNumber;
    if (!parse_vec3(f[4], s.position))       return MessageStatus::BadNumber;
    if (!parse_vec3(f[5], s.velocity))       return MessageStatus::BadNumber;
    if (!parse_real(f[6], s.heading))        return MessageStatus::BadNumber;
    if (!parse_real(f[7], s.throttle))       return MessageStatus::BadNumber;
    if (!parse_real(f[8], s.brake))          return MessageStatus::BadNumber;
    m.peer = s.peer;
    m.timestamp_ms = s.timestamp_ms;
    m.state = s;
  } else if (equals(f[0], "JOIN") || equals(f[0], "LEAVE")) {
    if (count != 3) return MessageStatus::FieldCount;
    m.kind = equals(f[0], "JOIN") ? MessageKind::Join : MessageKind::Leave;
    if (!parse_peer(f[1], m.peer))          return MessageStatus::BadPeerId;
    if (!parse_u64(f[2], m.timestamp_ms))   return MessageStatus::BadNumber;
  } else if (equals(f[0], "ROSTER")) {
    if (count != 4) return MessageStatus::FieldCount;
    m.kind = MessageKind::Roster;
    if (!parse_peer(f[1], m.peer))          return MessageStatus::BadPeerId;
    if (!parse_u64(f[2], m.timestamp_ms))   return MessageStatus::BadNumber;
    if (!parse_roster(f[3], m.roster))      return MessageStatus::BadPeerId;
  } else if (equals(f[0], "RELAY")) {
    if (count != 2) return MessageStatus::FieldCount;
    m.kind = MessageKind::Greeting;
    if (!parse_u32(f[1], m.version))        return MessageStatus::BadNumber;
  } else {
    return MessageStatus::UnknownKind;
  }

  out = m;
  return MessageStatus::Ok;
}

// ---------- names ----------

const char* kind_name(MessageKind k) {
  switch (k) {
    case MessageKind::State:    return "STATE";
    case MessageKind::Join:     return "JOIN";
    case MessageKind::Leave:    return "LEAVE";
    case MessageKind::Roster:   return "ROSTER";
    case MessageKind::Greeting: return "RELAY";
  }
  return "?";
}

const char* status_name(MessageStatus s) {
  switch (s) {
    case MessageStatus::Ok:          return "ok";
    case MessageStatus::Empty:       return "empty";
    case MessageStatus::UnknownKind: return "unknown_kind";
    case MessageStatus::FieldCount:  return "field_count";
    case MessageStatus::BadNumber:   return "bad_number";
    case MessageStatus::BadPeerId:   return "bad_peer_id";
    case MessageStatus::Overflow:    return "overflow";
  }
  return "?";
}

// Same rules the operator CLI enforces for --id.
bool valid_peer_id(const char* s, size_t n) {
  if (!s || n < 1 || n > 6) return false;
  auto is_alnum = [](char c) { return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'); };
  auto is_sym   = [](char c) { return c == '-' || c == '_'; };
  for (size_t i = 0; i < n; ++i) {
    if (!(is_alnum(s[i]) || is_sym(s[i]))) return false;
    if (i > 0 && is_sym(s[i]) && is_sym(s[i - 1])) return false;
  }
  return is_alnum(s[0]) && is_alnum(s[n - 1]);
}

} // namespace platoon
