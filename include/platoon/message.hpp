/**
 * @file message.hpp
 * @brief Platoon wire messages: tilde-delimited text stamps.
 *
 * @details
 * Every record carried by the relay is one short ASCII stamp. The first field is
 * the kind tag, the second the peer the record is about:
 *
 * ```
 *  STATE~<peer>~<seq>~<ts_ms>~<x>,<y>,<z>~<vx>,<vy>,<vz>~<heading>~<throttle>~<brake>
 *  JOIN~<peer>~<ts_ms>
 *  LEAVE~<peer>~<ts_ms>
 *  ROSTER~<leader>~<ts_ms>~<id>,<id>,...
 *  RELAY~<version>                      (greeting, relay -> new client only)
 * ```
 *
 * Text was chosen over packed binary so a capture of the relay stream can be read
 * by eye and replayed with a shell. Reals are printed with `%.9g`, enough for
 * millimetre positions over tens of kilometres.
 *
 * @par Failure model
 * `decode()` never throws and never partially fills the output on failure; the
 * returned `MessageStatus` says what was wrong so the caller can log and drop.
 *
 * @par Limits
 * Stamps are at most 255 bytes (`Text255`), which also bounds the relay record
 * size. A full 16-member roster is ~130 bytes.
 */
#ifndef PLATOON_MESSAGE_HPP
#define PLATOON_MESSAGE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/string.h"
#include "platoon/types.hpp"

namespace platoon {

/// Largest encoded stamp, in bytes.
static constexpr size_t STAMP_MAX = 255;

/// Encoded stamp buffer.
using Text255 = etl::string<STAMP_MAX>;

/// Relay/client handshake version carried in the greeting.
static constexpr uint32_t PROTOCOL_VERSION = 1;

enum class MessageKind : uint8_t {
  State = 0,
  Join,
  Leave,
  Roster,
  Greeting,
};

/// Result codes for encoding / decoding a stamp.
enum class MessageStatus : uint8_t {
  Ok = 0,
  Empty,
  UnknownKind,
  FieldCount,     ///< wrong number of '~' fields for the kind
  BadNumber,
  BadPeerId,
  Overflow,       ///< encoded stamp would exceed 255 bytes / roster too long
};

/**
 * @brief One decoded platoon record.
 *
 * Only the fields relevant to `kind` are meaningful:
 * - State    : `state` (its `peer` mirrors `peer`)
 * - Join     : `peer`, `timestamp_ms`
 * - Leave    : `peer`, `timestamp_ms`
 * - Roster   : `peer` (leader that sent it), `timestamp_ms`, `roster`
 * - Greeting : `version`
 */
struct Message {
  MessageKind  kind{MessageKind::State};
  PeerId       peer{};
  uint64_t     timestamp_ms{0};
  VehicleState state{};
  PeerList     roster{};
  uint32_t     version{0};

  static Message state_update(const VehicleState& s);
  static Message join(const PeerId& peer, uint64_t timestamp_ms);
  static Message leave(const PeerId& peer, uint64_t timestamp_ms);
  static Message roster_snapshot(const PeerId& leader, uint64_t timestamp_ms, const PeerList& members);
  static Message greeting(uint32_t version = PROTOCOL_VERSION);
};

/// Serialise @p m into @p out. Returns Ok or Overflow.
MessageStatus encode(const Message& m, Text255& out);

/// Parse a stamp of @p len bytes (no terminator required).
MessageStatus decode(const char* data, size_t len, Message& out);

/// Convenience overload for a stamp held in an ETL string.
inline MessageStatus decode(const Text255& stamp, Message& out) {
  return decode(stamp.c_str(), stamp.size(), out);
}

/// Wire tag for a kind ("STATE", "JOIN", ...).
const char* kind_name(MessageKind k);

/// Short lowercase name for logs ("ok", "bad_number", ...).
const char* status_name(MessageStatus s);

/**
 * @brief Callsign rules: 1..6 chars of A–Z 0–9 '-' '_', starting and ending
 *        alphanumeric, no two symbols in a row. Lowercase is rejected.
 */
bool valid_peer_id(const char* s, size_t n);

inline bool valid_peer_id(const PeerId& id) { return valid_peer_id(id.c_str(), id.size()); }

} // namespace platoon

#endif // PLATOON_MESSAGE_HPP
