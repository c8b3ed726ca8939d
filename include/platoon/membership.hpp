#pragma once
/**
 * @file membership.hpp
 * @brief Ordered platoon chain: leader at index 0, followers behind it.
 *
 * Fixed capacity (`MAX_MEMBERS`), no heap, linear scans. Joins append to the tail;
 * leaves contract the chain so every follower's predecessor is always the entry
 * directly in front of it. The predecessor relation is never stored: it is an
 * index lookup recomputed on demand, so a removal can never leave a dangling
 * reference behind.
 *
 * Repeated joins and leaves for the same peer are harmless: they report
 * `AlreadyPresent` / `Absent` and change nothing.
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include "platoon/types.hpp"

namespace platoon {

class Membership {
public:
  /// Outcome of a join/leave. Only `Applied` changed the chain.
  enum class Change : uint8_t {
    Applied = 0,
    AlreadyPresent,   ///< join of a member (idempotent)
    Absent,           ///< leave of a non-member (idempotent)
    Full,             ///< join refused, chain at capacity
  };

  /// Append @p peer to the tail unless already present.
  Change join(const PeerId& peer);

  /// Remove @p peer; entries behind it move up one place.
  Change leave(const PeerId& peer);

  /// Replace the whole chain (roster adoption). Duplicates are skipped.
  void assign(const PeerList& members);

  void clear() { members_.clear(); }

  /// Index of @p peer, or -1.
  int index_of(const PeerId& peer) const;

  bool contains(const PeerId& peer) const { return index_of(peer) >= 0; }

  /// Entry directly ahead of @p peer; nullptr for the leader or a non-member.
  const PeerId* predecessor_of(const PeerId& peer) const;

  /// Leader, or nullptr when the chain is empty.
  const PeerId* leader() const { return members_.empty() ? nullptr : &members_[0]; }

  size_t size()  const { return members_.size(); }
  bool   empty() const { return members_.empty(); }
  bool   full()  const { return members_.full(); }

  const PeerId& operator[](size_t i) const { return members_[i]; }
  const PeerList& members() const { return members_; }

  PeerList::const_iterator begin() const { return members_.begin(); }
  PeerList::const_iterator end()   const { return members_.end(); }

  bool operator==(const Membership& o) const;
  bool operator!=(const Membership& o) const { return !(*this == o); }

  /// "A,B,C": for logs and the status command.
  std::string to_string() const;

private:
  PeerList members_;
};

const char* change_name(Membership::Change c);

} // namespace platoon
