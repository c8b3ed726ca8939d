// ============================================================================
// membership.cpp: implementation for membership.hpp
// ============================================================================
#include "platoon/membership.hpp"

namespace platoon {

Membership::Change Membership::join(const PeerId& peer) {
  if (contains(peer))    return Change::AlreadyPresent;
  if (members_.full())   return Change::Full;
  members_.push_back(peer);
  return Change::Applied;
}

// Erasing in place is the chain contraction: whoever stood behind the departed
// peer now sits right behind the departed peer's former predecessor.
Membership::Change Membership::leave(const PeerId& peer) {
  const int idx = index_of(peer);
  if (idx < 0) return Change::Absent;
  members_.erase(members_.begin() + idx);
  return Change::Applied;
}

void Membership::assign(const PeerList& members) {
  members_.clear();
  for (const auto& p : members) {
    if (!contains(p)) members_.push_back(p);
  }
}

int Membership::index_of(const PeerId& peer) const {
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_[i] == peer) return static_cast<int>(i);
  }
  return -1;
}

const PeerId* Membership::predecessor_of(const PeerId& peer) const {
  const int idx = index_of(peer);
  if (idx <= 0) return nullptr;
  return &members_[static_cast<size_t>(idx - 1)];
}

bool Membership::operator==(const Membership& o) const {
  if (members_.size() != o.members_.size()) return false;
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_[i] != o.members_[i]) return false;
  }
  return true;
}

std::string Membership::to_string() const {
  std::string s;
  for (size_t i = 0; i < members_.size(); ++i) {
    if (i) s += ',';
    s += members_[i].c_str();
  }
  return s;
}

const char* change_name(Membership::Change c) {
  switch (c) {
    case Membership::Change::Applied:        return "applied";
    case Membership::Change::AlreadyPresent: return "already_present";
    case Membership::Change::Absent:         return "absent";
    case Membership::Change::Full:           return "full";
  }
  return "?";
}

} // namespace platoon
