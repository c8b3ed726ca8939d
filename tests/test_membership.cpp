#include <doctest/doctest.h>
#include "platoon/membership.hpp"

#include <string>

using namespace platoon;

static PeerId id(const char* s) { return PeerId(s); }

TEST_CASE("Joins append in arrival order; index 0 leads") {
    Membership m;
    CHECK(m.join(id("L")) == Membership::Change::Applied);
    CHECK(m.join(id("F1")) == Membership::Change::Applied);
    CHECK(m.join(id("F2")) == Membership::Change::Applied);

    CHECK(m.to_string() == "L,F1,F2");
    REQUIRE(m.leader() != nullptr);
    CHECK(*m.leader() == id("L"));
    CHECK(m.predecessor_of(id("L")) == nullptr);
    REQUIRE(m.predecessor_of(id("F2")) != nullptr);
    CHECK(*m.predecessor_of(id("F2")) == id("F1"));
}

TEST_CASE("Duplicate join and leave of an absent peer change nothing") {
    Membership m;
    m.join(id("L"));
    m.join(id("F1"));
    CHECK(m.join(id("L")) == Membership::Change::AlreadyPresent);
    CHECK(m.leave(id("XX")) == Membership::Change::Absent);
    CHECK(m.to_string() == "L,F1");
}

TEST_CASE("Leaving contracts the chain around the departed member") {
    Membership m;
    for (const char* p : {"L", "F1", "F2", "F3"}) m.join(id(p));

    REQUIRE(m.leave(id("F1")) == Membership::Change::Applied);
    CHECK(m.to_string() == "L,F2,F3");
    CHECK(*m.predecessor_of(id("F2")) == id("L"));
    CHECK(*m.predecessor_of(id("F3")) == id("F2"));
    CHECK(m.index_of(id("F1")) == -1);

    // leader departure promotes the first follower
    REQUIRE(m.leave(id("L")) == Membership::Change::Applied);
    CHECK(*m.leader() == id("F2"));
    CHECK(m.predecessor_of(id("F2")) == nullptr);
}

TEST_CASE("Chain refuses joins past capacity") {
    Membership m;
    for (size_t i = 0; i < MAX_MEMBERS; ++i) {
        std::string s = "P" + std::to_string(i);
        REQUIRE(m.join(PeerId(s.c_str())) == Membership::Change::Applied);
    }
    CHECK(m.full());
    CHECK(m.join(id("LATE")) == Membership::Change::Full);
    CHECK(m.size() == MAX_MEMBERS);
}

TEST_CASE("assign() replaces the chain and skips duplicates") {
    Membership m;
    m.join(id("OLD"));
    PeerList list;
    list.push_back(id("L"));
    list.push_back(id("F1"));
    list.push_back(id("L"));
    m.assign(list);
    CHECK(m.to_string() == "L,F1");
    CHECK_FALSE(m.contains(id("OLD")));
}

TEST_CASE("Equality compares order, not just contents") {
    Membership a, b;
    a.join(id("L")); a.join(id("F1"));
    b.join(id("F1")); b.join(id("L"));
    CHECK(a != b);
    b.clear();
    b.join(id("L")); b.join(id("F1"));
    CHECK(a == b);
}
