#include <doctest/doctest.h>
#include "platoon/engine.hpp"

#include <vector>

using namespace platoon;

static Message join(const char* p, uint64_t ts = 0)  { return Message::join(PeerId(p), ts); }
static Message leave(const char* p, uint64_t ts = 0) { return Message::leave(PeerId(p), ts); }

static Message state(const char* p, uint32_t seq, double x = 0.0) {
    VehicleState s;
    s.peer = p;
    s.sequence = seq;
    s.position.x = x;
    return Message::state_update(s);
}

static void feed(PlatoonEngine& e, const std::vector<Message>& msgs, uint64_t now = 0) {
    for (const auto& m : msgs) e.handle_inbound(m, now);
}

TEST_CASE("Engines fed the same join/leave sequence agree on the chain") {
    const std::vector<Message> seq{join("L"), join("F1"), join("F2"), join("F3"),
                                   leave("F2"), join("F4"), leave("L"), join("F1")};
    PlatoonEngine a{PeerId("OBS1")};
    PlatoonEngine b{PeerId("OBS2")};
    feed(a, seq);
    feed(b, seq);

    CHECK(a.membership() == b.membership());
    CHECK(a.membership().to_string() == "F1,F3,F4");
}

TEST_CASE("Three vehicles join in order, the middle one leaves, the tail relinks to the leader") {
    PlatoonEngine f2{PeerId("F2")};
    feed(f2, {join("L"), join("F1")});
    f2.request_join(100, 100);

    REQUIRE(f2.current_role().kind == RoleKind::Follower);
    CHECK(f2.current_role().predecessor == PeerId("F1"));
    CHECK(f2.membership().to_string() == "L,F1,F2");
    const uint32_t epoch = f2.role_epoch();

    CHECK(f2.handle_inbound(leave("F1"), 200) == InboundResult::Applied);
    CHECK(f2.membership().to_string() == "L,F2");
    CHECK(f2.current_role().predecessor == PeerId("L"));
    CHECK(f2.role_epoch() == epoch + 1);
    // the departed predecessor's silence does not count against the new one
    CHECK(f2.track().linked_ms == 200);
    CHECK_FALSE(f2.track().has_state);
}

TEST_CASE("After a non-tail departure no member's predecessor is the departed peer") {
    const char* ids[] = {"L", "F1", "F2", "F3"};
    std::vector<PlatoonEngine> engines;
    engines.reserve(4);
    for (const char* id : ids) engines.emplace_back(PeerId(id));

    // each engine sees the others' JOINs in broadcast order; its own is local
    for (size_t i = 0; i < engines.size(); ++i) {
        for (size_t j = 0; j < engines.size(); ++j) {
            if (i == j) engines[i].request_join(0, 0);
            else        engines[i].handle_inbound(join(ids[j]), 0);
        }
    }
    for (size_t i = 0; i < engines.size(); ++i) {
        if (i == 2) engines[i].announce_leave(10, 10);
        else        engines[i].handle_inbound(leave("F2"), 10);
    }

    for (size_t i = 0; i < engines.size(); ++i) {
        if (i == 2) {
            CHECK(engines[i].current_role().kind == RoleKind::Unassigned);
            continue;
        }
        CHECK(engines[i].membership().to_string() == "L,F1,F3");
        CHECK(engines[i].current_role().predecessor != PeerId("F2"));
    }
    CHECK(engines[3].current_role().predecessor == PeerId("F1"));
    CHECK(engines[0].current_role().kind == RoleKind::Leader);
}

TEST_CASE("Duplicate joins and leaves of absent peers are idempotent conflicts") {
    PlatoonEngine e{PeerId("OBS")};
    CHECK(e.handle_inbound(join("A"), 0) == InboundResult::Applied);
    CHECK(e.handle_inbound(join("A"), 0) == InboundResult::MembershipConflict);
    CHECK(e.handle_inbound(leave("B"), 0) == InboundResult::MembershipConflict);
    CHECK(e.membership().to_string() == "A");
}

TEST_CASE("Records claiming to come from this instance are ignored") {
    PlatoonEngine e{PeerId("ME")};
    CHECK(e.handle_inbound(join("ME"), 0) == InboundResult::Ignored);
    CHECK(e.handle_inbound(state("ME", 3), 0) == InboundResult::Ignored);
    CHECK_FALSE(e.is_member());
}

TEST_CASE("Only the predecessor's newer STATE records are tracked") {
    PlatoonEngine f{PeerId("F1")};
    feed(f, {join("L")});
    f.request_join(0, 0);

    CHECK(f.handle_inbound(state("L", 5, 30.0), 10) == InboundResult::Applied);
    CHECK(f.handle_inbound(state("L", 4, 99.0), 20) == InboundResult::OutOfOrder);
    CHECK(f.handle_inbound(state("L", 5, 99.0), 20) == InboundResult::OutOfOrder);
    CHECK(f.handle_inbound(state("XX", 9), 20) == InboundResult::Ignored);

    CHECK(f.track().state.sequence == 5);
    CHECK(f.track().state.position.x == doctest::Approx(30.0));
    CHECK(f.track().received_ms == 10);
}

TEST_CASE("The leader ignores every STATE") {
    PlatoonEngine l{PeerId("L")};
    l.request_join(0, 0);
    feed(l, {join("F1")});
    CHECK(l.current_role().kind == RoleKind::Leader);
    CHECK(l.handle_inbound(state("F1", 1), 5) == InboundResult::Ignored);
    CHECK(l.fail_safe_reason(100000) == FailSafeReason::None);
}

TEST_CASE("Predecessor staleness: awaiting, fresh, then stale past the window") {
    PlatoonEngine f{PeerId("F1")};
    f.set_staleness(3, 50);   // 150 ms
    feed(f, {join("L")}, 1000);
    f.request_join(1000, 1000);

    CHECK(f.fail_safe_reason(1000) == FailSafeReason::AwaitingPredecessor);
    CHECK(f.fail_safe_reason(1150) == FailSafeReason::AwaitingPredecessor);
    CHECK(f.fail_safe_reason(1151) == FailSafeReason::StalePredecessor);

    f.handle_inbound(state("L", 1), 1200);
    CHECK(f.fail_safe_reason(1200) == FailSafeReason::None);
    CHECK(f.fail_safe_reason(1350) == FailSafeReason::None);
    CHECK(f.fail_safe_reason(1351) == FailSafeReason::StalePredecessor);
    CHECK(f.predecessor_stale(1400));

    f.handle_inbound(state("L", 2), 1400);
    CHECK(f.fail_safe_reason(1400) == FailSafeReason::None);
}

TEST_CASE("A synced leader answers joins with its roster") {
    PlatoonEngine l{PeerId("L")};
    l.request_join(0, 0);
    CHECK_FALSE(l.synced());
    l.tick(PlatoonEngine::DISCOVERY_WINDOW_DEFAULT_MS);
    REQUIRE(l.synced());

    l.handle_inbound(join("F1", 777), 600);
    Message out;
    REQUIRE(l.get_message(out));
    CHECK(out.kind == MessageKind::Roster);
    CHECK(out.peer == PeerId("L"));
    CHECK(out.timestamp_ms == 777);
    REQUIRE(out.roster.size() == 2);
    CHECK(out.roster[1] == PeerId("F1"));
    CHECK_FALSE(l.get_message(out));

    // a repeated JOIN (peer reconnected) is answered too
    l.handle_inbound(join("F1", 900), 700);
    CHECK(l.get_message(out));
}

TEST_CASE("The founding leader answers joins before its own window closes") {
    PlatoonEngine l{PeerId("L")};
    l.request_join(0, 0);
    REQUIRE_FALSE(l.synced());

    // F never saw L's JOIN
    PlatoonEngine f{PeerId("F")};
    const Message fj = f.request_join(200, 200);
    CHECK(f.current_role().kind == RoleKind::Leader);

    CHECK(l.handle_inbound(fj, 200) == InboundResult::Applied);
    Message out;
    REQUIRE(l.get_message(out));
    CHECK(out.kind == MessageKind::Roster);
    CHECK(f.handle_inbound(out, 210) == InboundResult::Applied);

    CHECK(f.synced());
    CHECK(f.membership().to_string() == "L,F");
    CHECK(f.current_role().predecessor == PeerId("L"));
    f.tick(1000);
    CHECK(f.current_role().kind == RoleKind::Follower);
}

TEST_CASE("An unsynced follower never answers joins") {
    PlatoonEngine f{PeerId("F1")};
    f.handle_inbound(join("L"), 0);
    f.request_join(10, 10);
    f.handle_inbound(join("F2"), 20);
    Message out;
    CHECK_FALSE(f.get_message(out));
}

TEST_CASE("After resync a leader's roster replaces a view that missed a leave") {
    PlatoonEngine f2{PeerId("F2")};
    feed(f2, {join("L"), join("F1")});
    f2.request_join(0, 0);
    f2.tick(PlatoonEngine::DISCOVERY_WINDOW_DEFAULT_MS);
    REQUIRE(f2.synced());

    PeerList roster;
    roster.push_back(PeerId("L"));
    roster.push_back(PeerId("F2"));
    const Message r = Message::roster_snapshot(PeerId("L"), 5, roster);
    CHECK(f2.handle_inbound(r, 1000) == InboundResult::Ignored);

    f2.resync(1000);
    CHECK(f2.synced());
    CHECK(f2.catching_up());
    // a peer that joins and leaves during the window is not carried over
    f2.handle_inbound(join("X"), 1010);
    f2.handle_inbound(leave("X"), 1020);
    CHECK(f2.handle_inbound(r, 1030) == InboundResult::Applied);

    CHECK(f2.membership().to_string() == "L,F2");
    CHECK(f2.current_role().predecessor == PeerId("L"));
    CHECK_FALSE(f2.catching_up());
}

TEST_CASE("A resync with no roster reply closes after one window") {
    PlatoonEngine e{PeerId("A")};
    e.request_join(0, 0);
    e.tick(500);
    REQUIRE(e.synced());
    e.resync(2000);
    e.tick(2499);
    CHECK(e.catching_up());
    e.tick(2500);
    CHECK_FALSE(e.catching_up());
    CHECK(e.membership().to_string() == "A");
}

TEST_CASE("A late joiner adopts the leader's roster and keeps peers it saw meanwhile") {
    PlatoonEngine f3{PeerId("F3")};
    f3.request_join(0, 0);
    CHECK(f3.current_role().kind == RoleKind::Leader);   // alone so far

    // F4 joined after F3 and the leader had not seen F4 yet when it answered
    f3.handle_inbound(join("F4"), 10);

    PeerList roster;
    for (const char* p : {"L", "F1", "F2", "F3"}) roster.push_back(PeerId(p));
    CHECK(f3.handle_inbound(Message::roster_snapshot(PeerId("L"), 5, roster), 20) == InboundResult::Applied);

    CHECK(f3.synced());
    CHECK(f3.membership().to_string() == "L,F1,F2,F3,F4");
    CHECK(f3.current_role().kind == RoleKind::Follower);
    CHECK(f3.current_role().predecessor == PeerId("F2"));

    // once synced, later rosters are ignored
    CHECK(f3.handle_inbound(Message::roster_snapshot(PeerId("L"), 6, roster), 30) == InboundResult::Ignored);
}

TEST_CASE("Rosters that do not come from their own head or omit this peer are ignored") {
    PlatoonEngine f{PeerId("F1")};
    f.request_join(0, 0);

    PeerList r;
    r.push_back(PeerId("L"));
    r.push_back(PeerId("F1"));
    CHECK(f.handle_inbound(Message::roster_snapshot(PeerId("F9"), 1, r), 5) == InboundResult::Ignored);

    PeerList without;
    without.push_back(PeerId("L"));
    without.push_back(PeerId("F2"));
    CHECK(f.handle_inbound(Message::roster_snapshot(PeerId("L"), 1, without), 5) == InboundResult::Ignored);
    CHECK_FALSE(f.synced());
}

TEST_CASE("Without a roster the engine syncs on its own view after the discovery window") {
    PlatoonEngine e{PeerId("A")};
    e.set_discovery_window_ms(200);
    e.request_join(1000, 1000);
    e.tick(1199);
    CHECK_FALSE(e.synced());
    e.tick(1200);
    CHECK(e.synced());
}

TEST_CASE("Interleaved churn from different senders keeps each sender's own order") {
    // The relay preserves order per sender only. A peer that joins and leaves
    // quickly is absent at every observer, whatever lands in between.
    PlatoonEngine a{PeerId("OA")};
    PlatoonEngine b{PeerId("OB")};
    feed(a, {join("L"), join("X"), join("F1"), leave("X")});
    feed(b, {join("L"), join("F1"), join("X"), leave("X")});
    CHECK(a.membership() == b.membership());
    CHECK_FALSE(a.membership().contains(PeerId("X")));

    // Joins from different senders may still be observed in different orders.
    PlatoonEngine c{PeerId("OC")};
    PlatoonEngine d{PeerId("OD")};
    feed(c, {join("P"), join("Q")});
    feed(d, {join("Q"), join("P")});
    CHECK(c.membership() != d.membership());
}

TEST_CASE("make_state stamps the callsign and a strictly increasing sequence") {
    PlatoonEngine e{PeerId("SELF")};
    VehicleState s;
    s.peer = "WRONG";
    const VehicleState a = e.make_state(s);
    const VehicleState b = e.make_state(s);
    CHECK(a.peer == PeerId("SELF"));
    CHECK(b.sequence == a.sequence + 1);
    CHECK(e.last_sequence() == b.sequence);
}

TEST_CASE("Leaving resets the role") {
    PlatoonEngine e{PeerId("F1")};
    feed(e, {join("L")});
    e.request_join(0, 0);
    const Message m = e.announce_leave(5, 55);
    CHECK(m.kind == MessageKind::Leave);
    CHECK(m.timestamp_ms == 55);
    CHECK_FALSE(e.is_member());
    CHECK(e.current_role().kind == RoleKind::Unassigned);
    CHECK(e.fail_safe_reason(10000) == FailSafeReason::None);
}
