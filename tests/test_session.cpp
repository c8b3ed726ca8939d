#include <doctest/doctest.h>
#include "platoon/session.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace platoon;
using transport::LinkState;

namespace {

class MemoryLink;

// Every record goes to every other connected endpoint, like the relay.
struct Bus {
    std::vector<MemoryLink*> links;
};

class MemoryLink : public transport::Link {
public:
    explicit MemoryLink(Bus& bus) : bus_(bus) { bus_.links.push_back(this); }

    bool send(const Message& m) override {
        if (link_state != LinkState::Connected && link_state != LinkState::Reconnecting) return false;
        // through the codec, as on the wire
        Text255 stamp;
        if (encode(m, stamp) != MessageStatus::Ok) return false;
        Message copy;
        if (decode(stamp, copy) != MessageStatus::Ok) return false;
        sent.push_back(copy);
        if (link_state != LinkState::Connected) return true;
        for (MemoryLink* l : bus_.links) {
            if (l != this && l->link_state == LinkState::Connected) l->inbox.push_back(copy);
        }
        return true;
    }

    bool poll(Message& out) override {
        if (inbox.empty()) return false;
        out = inbox.front();
        inbox.pop_front();
        return true;
    }

    LinkState   state() const override { return link_state; }
    uint32_t    generation() const override { return gen; }
    void        close(uint32_t) override { link_state = LinkState::Disconnected; }
    const char* name() const override { return "memory"; }

    size_t count_sent(MessageKind k) const {
        size_t n = 0;
        for (const auto& m : sent) if (m.kind == k) ++n;
        return n;
    }

    LinkState link_state{LinkState::Connected};
    uint32_t gen{1};
    std::deque<Message> inbox;
    std::vector<Message> sent;

private:
    Bus& bus_;
};

struct Car {
    Car(Bus& bus, const char* id, double x)
    : vehicle(DEFAULT_BLUEPRINT, Vec3{x, 0.0, 0.0}, 0.0), link(bus), session(PeerId(id), vehicle, link) {
        session.set_console(&console);
    }

    KinematicVehicle   vehicle;
    MemoryLink         link;
    VehicleSession     session;
    std::ostringstream console;
};

constexpr uint64_t PERIOD = 50;

// Tick every car in order, then advance the vehicles by one period.
void run_ticks(std::vector<Car*> cars, uint64_t& now, int n) {
    for (int i = 0; i < n; ++i) {
        for (Car* c : cars) {
            if (c->session.status() == SessionStatus::Running) c->session.tick(now, now);
        }
        for (Car* c : cars) c->vehicle.step(PERIOD / 1000.0);
        now += PERIOD;
    }
}

bool overlap(const ControlCommand& c) { return c.throttle > 0.0 && c.brake > 0.0; }

} // namespace

TEST_CASE("Three vehicles form a platoon; the middle one leaves and the tail follows the leader") {
    Bus bus;
    Car l(bus, "L", 40.0), f1(bus, "F1", 25.0), f2(bus, "F2", 10.0);
    std::vector<Car*> all{&l, &f1, &f2};
    uint64_t now = 0;

    REQUIRE(l.session.join(now, now));
    run_ticks(all, now, 2);
    REQUIRE(f1.session.join(now, now));
    run_ticks(all, now, 2);
    REQUIRE(f2.session.join(now, now));
    run_ticks(all, now, 40);

    for (Car* c : all) CHECK(c->session.engine().membership().to_string() == "L,F1,F2");
    CHECK(l.session.engine().current_role().kind == RoleKind::Leader);
    CHECK(f1.session.engine().current_role().predecessor == PeerId("L"));
    CHECK(f2.session.engine().current_role().predecessor == PeerId("F1"));

    CHECK(l.session.last_output().mode == DriveMode::Cruise);
    CHECK(f1.session.last_output().mode != DriveMode::FailSafe);
    CHECK(f2.session.last_output().mode != DriveMode::FailSafe);
    CHECK(l.vehicle.speed() > 0.0);
    for (Car* c : all) CHECK_FALSE(overlap(c->session.last_output().command));

    f1.session.leave(now, now);
    CHECK(f1.session.status() == SessionStatus::Left);
    CHECK(f1.link.link_state == LinkState::Disconnected);
    CHECK(f1.link.count_sent(MessageKind::Leave) == 1);
    run_ticks(all, now, 2);

    CHECK(l.session.engine().membership().to_string() == "L,F2");
    CHECK(f2.session.engine().membership().to_string() == "L,F2");
    CHECK(f2.session.engine().current_role().predecessor == PeerId("L"));
    CHECK(f2.session.last_output().mode != DriveMode::FailSafe);
    CHECK(exit_code(f1.session.status()) == 0);
}

TEST_CASE("A silent predecessor puts the follower in fail-safe on the very next tick") {
    Bus bus;
    Car l(bus, "L", 30.0), f(bus, "F", 15.0);
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks({&l, &f}, now, 1);
    REQUIRE(f.session.join(now, now));
    run_ticks({&l, &f}, now, 30);
    REQUIRE(f.session.last_output().mode != DriveMode::FailSafe);

    // leader stops talking; follower keeps ticking
    bool saw_fail_safe = false;
    for (int i = 0; i < 10 && !saw_fail_safe; ++i) {
        f.session.tick(now, now);
        if (f.session.engine().predecessor_stale(now)) {
            const ControlOutput& out = f.session.last_output();
            CHECK(out.mode == DriveMode::FailSafe);
            CHECK(out.reason == FailSafeReason::StalePredecessor);
            CHECK(out.command.throttle == 0.0);
            CHECK(out.command.brake > 0.0);
            CHECK(f.vehicle.last_control().brake > 0.0);
            saw_fail_safe = true;
        }
        now += PERIOD;
    }
    CHECK(saw_fail_safe);

    // fresh data clears it
    run_ticks({&l, &f}, now, 1);
    CHECK(f.session.last_output().mode != DriveMode::FailSafe);
}

TEST_CASE("Vehicle loss ends the session with exit code 3") {
    Bus bus;
    Car c(bus, "A", 0.0);
    uint64_t now = 0;
    run_ticks({&c}, now, 1);
    c.vehicle.destroy();
    CHECK(c.session.tick(now, now) == SessionStatus::VehicleLost);
    CHECK(exit_code(c.session.status()) == 3);
    // terminal: later ticks do nothing
    CHECK(c.session.tick(now + 50, now + 50) == SessionStatus::VehicleLost);
}

TEST_CASE("Link trouble forces fail-safe; a disconnected link ends the session") {
    Bus bus;
    Car l(bus, "L", 30.0), f(bus, "F", 15.0);
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks({&l, &f}, now, 1);
    REQUIRE(f.session.join(now, now));
    run_ticks({&l, &f}, now, 10);

    f.link.link_state = LinkState::Reconnecting;
    CHECK(f.session.tick(now, now) == SessionStatus::Running);
    CHECK(f.session.last_output().mode == DriveMode::FailSafe);
    CHECK(f.session.last_output().reason == FailSafeReason::LinkDown);

    f.link.link_state = LinkState::Disconnected;
    CHECK(f.session.tick(now + 50, now + 50) == SessionStatus::LinkLost);
    CHECK(f.session.last_output().mode == DriveMode::FailSafe);
    CHECK(f.vehicle.last_control().brake > 0.0);
    CHECK(exit_code(SessionStatus::LinkLost) == 1);
}

TEST_CASE("After a reconnect a member announces itself again") {
    Bus bus;
    Car a(bus, "A", 0.0), b(bus, "B", -20.0);
    uint64_t now = 0;
    REQUIRE(a.session.join(now, now));
    run_ticks({&a, &b}, now, 2);
    CHECK(a.link.count_sent(MessageKind::Join) == 1);

    a.link.gen = 2;   // the link came back under the session
    run_ticks({&a, &b}, now, 1);
    CHECK(a.link.count_sent(MessageKind::Join) == 2);
    CHECK(a.session.engine().membership().to_string() == "A");

    // a non-member does not
    b.link.gen = 5;
    run_ticks({&a, &b}, now, 1);
    CHECK(b.link.count_sent(MessageKind::Join) == 0);
}

TEST_CASE("A member that missed a LEAVE while reconnecting takes the leader's view afterwards") {
    Bus bus;
    Car l(bus, "L", 40.0), f1(bus, "F1", 25.0), f2(bus, "F2", 10.0);
    std::vector<Car*> all{&l, &f1, &f2};
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks(all, now, 2);
    REQUIRE(f1.session.join(now, now));
    run_ticks(all, now, 2);
    REQUIRE(f2.session.join(now, now));
    run_ticks(all, now, 20);
    REQUIRE(f2.session.engine().synced());
    REQUIRE(f2.session.engine().membership().to_string() == "L,F1,F2");

    f2.link.link_state = LinkState::Reconnecting;
    run_ticks(all, now, 2);
    f1.session.leave(now, now);
    run_ticks(all, now, 2);
    CHECK(l.session.engine().membership().to_string() == "L,F2");
    CHECK(f2.session.engine().membership().to_string() == "L,F1,F2");   // never heard it

    f2.link.link_state = LinkState::Connected;
    f2.link.gen = 2;
    run_ticks(all, now, 4);

    CHECK(f2.link.count_sent(MessageKind::Join) == 2);
    CHECK(f2.session.engine().membership().to_string() == "L,F2");
    CHECK(f2.session.engine().current_role().predecessor == PeerId("L"));
    CHECK(f2.session.last_output().mode != DriveMode::FailSafe);

    run_ticks(all, now, 20);
    CHECK(f2.session.engine().membership().to_string() == "L,F2");
    CHECK(f2.session.last_output().mode != DriveMode::FailSafe);
}

TEST_CASE("A vehicle that missed the leader's JOIN still lines up behind it") {
    Bus bus;
    Car l(bus, "L", 40.0);
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks({&l}, now, 4);
    REQUIRE_FALSE(l.session.engine().synced());

    Car f(bus, "F", 25.0);   // connects after L's JOIN went out
    REQUIRE(f.session.join(now, now));
    run_ticks({&l, &f}, now, 60);

    CHECK(l.session.engine().membership().to_string() == "L,F");
    CHECK(f.session.engine().membership().to_string() == "L,F");
    CHECK(l.session.engine().current_role().kind == RoleKind::Leader);
    CHECK(f.session.engine().current_role().kind == RoleKind::Follower);
    CHECK(f.session.engine().current_role().predecessor == PeerId("L"));
}

TEST_CASE("A late joiner holds still until the leader's roster places it") {
    Bus bus;
    Car l(bus, "L", 40.0);
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks({&l}, now, 12);
    REQUIRE(l.session.engine().synced());

    Car b(bus, "B", 25.0);
    REQUIRE(b.session.join(now, now));

    // B ticks before the leader has seen its JOIN
    b.session.tick(now, now);
    CHECK(b.session.engine().current_role().kind == RoleKind::Leader);
    CHECK(b.session.last_output().mode == DriveMode::Idle);
    CHECK(b.session.last_output().command.throttle == 0.0);
    CHECK(b.vehicle.last_control().brake > 0.0);

    l.session.tick(now, now);
    now += PERIOD;
    b.session.tick(now, now);
    CHECK(b.session.engine().synced());
    CHECK(b.session.engine().membership().to_string() == "L,B");
    CHECK(b.session.engine().current_role().predecessor == PeerId("L"));
    CHECK(b.session.last_output().command.throttle == 0.0);
}

TEST_CASE("Operator commands arrive through the queue and apply on the next tick") {
    Bus bus;
    Car c(bus, "OP", 0.0);
    uint64_t now = 0;

    OperatorCommand cmd;
    cmd.kind = OperatorCommandKind::SetGap;
    cmd.value = 22.0;
    c.session.commands().push(cmd);
    cmd.kind = OperatorCommandKind::Join;
    c.session.commands().push(cmd);
    cmd.kind = OperatorCommandKind::Status;
    c.session.commands().push(cmd);
    CHECK(c.session.commands().size() == 3);

    run_ticks({&c}, now, 1);
    CHECK(c.session.commands().size() == 0);
    CHECK(c.session.controller().targets().gap_m == doctest::Approx(22.0));
    CHECK(c.session.engine().is_member());
    CHECK(c.console.str().find("id=OP role=leader") != std::string::npos);

    cmd.kind = OperatorCommandKind::Help;
    c.session.commands().push(cmd);
    run_ticks({&c}, now, 1);
    CHECK(c.console.str().find("set-gap") != std::string::npos);

    cmd.kind = OperatorCommandKind::Quit;
    c.session.commands().push(cmd);
    run_ticks({&c}, now, 1);
    CHECK(c.session.status() == SessionStatus::Left);
    CHECK(c.link.count_sent(MessageKind::Leave) == 1);
}

TEST_CASE("Outside a platoon the vehicle idles on the brake") {
    Bus bus;
    Car c(bus, "SOLO", 0.0);
    uint64_t now = 0;
    run_ticks({&c}, now, 1);
    CHECK(c.session.engine().current_role().kind == RoleKind::Unassigned);
    CHECK(c.session.last_output().mode == DriveMode::Idle);
    CHECK(c.vehicle.last_control().throttle == 0.0);
    // STATE is still published every tick
    CHECK(c.link.count_sent(MessageKind::State) == 1);
}

TEST_CASE("Lead paths run on the leader only and muted steps publish nothing") {
    Bus bus;
    Car l(bus, "L", 30.0), f(bus, "F", 15.0);
    uint64_t now = 0;
    REQUIRE(l.session.join(now, now));
    run_ticks({&l, &f}, now, 1);
    REQUIRE(f.session.join(now, now));
    run_ticks({&l, &f}, now, 12);
    REQUIRE(l.session.engine().synced());

    CHECK_FALSE(f.session.run_path(1, now));
    CHECK_FALSE(l.session.run_path(12, now));
    REQUIRE(l.session.run_path(5, now));

    const uint64_t start = now;
    l.session.tick(start + 100, start + 100);
    CHECK(l.session.last_output().mode == DriveMode::Scripted);
    CHECK(l.session.last_output().command.throttle == doctest::Approx(1.0));

    // path 5: cruise from 10 s to 16 s without broadcasting
    const size_t before = l.link.count_sent(MessageKind::State);
    l.session.tick(start + 11000, start + 11000);
    l.session.tick(start + 11050, start + 11050);
    CHECK(l.link.count_sent(MessageKind::State) == before);
    CHECK(l.session.last_output().mode == DriveMode::Scripted);

    // braking phase talks again
    l.session.tick(start + 17000, start + 17000);
    CHECK(l.link.count_sent(MessageKind::State) == before + 1);
    CHECK(l.session.last_output().command.brake == doctest::Approx(1.0));

    // done: hold still instead of cruising off
    l.session.tick(start + 30000, start + 30000);
    CHECK(l.session.last_output().mode == DriveMode::Cruise);
    CHECK(l.session.controller().targets().speed_mps == 0.0);
}

TEST_CASE("A stop request leaves the platoon cleanly") {
    Bus bus;
    Car c(bus, "STOP", 0.0);
    uint64_t now = 0;
    REQUIRE(c.session.join(now, now));

    std::atomic<bool> stop{true};
    CHECK(c.session.run(stop) == SessionStatus::Left);
    CHECK(c.link.count_sent(MessageKind::Leave) == 1);
    CHECK(c.link.link_state == LinkState::Disconnected);
    CHECK(c.vehicle.last_control().brake > 0.0);
}

TEST_CASE("Target setters validate before touching the controller") {
    Bus bus;
    Car c(bus, "SET", 0.0);
    CHECK_FALSE(c.session.set_target_gap(0.0));
    CHECK_FALSE(c.session.set_target_speed(99.0));
    CHECK(c.session.set_target_speed(5.0));
    CHECK(c.session.controller().targets().speed_mps == doctest::Approx(5.0));
}
