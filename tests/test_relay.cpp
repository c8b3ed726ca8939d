#include <doctest/doctest.h>
#include "platoon/message.hpp"
#include "platoon/slip.hpp"
#include "platoon/transport/relay.hpp"
#include "platoon/transport/socket_io.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace platoon;
using namespace platoon::transport;

namespace {

// Raw test peer: a socket plus its decoder.
struct RawPeer {
    int fd{-1};
    slip::Decoder dec;
    std::vector<std::vector<uint8_t>> pending;

    ~RawPeer() { close_socket(fd); }

    bool send(const std::string& stamp) {
        return write_frame(fd, reinterpret_cast<const uint8_t*>(stamp.data()), stamp.size());
    }

    // Collect frames until @p n arrived or @p ms elapsed.
    std::vector<std::string> recv(size_t n, int ms) {
        std::vector<std::string> out;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
            pending.clear();
            const IoStatus st = read_frames(fd, dec, pending, 20);
            for (const auto& f : pending) out.emplace_back(f.begin(), f.end());
            if (st == IoStatus::Closed || st == IoStatus::Error) break;
        }
        return out;
    }
};

bool wait_for(const std::function<bool()>& cond, int ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

RelayConfig local_config() {
    RelayConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.poll_ms = 20;
    return cfg;
}

void connect_peer(RawPeer& p, uint16_t port) {
    Address a;
    a.host = "127.0.0.1";
    a.port = port;
    p.fd = connect_to(a, 1000);
    REQUIRE(p.fd >= 0);
    const auto hello = p.recv(1, 1000);
    REQUIRE(hello.size() == 1);
    CHECK(hello[0] == "RELAY~1");
}

std::string state_stamp(uint32_t seq) {
    VehicleState s;
    s.peer = "A";
    s.sequence = seq;
    s.timestamp_ms = 1000 + seq;
    s.position.x = seq * 0.5;
    Text255 out;
    REQUIRE(encode(Message::state_update(s), out) == MessageStatus::Ok);
    return std::string(out.c_str(), out.size());
}

} // namespace

TEST_CASE("Relay greets each peer and forwards records unmodified and in order") {
    Relay relay(local_config());
    REQUIRE(relay.start());
    REQUIRE(relay.port() != 0);

    RawPeer a, b;
    connect_peer(a, relay.port());
    connect_peer(b, relay.port());
    REQUIRE(wait_for([&] { return relay.peer_count() == 2; }, 1000));

    std::vector<std::string> sent;
    for (uint32_t seq = 1; seq <= 50; ++seq) {
        sent.push_back(state_stamp(seq));
        REQUIRE(a.send(sent.back()));
    }

    const auto got = b.recv(sent.size(), 3000);
    CHECK(got == sent);

    // never echoed back to the sender
    CHECK(a.recv(1, 100).empty());

    relay.stop();
}

TEST_CASE("Records that need SLIP escaping pass through byte for byte") {
    Relay relay(local_config());
    REQUIRE(relay.start());
    RawPeer a, b;
    connect_peer(a, relay.port());
    connect_peer(b, relay.port());
    REQUIRE(wait_for([&] { return relay.peer_count() == 2; }, 1000));

    std::string odd = "X";
    odd.push_back(static_cast<char>(slip::END));
    odd.push_back(static_cast<char>(slip::ESC));
    odd += "Y";
    REQUIRE(a.send(odd));
    const auto got = b.recv(1, 2000);
    REQUIRE(got.size() == 1);
    CHECK(got[0] == odd);
}

TEST_CASE("A peer that drops out is removed without disturbing the others") {
    Relay relay(local_config());
    REQUIRE(relay.start());

    RawPeer a, b;
    connect_peer(a, relay.port());
    connect_peer(b, relay.port());
    {
        RawPeer c;
        connect_peer(c, relay.port());
        REQUIRE(wait_for([&] { return relay.peer_count() == 3; }, 1000));
        // c closes here without a word
    }
    REQUIRE(wait_for([&] { return relay.peer_count() == 2; }, 2000));

    REQUIRE(a.send("JOIN~A~1"));
    REQUIRE(b.send("JOIN~B~2"));
    const auto at_b = b.recv(1, 2000);
    const auto at_a = a.recv(1, 2000);
    REQUIRE(at_b.size() == 1);
    REQUIRE(at_a.size() == 1);
    CHECK(at_b[0] == "JOIN~A~1");
    CHECK(at_a[0] == "JOIN~B~2");
    CHECK(relay.frames_forwarded() >= 2);
}

TEST_CASE("A second relay cannot bind a port already in use") {
    Relay first(local_config());
    REQUIRE(first.start());

    RelayConfig cfg = local_config();
    cfg.port = first.port();
    Relay second(cfg);
    CHECK_FALSE(second.start());
    CHECK_FALSE(second.running());
}

TEST_CASE("Stopping closes every connection and is idempotent") {
    Relay relay(local_config());
    REQUIRE(relay.start());
    RawPeer a;
    connect_peer(a, relay.port());
    REQUIRE(wait_for([&] { return relay.peer_count() == 1; }, 1000));

    relay.stop();
    CHECK_FALSE(relay.running());
    CHECK(relay.peer_count() == 0);
    relay.stop();

    // the peer sees an orderly close
    std::vector<std::vector<uint8_t>> frames;
    IoStatus st = IoStatus::Timeout;
    for (int i = 0; i < 50 && st == IoStatus::Timeout; ++i) st = read_frames(a.fd, a.dec, frames, 20);
    CHECK(st == IoStatus::Closed);
}
