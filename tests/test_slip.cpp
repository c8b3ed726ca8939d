#include <doctest/doctest.h>
#include "platoon/slip.hpp"

#include <string>
#include <vector>

using namespace platoon;

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Feed a whole buffer, collecting every completed frame.
static std::vector<std::vector<uint8_t>> feed_all(slip::Decoder& d, const std::vector<uint8_t>& in) {
    std::vector<std::vector<uint8_t>> frames;
    std::vector<uint8_t> f;
    for (uint8_t b : in) {
        if (d.feed(b, f)) frames.push_back(f);
    }
    return frames;
}

TEST_CASE("Encoding escapes END and ESC and brackets the frame") {
    const std::vector<uint8_t> payload{'A', slip::END, 'B', slip::ESC, 'C'};
    const auto wire = slip::encode(payload);
    const std::vector<uint8_t> expect{slip::END, 'A', slip::ESC, slip::ESC_END, 'B',
                                      slip::ESC, slip::ESC_ESC, 'C', slip::END};
    CHECK(wire == expect);

    slip::Decoder d;
    auto frames = feed_all(d, wire);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == payload);
}

TEST_CASE("A frame split across arbitrary reads is reassembled once") {
    const auto wire = slip::encode(bytes("JOIN~LEAD01~1000"));
    slip::Decoder d;
    std::vector<uint8_t> f;
    size_t completed = 0;
    // one byte at a time, as if every read(2) returned a single byte
    for (size_t i = 0; i < wire.size(); ++i) {
        if (d.feed(wire[i], f)) ++completed;
        if (i + 1 < wire.size()) CHECK(completed == 0);
    }
    CHECK(completed == 1);
    CHECK(f == bytes("JOIN~LEAD01~1000"));
}

TEST_CASE("Back-to-back frames share boundaries and empty frames are skipped") {
    std::vector<uint8_t> wire = slip::encode(bytes("ONE"));
    auto two = slip::encode(bytes("TWO"));
    wire.insert(wire.end(), two.begin(), two.end());
    wire.push_back(slip::END);  // filler
    wire.push_back(slip::END);

    slip::Decoder d;
    auto frames = feed_all(d, wire);
    REQUIRE(frames.size() == 2);
    CHECK(frames[0] == bytes("ONE"));
    CHECK(frames[1] == bytes("TWO"));
}

TEST_CASE("Garbage before the first END is ignored") {
    std::vector<uint8_t> wire = bytes("noise");
    auto good = slip::encode(bytes("STATE"));
    wire.insert(wire.end(), good.begin(), good.end());

    slip::Decoder d;
    auto frames = feed_all(d, wire);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == bytes("STATE"));
}

TEST_CASE("Malformed escape drops the partial frame and resyncs on the next END") {
    std::vector<uint8_t> wire{slip::END, 'X', slip::ESC, 'Q', 'Y', slip::END};
    auto good = slip::encode(bytes("OK"));
    wire.insert(wire.end(), good.begin(), good.end());

    slip::Decoder d;
    auto frames = feed_all(d, wire);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == bytes("OK"));
    CHECK(d.dropped() == 1);
}

TEST_CASE("Oversize records are discarded") {
    std::vector<uint8_t> big(slip::MAX_FRAME + 10, 'Z');
    auto wire = slip::encode(big);
    auto small = slip::encode(bytes("after"));
    wire.insert(wire.end(), small.begin(), small.end());

    slip::Decoder d;
    auto frames = feed_all(d, wire);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == bytes("after"));
}

TEST_CASE("reset() forgets a partial frame") {
    slip::Decoder d;
    std::vector<uint8_t> f;
    d.feed(slip::END, f);
    d.feed('P', f);
    d.feed('Q', f);
    d.reset();
    // without an opening END the tail of the old frame is not a frame
    CHECK_FALSE(d.feed(slip::END, f));
    auto frames = feed_all(d, slip::encode(bytes("NEW")));
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == bytes("NEW"));
}
