#include <catch2/catch_test_macros.hpp>

#include "sample_ring.hpp"

#include <cstdint>
#include <cstring>
#include <numeric>
#include <vector>

TEST_CASE("SampleRing", "[sample_ring]") {
    constexpr size_t cap = 256;
    SampleRing ring(cap);

    SECTION("PushAndPop") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(ring.push(data) == 64);
        REQUIRE(ring.available() == 64);

        std::vector<int16_t> out(64);
        REQUIRE(ring.pop(out) == 64);
        REQUIRE(out == data);
        REQUIRE(ring.available() == 0);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200, 7);
        REQUIRE(ring.push(fill) == 200);
        std::vector<int16_t> sink(200);
        REQUIRE(ring.pop(sink) == 200);

        // Positions now sit at 200; the next push crosses the end of storage.
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(ring.push(wrap) == 128);

        std::vector<int16_t> out(128);
        REQUIRE(ring.pop(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsAndCounts") {
        std::vector<int16_t> big(cap + 100, 1);
        REQUIRE(ring.push(big) == cap);
        REQUIRE(ring.available() == cap);
        REQUIRE(ring.overruns() == 100);
    }

    SECTION("PushBytesIgnoresTrailingOddByte") {
        std::vector<int16_t> samples = {100, -200, 300};
        std::vector<uint8_t> bytes(samples.size() * 2 + 1, 0);
        std::memcpy(bytes.data(), samples.data(), samples.size() * 2);

        REQUIRE(ring.push_bytes(bytes.data(), bytes.size()) == 3);
        REQUIRE(ring.pop_all() == samples);
    }

    SECTION("DiscardDropsQueuedSamples") {
        std::vector<int16_t> data(50, 3);
        ring.push(data);
        REQUIRE(ring.discard() == 50);
        REQUIRE(ring.available() == 0);
        REQUIRE(ring.pop_all().empty());
    }

    SECTION("PartialPop") {
        std::vector<int16_t> data(50);
        std::iota(data.begin(), data.end(), int16_t(0));
        ring.push(data);

        std::vector<int16_t> out(20);
        REQUIRE(ring.pop(out) == 20);
        REQUIRE(out.front() == 0);
        REQUIRE(out.back() == 19);
        REQUIRE(ring.available() == 30);
    }

    SECTION("ResetClearsState") {
        std::vector<int16_t> big(cap + 10, 1);
        ring.push(big);
        ring.reset();
        REQUIRE(ring.available() == 0);
        REQUIRE(ring.overruns() == 0);
    }
}
