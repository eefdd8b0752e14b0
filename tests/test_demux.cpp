/**
 * @file test_demux.cpp
 * @brief Unit tests for virtual-channel demultiplexing and counter tracking
 */

#include <catch2/catch_test_macros.hpp>

#include "demux.hpp"
#include "synth.hpp"

using namespace goesrx;

namespace {

TransportUnit parsed(const synth::Bytes &raw) {
    MissionProfile profile;
    TransportUnit u;
    REQUIRE(parse_unit(raw.data(), raw.size(), profile, u));
    return u;
}

std::vector<synth::Bytes> file_units(uint8_t vcid, uint32_t counter, const synth::Bytes &file, uint16_t apid = 20) {
    synth::ChannelStream cs(vcid, counter);
    uint16_t seq = 0;
    cs.add_all(synth::packetize(apid, file, seq));
    return cs.units();
}

synth::Bytes some_file(size_t n, uint8_t seed) {
    return synth::lrit_file(200, {synth::annotation("f")}, synth::pattern(n, seed));
}

} // namespace

TEST_CASE("In-order units rebuild the file", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto now = std::chrono::steady_clock::now();

    auto file = some_file(5000, 1);
    SECTION("from counter zero") {
        for (auto &u : file_units(3, 0, file))
            demux.process(parsed(u), now, closed);
    }
    SECTION("across the counter wrap") {
        for (auto &u : file_units(3, kVcduCounterModulo - 2, file))
            demux.process(parsed(u), now, closed);
    }

    REQUIRE(closed.size() == 1);
    CHECK(closed[0].state == FileState::Complete);
    CHECK(closed[0].bytes == file);
    CHECK(closed[0].gaps == 0);
    auto snap = stats.snapshot();
    CHECK(snap.get(3, ChannelCounter::MissingUnits) == 0);
    CHECK(snap.get(3, ChannelCounter::Resets) == 0);
    REQUIRE(demux.channel(3) != nullptr);
    CHECK(demux.channel(3)->gaps == 0);
    CHECK(demux.channel(4) == nullptr);
}

TEST_CASE("Duplicate units are discarded", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto now = std::chrono::steady_clock::now();

    auto file = some_file(3000, 2);
    auto units = file_units(3, 100, file);
    for (size_t i = 0; i < units.size(); i++) {
        demux.process(parsed(units[i]), now, closed);
        if (i == 1)
            demux.process(parsed(units[i]), now, closed);
    }
    REQUIRE(closed.size() == 1);
    CHECK(closed[0].bytes == file);
    CHECK(stats.snapshot().get(3, ChannelCounter::Duplicates) == 1);
}

TEST_CASE("Missing units are a gap on the channel and the file", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto now = std::chrono::steady_clock::now();

    auto file = some_file(6000, 3);
    auto units = file_units(3, 0, file);
    REQUIRE(units.size() > 4);
    units.erase(units.begin() + 2, units.begin() + 4);
    for (auto &u : units)
        demux.process(parsed(u), now, closed);

    REQUIRE(closed.size() == 1);
    CHECK(closed[0].state == FileState::Incomplete);
    CHECK(closed[0].missing_units == 2);
    CHECK(closed[0].gaps >= 1);
    CHECK(demux.channel(3)->gaps == 1);
    CHECK(stats.snapshot().get(3, ChannelCounter::MissingUnits) == 2);
}

TEST_CASE("A counter stepping back resets the channel", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto now = std::chrono::steady_clock::now();

    auto first = file_units(3, 5000, some_file(6000, 4));
    demux.process(parsed(first[0]), now, closed);
    demux.process(parsed(first[1]), now, closed);
    CHECK(closed.empty());

    auto second_file = some_file(1000, 5);
    for (auto &u : file_units(3, 10, second_file))
        demux.process(parsed(u), now, closed);

    REQUIRE(closed.size() == 2);
    CHECK(closed[0].state == FileState::Incomplete);
    CHECK(closed[0].reason == "channel counter reset");
    CHECK(closed[1].state == FileState::Complete);
    CHECK(closed[1].bytes == second_file);
    CHECK(stats.snapshot().get(3, ChannelCounter::Resets) == 1);
    CHECK(demux.channel(3)->resets == 1);
}

TEST_CASE("Flush, sweep and reset of all channels", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto t0 = std::chrono::steady_clock::now();

    auto a = file_units(1, 0, some_file(4000, 6));
    auto b = file_units(2, 0, some_file(4000, 7));
    demux.process(parsed(a[0]), t0, closed);
    demux.process(parsed(a[1]), t0, closed);
    demux.process(parsed(b[0]), t0 + std::chrono::seconds(30), closed);
    demux.process(parsed(b[1]), t0 + std::chrono::seconds(30), closed);
    REQUIRE(demux.channel_count() == 2);
    REQUIRE(closed.empty());

    SECTION("sweep only flushes stalled files") {
        demux.sweep(t0 + std::chrono::seconds(40), std::chrono::seconds(20), closed);
        REQUIRE(closed.size() == 1);
        CHECK(closed[0].vcid == 1);
        CHECK(closed[0].reason == "stalled");
    }

    SECTION("flush_all closes everything and keeps channels") {
        demux.flush_all(closed, "shutdown");
        CHECK(closed.size() == 2);
        CHECK(demux.channel_count() == 2);
    }

    SECTION("reset_all forgets channels") {
        demux.reset_all(closed);
        CHECK(closed.size() == 2);
        CHECK(demux.channel_count() == 0);
        // counters restart without being taken as a reset
        demux.process(parsed(a[0]), t0, closed);
        CHECK(stats.snapshot().get(1, ChannelCounter::Resets) == 0);
    }
}

TEST_CASE("The unit that closes a file counts toward it", "[demux]") {
    MissionProfile profile;
    Stats stats;
    Demultiplexer demux(profile, stats);
    std::vector<FileContext> closed;
    auto now = std::chrono::steady_clock::now();

    uint16_t seq = 0;
    auto first = synth::packetize(20, some_file(3000, 7), seq, 1000, 1);
    auto second = synth::packetize(20, some_file(2000, 8), seq, 1000, 2);
    synth::ChannelStream cs(3);
    cs.add_all(first);
    cs.add_all(second);
    auto units = cs.units();

    const size_t zone = kVcduFrameLen - kVcduHeaderLen - kMpduHeaderLen;
    size_t first_len = synth::concat(first).size();
    size_t second_len = synth::concat(second).size();
    // the first file ends inside a unit
    REQUIRE(first_len % zone != 0);
    // a file is open from the unit completing its first packet
    size_t first_open = (first.front().size() - 1) / zone;
    size_t first_last = (first_len - 1) / zone;
    size_t second_open = (first_len + second.front().size() - 1) / zone;
    size_t second_last = (first_len + second_len - 1) / zone;

    for (auto &u : units)
        demux.process(parsed(u), now, closed);

    REQUIRE(closed.size() == 2);
    CHECK(closed[0].state == FileState::Complete);
    CHECK(closed[1].state == FileState::Complete);
    CHECK(closed[0].units == first_last - first_open + 1);
    CHECK(closed[1].units == second_last - second_open + 1);
}
