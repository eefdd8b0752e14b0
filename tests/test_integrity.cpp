/**
 * @file test_integrity.cpp
 * @brief Unit tests for completed-file status decisions
 */

#include <catch2/catch_test_macros.hpp>

#include "integrity.hpp"
#include "synth.hpp"

#include <cstdio>

using namespace goesrx;

namespace {

FileContext context_for(const synth::Bytes &file, FileState state) {
    FileContext ctx;
    ctx.vcid = 30;
    ctx.apid = 5;
    ctx.bytes = file;
    ctx.declared_len = file.size();
    ctx.checksum = crc32(file.data(), file.size());
    ctx.state = state;
    std::string err;
    ctx.headers_parsed = true;
    ctx.headers_valid = parse_file_headers(file.data(), file.size(), ctx.headers, err);
    return ctx;
}

synth::Bytes dcs_payload(size_t body_len) {
    std::string name = "pH-22124180520-A.dcs";
    name.resize(32, ' ');
    synth::Bytes d;
    synth::append(d, name);
    char len[9];
    std::snprintf(len, sizeof(len), "%08zu", body_len + kDcsHeaderLen + 4);
    synth::append(d, std::string(len));
    synth::append(d, std::string("02  DCSH"));
    d.resize(60, 0);
    synth::put_le32(d, crc32(d.data(), 60));
    synth::append(d, synth::pattern(body_len, 3));
    synth::put_le32(d, crc32(d.data(), d.size()));
    return d;
}

} // namespace

TEST_CASE("Status precedence", "[integrity]") {
    Stats stats;
    IntegrityChecker checker(stats);
    auto file = synth::lrit_file(FT_TEXT, {}, synth::pattern(100, 1));

    SECTION("complete and clean is ok") {
        auto f = checker.check(context_for(file, FileState::Complete));
        CHECK(f.status == FileStatus::Ok);
        CHECK(f.bytes == file);
        CHECK(f.checksum == crc32(file.data(), file.size()));
        CHECK(stats.snapshot().get(30, ChannelCounter::FilesOk) == 1);
    }

    SECTION("packet crc failures make it corrupt") {
        auto ctx = context_for(file, FileState::Complete);
        ctx.crc_failures = 2;
        auto f = checker.check(std::move(ctx));
        CHECK(f.status == FileStatus::Corrupt);
        CHECK(stats.snapshot().get(30, ChannelCounter::FilesCorrupt) == 1);
    }

    SECTION("an incomplete context is truncated even when also damaged") {
        auto ctx = context_for(file, FileState::Incomplete);
        ctx.bytes.resize(50);
        ctx.crc_failures = 1;
        ctx.reason = "stalled";
        auto f = checker.check(std::move(ctx));
        CHECK(f.status == FileStatus::Truncated);
        CHECK(f.received_len == 50);
        CHECK(f.declared_len == file.size());
        CHECK(f.note == "stalled");
        CHECK(stats.snapshot().get(30, ChannelCounter::FilesTruncated) == 1);
    }

    SECTION("data accessors skip the headers") {
        auto f = checker.check(context_for(file, FileState::Complete));
        CHECK(f.data_offset() == kPrimaryHeaderLen);
        CHECK(f.data_len() == 100);
        CHECK(f.data()[0] == synth::pattern(100, 1)[0]);
    }
}

TEST_CASE("DCS trailing CRC", "[integrity][dcs]") {
    Stats stats;
    IntegrityChecker checker(stats);
    auto payload = dcs_payload(200);

    SECTION("matching CRC is ok") {
        auto file = synth::lrit_file(FT_DCS, {}, payload);
        auto f = checker.check(context_for(file, FileState::Complete));
        CHECK(f.status == FileStatus::Ok);
    }

    SECTION("a flipped bit is corrupt") {
        payload[kDcsHeaderLen + 20] ^= 0x01;
        auto file = synth::lrit_file(FT_DCS, {}, payload);
        auto f = checker.check(context_for(file, FileState::Complete));
        CHECK(f.status == FileStatus::Corrupt);
        CHECK(f.note.find("DCS file crc") != std::string::npos);
    }

    SECTION("a payload without a DCSH header is corrupt") {
        auto file = synth::lrit_file(FT_DCS, {}, synth::pattern(100, 9));
        auto f = checker.check(context_for(file, FileState::Complete));
        CHECK(f.status == FileStatus::Corrupt);
    }
}
