/**
 * @file test_headers.cpp
 * @brief Unit tests for LRIT primary/secondary header parsing
 */

#include <catch2/catch_test_macros.hpp>

#include "lrit_headers.hpp"
#include "protocol.hpp"
#include "synth.hpp"

using namespace goesrx;

TEST_CASE("Primary and secondary headers", "[headers]") {
    auto file = synth::lrit_file(
        FT_IMAGE,
        {synth::image_structure(8, 100, 50), synth::annotation("OR_ABI-L2-CMIPF-M6C13_G16.lrit"),
         synth::time_stamp(synth::kDay20220504, 3600 * 1000 + 500),
         synth::noaa(16, 13, NC_NONE),
         synth::ancillary("Segmented=yes; Time of frame start = 2022-05-04T01:00:00Z"),
         synth::segment_id(42, 3, 10)},
        synth::pattern(5000, 1));

    FileHeaders h;
    std::string err;
    REQUIRE(parse_file_headers(file.data(), file.size(), h, err));

    SECTION("primary header") {
        CHECK(h.primary.file_type == FT_IMAGE);
        CHECK(h.primary.data_len() == 5000);
        CHECK(h.primary.total_len() == file.size());
    }

    SECTION("secondary records") {
        REQUIRE(h.image_structure);
        CHECK(h.image_structure->bits_per_pixel == 8);
        CHECK(h.image_structure->columns == 100);
        CHECK(h.image_structure->lines == 50);
        REQUIRE(h.annotation);
        CHECK(*h.annotation == "OR_ABI-L2-CMIPF-M6C13_G16.lrit");
        REQUIRE(h.noaa);
        CHECK(h.noaa->agency == "NOAA");
        CHECK(h.noaa->product_id == 16);
        CHECK(h.noaa->product_subid == 13);
        REQUIRE(h.segment);
        CHECK(h.segment->image_id == 42);
        CHECK(h.segment->segment_seq == 3);
        CHECK(h.segment->max_segment == 10);
        CHECK(h.segmented());
    }

    SECTION("time stamp converts to unix time") {
        REQUIRE(h.time_stamp);
        // 2022-05-04T01:00:00Z
        CHECK(h.time_stamp->unix_seconds() == 1651626000);
    }

    SECTION("ancillary text pairs are trimmed") {
        auto pairs = h.ancillary_pairs();
        CHECK(pairs["Segmented"] == "yes");
        CHECK(pairs["Time of frame start"] == "2022-05-04T01:00:00Z");
    }

    SECTION("description mentions every record") {
        std::string d = describe_headers(h);
        CHECK(d.find("image_structure") != std::string::npos);
        CHECK(d.find("2022-05-04T01:00:00Z") != std::string::npos);
        CHECK(d.find("product_id=16") != std::string::npos);
    }
}

TEST_CASE("Unknown secondary headers are skipped by length", "[headers]") {
    auto file = synth::lrit_file(FT_TEXT,
                                 {synth::record(200, synth::Bytes(9, 0xEE)), synth::annotation("bulletin")},
                                 synth::pattern(10, 2));
    FileHeaders h;
    std::string err;
    REQUIRE(parse_file_headers(file.data(), file.size(), h, err));
    REQUIRE(h.skipped_types.size() == 1);
    CHECK(h.skipped_types[0] == 200);
    REQUIRE(h.annotation);
    CHECK(*h.annotation == "bulletin");
}

TEST_CASE("Malformed headers are reported", "[headers]") {
    FileHeaders h;
    std::string err;

    SECTION("record length below three") {
        auto rec = synth::annotation("x");
        rec[1] = 0;
        rec[2] = 2;
        auto file = synth::lrit_file(FT_TEXT, {rec}, {});
        REQUIRE_FALSE(parse_file_headers(file.data(), file.size(), h, err));
        CHECK_FALSE(err.empty());
    }

    SECTION("record running past the header area") {
        auto rec = synth::annotation("abc");
        rec[2] = 40;
        auto file = synth::lrit_file(FT_TEXT, {rec}, synth::pattern(100, 3));
        REQUIRE_FALSE(parse_file_headers(file.data(), file.size(), h, err));
    }

    SECTION("header area longer than the buffer") {
        auto file = synth::lrit_file(FT_TEXT, {synth::annotation("abcdef")}, {});
        REQUIRE_FALSE(parse_file_headers(file.data(), file.size() - 2, h, err));
    }

    SECTION("wrong primary record") {
        auto file = synth::lrit_file(FT_TEXT, {}, synth::pattern(4, 4));
        file[2] = 15;
        PrimaryHeader ph;
        REQUIRE_FALSE(parse_primary_header(file.data(), file.size(), ph));
        REQUIRE_FALSE(parse_file_headers(file.data(), file.size(), h, err));
    }

    SECTION("fixed-size record too short") {
        auto rec = synth::record(HT_IMAGE_STRUCTURE, synth::Bytes{8, 0, 1});
        auto file = synth::lrit_file(FT_IMAGE, {rec}, {});
        REQUIRE_FALSE(parse_file_headers(file.data(), file.size(), h, err));
    }
}

TEST_CASE("DCS file header", "[headers][dcs]") {
    std::string name = "pM-22124180520-A.dcs";
    name.resize(32, ' ');
    synth::Bytes d;
    synth::append(d, name);
    synth::append(d, std::string("00000100"));
    synth::append(d, std::string("02  "));
    synth::append(d, std::string("DCSH"));
    d.resize(60, 0);
    synth::put_le32(d, crc32(d.data(), 60));

    DcsHeader dh;
    std::string err;
    REQUIRE(parse_dcs_header(d.data(), d.size(), dh, err));
    CHECK(dh.name == "pM-22124180520-A.dcs");
    CHECK(dh.payload_len == 100);
    CHECK(dh.source == "02");
    CHECK(dh.type == "DCSH");
    CHECK(dh.header_crc_ok);

    d[44] = 'X';
    REQUIRE_FALSE(parse_dcs_header(d.data(), d.size(), dh, err));
    REQUIRE_FALSE(parse_dcs_header(d.data(), 32, dh, err));
}
