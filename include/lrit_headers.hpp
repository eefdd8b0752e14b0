#pragma once
#include <cstdint>
#include <cstddef>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace goesrx {

enum FileTypeCode : uint8_t {
    FT_IMAGE = 0,
    FT_SERVICE_MESSAGE = 1,
    FT_TEXT = 2,
    FT_KEY_MESSAGE = 3,
    FT_DCS = 130
};

enum HeaderType : uint8_t {
    HT_PRIMARY = 0,
    HT_IMAGE_STRUCTURE = 1,
    HT_IMAGE_NAVIGATION = 2,
    HT_IMAGE_DATA_FUNCTION = 3,
    HT_ANNOTATION = 4,
    HT_TIME_STAMP = 5,
    HT_ANCILLARY_TEXT = 6,
    HT_KEY = 7,
    HT_SEGMENT_IDENTIFICATION = 128,
    HT_NOAA = 129,
    HT_HEADER_STRUCTURE = 130,
    HT_RICE_COMPRESSION = 131
};

enum NoaaCompression : uint8_t {
    NC_NONE = 0,
    NC_RICE = 1,
    NC_JPEG = 2,
    NC_GIF = 5,
    NC_ZIP = 10
};

constexpr size_t kPrimaryHeaderLen = 16;

struct PrimaryHeader {
    uint8_t file_type{0};
    uint32_t total_header_len{0};
    uint64_t data_len_bits{0};

    uint64_t data_len() const { return (data_len_bits + 7) / 8; }
    uint64_t total_len() const { return total_header_len + data_len(); }
};

struct ImageStructure {
    uint8_t bits_per_pixel{0};
    uint16_t columns{0};
    uint16_t lines{0};
    uint8_t compression{0};
};

struct ImageNavigation {
    std::string projection;
    int32_t column_scaling{0};
    int32_t line_scaling{0};
    int32_t column_offset{0};
    int32_t line_offset{0};
};

// CCSDS day-segmented time: days since 1958-01-01 and milliseconds of day.
struct TimeStamp {
    uint16_t days{0};
    uint32_t millis{0};

    std::time_t unix_seconds() const;
};

struct SegmentIdentification {
    uint16_t image_id{0};
    uint16_t segment_seq{0};
    uint16_t start_column{0};
    uint16_t start_line{0};
    uint16_t max_segment{0};
    uint16_t max_column{0};
    uint16_t max_row{0};
};

struct NoaaHeader {
    std::string agency;
    uint16_t product_id{0};
    uint16_t product_subid{0};
    uint16_t parameter{0};
    uint8_t compression{NC_NONE};
};

struct RiceCompression {
    uint16_t flags{0};
    uint8_t pixels_per_block{0};
    uint8_t scanlines_per_packet{0};
};

struct FileHeaders {
    PrimaryHeader primary;
    std::optional<ImageStructure> image_structure;
    std::optional<ImageNavigation> image_navigation;
    std::optional<std::vector<uint8_t>> image_data_function;
    std::optional<std::string> annotation;
    std::optional<TimeStamp> time_stamp;
    std::optional<std::string> ancillary_text;
    std::optional<SegmentIdentification> segment;
    std::optional<NoaaHeader> noaa;
    std::optional<std::string> header_structure;
    std::optional<RiceCompression> rice;
    std::vector<uint8_t> skipped_types;

    // "key=value;key=value" pairs of the ancillary text record
    std::map<std::string, std::string> ancillary_pairs() const;
    bool segmented() const;
};

bool parse_primary_header(const uint8_t* data, size_t len, PrimaryHeader& out);

// Parses the primary header and every secondary header inside the total
// header length. Unknown secondary headers are skipped by their own length.
bool parse_file_headers(const uint8_t* data, size_t len, FileHeaders& out, std::string& err);

std::string describe_headers(const FileHeaders& h);

constexpr size_t kDcsHeaderLen = 64;

// 64-byte header at the start of a DCS file's data field.
struct DcsHeader {
    std::string name;
    uint64_t payload_len{0};
    std::string source;
    std::string type; // "DCSH"
    uint32_t header_crc{0};
    bool header_crc_ok{false};
};

bool parse_dcs_header(const uint8_t* data, size_t len, DcsHeader& out, std::string& err);

} // namespace goesrx
