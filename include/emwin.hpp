#pragma once
#include <cstdint>
#include <cstddef>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace goesrx {

// A_TTAAiiCCCCYYGGgg_C_KWIN_yyyymmddhhmmss_seqnum-priority-legacyname
struct EmwinName {
    char pflag{'A'};
    std::string ttaaii;     // WMO abbreviated heading, e.g. "ASUS41"
    std::string cccc;       // originating centre, e.g. "KPHI"
    std::string heading_time; // YYGGgg of the heading
    std::time_t issued{0};
    uint32_t sequence{0};
    uint8_t priority{0};
    std::string legacy;     // old-style AWIPS product name
    std::string extension;  // lower case, without the dot

    std::string data_type() const { return ttaaii.substr(0, 2); }
    std::string area() const { return ttaaii.substr(2, 2); }
};

std::optional<EmwinName> parse_emwin_name(const std::string& filename);

struct ZipEntry {
    std::string name;
    uint16_t method{0};
    uint32_t crc32{0};
    uint64_t compressed_size{0};
    uint64_t uncompressed_size{0};
    std::vector<uint8_t> data; // member bytes as stored
};

enum ZipMethod : uint16_t {
    ZM_STORED = 0,
    ZM_DEFLATED = 8
};

// Lists the members of a ZIP container held in memory, with their stored
// (still compressed) bytes.
bool read_zip_entries(const uint8_t* data, size_t len, std::vector<ZipEntry>& out, std::string& err);

} // namespace goesrx
