#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "lrit_headers.hpp"

namespace goesrx {

enum class FileStatus : uint8_t { Ok, Corrupt, Truncated };

const char* status_name(FileStatus s);

// A reassembled file handed from the integrity checker to the dispatcher.
struct CompletedFile {
    uint8_t vcid{0};
    uint16_t apid{0};
    uint16_t file_counter{0};
    FileHeaders headers;
    bool headers_valid{false};
    std::vector<uint8_t> bytes; // primary header onwards
    uint64_t declared_len{0};
    uint64_t received_len{0};
    FileStatus status{FileStatus::Ok};
    uint32_t gaps{0};
    uint32_t crc_failures{0};
    uint32_t units{0};
    uint32_t flagged_units{0}; // units carrying the replay flag
    uint32_t checksum{0};      // CRC-32 of `bytes`
    std::chrono::system_clock::time_point received_at;
    std::string note;

    size_t data_offset() const {
        if (!headers_valid || headers.primary.total_header_len > bytes.size())
            return 0;
        return headers.primary.total_header_len;
    }
    const uint8_t* data() const { return bytes.data() + data_offset(); }
    size_t data_len() const { return bytes.size() - data_offset(); }
};

} // namespace goesrx
