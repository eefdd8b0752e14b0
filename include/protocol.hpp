#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace goesrx {

// VCDU (transport unit)
constexpr size_t   kVcduHeaderLen = 6;
constexpr size_t   kVcduFrameLen = 892;
constexpr uint8_t  kFillVcid = 63;
constexpr uint32_t kVcduCounterModulo = 1u << 24;
constexpr uint8_t  kReplayFlag = 0x80;

// M_PDU carried in the VCDU payload region
constexpr size_t   kMpduHeaderLen = 2;
constexpr uint16_t kNoPacketHeader = 2047;

// CP_PDU (application packet)
constexpr size_t   kPacketHeaderLen = 6;
constexpr size_t   kPacketCrcLen = 2;
constexpr uint16_t kFillApid = 2047;
constexpr uint16_t kPacketSeqModulo = 1u << 14;
constexpr size_t   kMaxPacketLen = 8192;

// file counter + file length in bits, ahead of the LRIT primary header
constexpr size_t   kTpFileHeaderLen = 10;

enum class SequenceFlag : uint8_t {
    Continuation = 0,
    First = 1,
    Last = 2,
    Standalone = 3
};

enum class ErrorKind : uint8_t {
    FramingError,
    SequenceGap,
    PacketOverflow,
    FileTruncated,
    IntegrityMismatch,
    DecodeFailure,
    WriteFailure
};

const char* error_name(ErrorKind k);

struct MissionProfile {
    std::string name{"goes-r-hrit"};
    size_t frame_len{kVcduFrameLen};
    uint8_t version{1};
    std::vector<uint8_t> spacecraft_ids; // empty accepts any
    size_t max_packet_len{kMaxPacketLen};

    bool accepts(uint8_t scid) const;
    size_t payload_len() const { return frame_len - kVcduHeaderLen; }
};

bool profile_by_name(const std::string& name, MissionProfile& out);

struct TransportUnit {
    uint8_t version{0};
    uint8_t scid{0};
    uint8_t vcid{0};
    uint32_t counter{0};
    uint8_t signal{0};
    std::vector<uint8_t> payload;

    bool replayed() const { return (signal & kReplayFlag) != 0; }
    bool is_fill() const { return vcid == kFillVcid; }
};

// Returns false when the header is implausible for the profile.
bool parse_unit(const uint8_t* data, size_t len, const MissionProfile& profile, TransportUnit& out);

// Forward distance from `last` to `cur` on a counter of width `modulo`.
uint32_t counter_delta(uint32_t last, uint32_t cur, uint32_t modulo);

uint16_t crc16_ccitt(const uint8_t* data, size_t len);
uint32_t crc32(const uint8_t* data, size_t len);
uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len);

inline uint16_t read_be16(const uint8_t* p) { return (uint16_t)((p[0] << 8) | p[1]); }
inline uint32_t read_be32(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | p[3];
}
inline uint64_t read_be64(const uint8_t* p) {
    return ((uint64_t)read_be32(p) << 32) | read_be32(p + 4);
}
inline uint32_t read_le32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

} // namespace goesrx
