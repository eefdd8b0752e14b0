#pragma once
#include <cstdint>
#include <vector>
#include "protocol.hpp"
#include "stats.hpp"

namespace goesrx {

struct AppPacket {
    uint8_t vcid{0};
    uint16_t apid{0};
    SequenceFlag flag{SequenceFlag::Continuation};
    uint16_t seq{0};
    std::vector<uint8_t> data; // user data, CRC stripped
    bool crc_ok{false};
};

// Rebuilds CP_PDUs from the M_PDU payload regions of one virtual channel.
class PacketAssembler {
public:
    PacketAssembler(uint8_t vcid, size_t max_packet_len, Stats& stats);

    // `region` is a whole VCDU payload (M_PDU header + packet zone).
    void feed(const uint8_t* region, size_t len, std::vector<AppPacket>& out);

    // Drops the packet in progress; the next header is taken from a first-header pointer.
    void resync();

    bool in_progress() const { return active_; }

private:
    size_t consume(const uint8_t* p, size_t n, std::vector<AppPacket>& out);
    void complete(std::vector<AppPacket>& out);

    uint8_t vcid_;
    size_t max_packet_len_;
    Stats& stats_;

    bool active_{false};
    bool overflow_{false};
    std::vector<uint8_t> header_;
    std::vector<uint8_t> body_;
    size_t body_len_{0};
};

} // namespace goesrx
