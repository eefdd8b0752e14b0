#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "file_assembler.hpp"
#include "packet_assembler.hpp"
#include "protocol.hpp"
#include "stats.hpp"

namespace goesrx {

struct ChannelState {
    ChannelState(uint8_t vcid, size_t max_packet_len, Stats& stats)
        : packets(vcid, max_packet_len, stats), files(vcid, stats) {}

    bool seen{false};
    uint32_t last_counter{0};
    uint32_t gaps{0};
    uint32_t resets{0};
    PacketAssembler packets;
    FileAssembler files;
};

// Routes transport units to per-channel reassembly state, in arrival order.
class Demultiplexer {
public:
    Demultiplexer(const MissionProfile& profile, Stats& stats)
        : profile_(profile), stats_(stats) {}

    void process(const TransportUnit& unit, SteadyTime now, std::vector<FileContext>& closed);

    void sweep(SteadyTime now, std::chrono::steady_clock::duration window,
               std::vector<FileContext>& closed);
    void flush_all(std::vector<FileContext>& closed, const std::string& reason);
    // Flushes everything and forgets all channels (reconnect).
    void reset_all(std::vector<FileContext>& closed);

    const ChannelState* channel(uint8_t vcid) const;
    size_t channel_count() const { return channels_.size(); }

private:
    ChannelState& channel_for(uint8_t vcid);

    MissionProfile profile_;
    Stats& stats_;
    std::map<uint8_t, std::unique_ptr<ChannelState>> channels_;
};

} // namespace goesrx
