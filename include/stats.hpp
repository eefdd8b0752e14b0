#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace goesrx {

enum class Counter : uint8_t {
    Frames = 0,
    FramingErrors,
    FillUnits,
    PartialTailBytes,
    Reconnects,
    DecodeFailures,
    ArtifactsQueued,
    ArtifactsWritten,
    ArtifactsDropped,
    WriteFailures,
    Count_
};

enum class ChannelCounter : uint8_t {
    Units = 0,
    Bytes,
    Duplicates,
    MissingUnits,
    Resets,
    Packets,
    PacketOverflows,
    Resyncs,
    CrcFailures,
    OrphanPackets,
    ExcessBytes,
    FilesOk,
    FilesCorrupt,
    FilesTruncated,
    Count_
};

const char* counter_name(Counter c);
const char* counter_name(ChannelCounter c);

struct ChannelCounters {
    std::array<uint64_t, (size_t)ChannelCounter::Count_> values{};
    uint64_t get(ChannelCounter c) const { return values[(size_t)c]; }
};

struct StatsSnapshot {
    std::array<uint64_t, (size_t)Counter::Count_> values{};
    std::map<uint8_t, ChannelCounters> channels;

    uint64_t get(Counter c) const { return values[(size_t)c]; }
    uint64_t get(uint8_t vcid, ChannelCounter c) const;
};

// Read-only diagnostics shared by the intake thread and the persistence worker.
class Stats {
public:
    void add(Counter c, uint64_t n = 1);
    void add(uint8_t vcid, ChannelCounter c, uint64_t n = 1);
    StatsSnapshot snapshot() const;
    std::string summary() const;
private:
    mutable std::mutex mtx_;
    StatsSnapshot data_;
};

} // namespace goesrx
