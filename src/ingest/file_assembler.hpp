#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "lrit_headers.hpp"
#include "packet_assembler.hpp"
#include "stats.hpp"

namespace goesrx {

using SteadyTime = std::chrono::steady_clock::time_point;

enum class FileState : uint8_t { Idle, HeaderSeen, Accumulating, Complete, Incomplete };

const char* state_name(FileState s);

struct FileContext {
    uint8_t vcid{0};
    uint16_t apid{0};
    uint16_t file_counter{0};
    uint16_t last_seq{0};
    uint64_t declared_len{0};
    std::vector<uint8_t> bytes;
    uint32_t checksum{0};
    FileState state{FileState::Idle};
    uint32_t gaps{0};
    uint32_t seq_gaps{0}; // packet sequence breaks inside this file
    uint32_t missing_units{0};
    uint32_t crc_failures{0};
    uint32_t units{0};
    uint32_t flagged_units{0};
    SteadyTime last_activity;
    std::chrono::system_clock::time_point opened_at;
    FileHeaders headers;
    bool headers_parsed{false};
    bool headers_valid{false};
    std::string reason;
};

// Accumulates the packets of one virtual channel into at most one open file.
class FileAssembler {
public:
    FileAssembler(uint8_t vcid, Stats& stats) : vcid_(vcid), stats_(stats) {}

    void accept(AppPacket&& pkt, SteadyTime now, std::vector<FileContext>& closed);

    // Unit-level gap on the channel; flags the open file.
    void mark_gap(uint32_t missing);
    // Counts the unit now being fed against the open file and against any
    // file its packets open, until the next call.
    void note_unit(bool replayed);

    // Flushes the open file as incomplete if it has been idle for `window`.
    void expire(SteadyTime now, std::chrono::steady_clock::duration window,
                std::vector<FileContext>& closed);
    void flush(std::vector<FileContext>& closed, const std::string& reason);

    bool idle() const { return open_.state == FileState::Idle; }
    FileState state() const { return open_.state; }
    const FileContext& open_file() const { return open_; }

private:
    void open(AppPacket&& pkt, SteadyTime now, std::vector<FileContext>& closed);
    void append(const uint8_t* p, size_t n);
    void close(FileState final_state, const std::string& reason, std::vector<FileContext>& closed);

    uint8_t vcid_;
    Stats& stats_;
    FileContext open_;
    bool in_unit_{false};
    bool unit_replayed_{false};
};

} // namespace goesrx
