/**
 * @file synth.hpp
 * @brief Synthetic downlink builder: LRIT files, CP_PDU packets and VCDUs
 */

#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "lrit_headers.hpp"
#include "protocol.hpp"

namespace synth {

using Bytes = std::vector<uint8_t>;

// 2022-05-04 as CCSDS days since 1958-01-01
constexpr uint16_t kDay20220504 = 23499;

inline void put_be16(Bytes &b, uint16_t v) {
    b.push_back((uint8_t)(v >> 8));
    b.push_back((uint8_t)v);
}
inline void put_be32(Bytes &b, uint32_t v) {
    put_be16(b, (uint16_t)(v >> 16));
    put_be16(b, (uint16_t)v);
}
inline void put_be64(Bytes &b, uint64_t v) {
    put_be32(b, (uint32_t)(v >> 32));
    put_be32(b, (uint32_t)v);
}
inline void put_le16(Bytes &b, uint16_t v) {
    b.push_back((uint8_t)v);
    b.push_back((uint8_t)(v >> 8));
}
inline void put_le32(Bytes &b, uint32_t v) {
    put_le16(b, (uint16_t)v);
    put_le16(b, (uint16_t)(v >> 16));
}
inline void append(Bytes &b, const Bytes &more) { b.insert(b.end(), more.begin(), more.end()); }
inline void append(Bytes &b, const std::string &s) { b.insert(b.end(), s.begin(), s.end()); }

inline Bytes pattern(size_t n, uint8_t seed) {
    Bytes b(n);
    for (size_t i = 0; i < n; i++)
        b[i] = (uint8_t)(seed + i * 7 + (i >> 8));
    return b;
}

inline Bytes record(uint8_t type, const Bytes &body) {
    Bytes r{type};
    put_be16(r, (uint16_t)(body.size() + 3));
    append(r, body);
    return r;
}

inline Bytes annotation(const std::string &text) {
    return record(goesrx::HT_ANNOTATION, Bytes(text.begin(), text.end()));
}

inline Bytes ancillary(const std::string &text) {
    return record(goesrx::HT_ANCILLARY_TEXT, Bytes(text.begin(), text.end()));
}

inline Bytes time_stamp(uint16_t days, uint32_t millis) {
    Bytes b{0x40};
    put_be16(b, days);
    put_be32(b, millis);
    return record(goesrx::HT_TIME_STAMP, b);
}

inline Bytes image_structure(uint8_t bpp, uint16_t columns, uint16_t lines, uint8_t compression = 0) {
    Bytes b{bpp};
    put_be16(b, columns);
    put_be16(b, lines);
    b.push_back(compression);
    return record(goesrx::HT_IMAGE_STRUCTURE, b);
}

inline Bytes noaa(uint16_t product, uint16_t subid, uint8_t compression) {
    Bytes b;
    append(b, std::string("NOAA"));
    put_be16(b, product);
    put_be16(b, subid);
    put_be16(b, 0);
    b.push_back(compression);
    return record(goesrx::HT_NOAA, b);
}

inline Bytes segment_id(uint16_t image_id, uint16_t seq, uint16_t max_segment) {
    Bytes b;
    put_be16(b, image_id);
    put_be16(b, seq);
    put_be16(b, 0);
    put_be16(b, 0);
    put_be16(b, max_segment);
    put_be16(b, 0);
    put_be16(b, 0);
    return record(goesrx::HT_SEGMENT_IDENTIFICATION, b);
}

inline Bytes lrit_file(uint8_t file_type, const std::vector<Bytes> &secondary, const Bytes &data) {
    uint32_t hdr = (uint32_t)goesrx::kPrimaryHeaderLen;
    for (const auto &s : secondary)
        hdr += (uint32_t)s.size();
    Bytes f{goesrx::HT_PRIMARY};
    put_be16(f, (uint16_t)goesrx::kPrimaryHeaderLen);
    f.push_back(file_type);
    put_be32(f, hdr);
    put_be64(f, (uint64_t)data.size() * 8);
    for (const auto &s : secondary)
        append(f, s);
    append(f, data);
    return f;
}

inline Bytes packet(uint16_t apid, goesrx::SequenceFlag flag, uint16_t seq, const Bytes &user) {
    Bytes p;
    p.push_back((uint8_t)((apid >> 8) & 0x7));
    p.push_back((uint8_t)apid);
    put_be16(p, (uint16_t)(((uint16_t)flag << 14) | (seq & 0x3fff)));
    put_be16(p, (uint16_t)(user.size() + goesrx::kPacketCrcLen - 1));
    append(p, user);
    put_be16(p, goesrx::crc16_ccitt(user.data(), user.size()));
    return p;
}

// Splits an LRIT file into packets of at most `chunk` user bytes. The
// first one carries the transport file header. `seq` is advanced.
inline std::vector<Bytes> packetize(uint16_t apid, const Bytes &file, uint16_t &seq,
                                    size_t chunk = 1000, uint16_t file_counter = 1) {
    Bytes body;
    put_be16(body, file_counter);
    put_be64(body, (uint64_t)file.size() * 8);
    append(body, file);

    std::vector<Bytes> out;
    size_t count = (body.size() + chunk - 1) / chunk;
    for (size_t i = 0; i < count; i++) {
        size_t begin = i * chunk;
        size_t end = std::min(body.size(), begin + chunk);
        goesrx::SequenceFlag flag = goesrx::SequenceFlag::Continuation;
        if (count == 1)
            flag = goesrx::SequenceFlag::Standalone;
        else if (i == 0)
            flag = goesrx::SequenceFlag::First;
        else if (i + 1 == count)
            flag = goesrx::SequenceFlag::Last;
        out.push_back(packet(apid, flag, seq, Bytes(body.begin() + begin, body.begin() + end)));
        seq = (uint16_t)((seq + 1) % goesrx::kPacketSeqModulo);
    }
    return out;
}

inline Bytes unit(uint8_t vcid, uint32_t counter, uint16_t fhp, const Bytes &zone,
                  uint8_t signal = 0, uint8_t scid = 0x13) {
    Bytes u;
    u.push_back((uint8_t)((1 << 6) | (scid >> 2)));
    u.push_back((uint8_t)(((scid & 0x3) << 6) | (vcid & 0x3f)));
    u.push_back((uint8_t)(counter >> 16));
    u.push_back((uint8_t)(counter >> 8));
    u.push_back((uint8_t)counter);
    u.push_back(signal);
    put_be16(u, fhp);
    append(u, zone);
    return u;
}

inline Bytes fill_unit(size_t frame_len = goesrx::kVcduFrameLen) {
    return unit(goesrx::kFillVcid, 0, goesrx::kNoPacketHeader,
                Bytes(frame_len - goesrx::kVcduHeaderLen - goesrx::kMpduHeaderLen, 0x55));
}

inline Bytes concat(const std::vector<Bytes> &parts) {
    Bytes all;
    for (const auto &p : parts)
        append(all, p);
    return all;
}

// Lays the packets of one virtual channel into consecutive units.
class ChannelStream {
public:
    explicit ChannelStream(uint8_t vcid, uint32_t counter = 0,
                           size_t frame_len = goesrx::kVcduFrameLen)
        : vcid_(vcid), counter_(counter), frame_len_(frame_len) {}

    void add(const Bytes &pkt) {
        starts_.push_back(stream_.size());
        append(stream_, pkt);
    }
    void add_all(const std::vector<Bytes> &pkts) {
        for (const auto &p : pkts)
            add(p);
    }

    // Pads the last unit with a fill packet and cuts the stream into units.
    std::vector<Bytes> units(uint8_t signal = 0) {
        const size_t zone = frame_len_ - goesrx::kVcduHeaderLen - goesrx::kMpduHeaderLen;
        size_t room = (zone - stream_.size() % zone) % zone;
        if (room > 0 && room < goesrx::kPacketHeaderLen + goesrx::kPacketCrcLen)
            room += zone;
        if (room > 0) {
            Bytes fill{(uint8_t)(goesrx::kFillApid >> 8), (uint8_t)goesrx::kFillApid};
            put_be16(fill, 0xC000);
            put_be16(fill, (uint16_t)(room - goesrx::kPacketHeaderLen - 1));
            fill.resize(room, 0);
            add(fill);
        }

        std::vector<Bytes> out;
        size_t next_start = 0;
        for (size_t off = 0; off < stream_.size(); off += zone) {
            while (next_start < starts_.size() && starts_[next_start] < off)
                next_start++;
            uint16_t fhp = goesrx::kNoPacketHeader;
            if (next_start < starts_.size() && starts_[next_start] < off + zone)
                fhp = (uint16_t)(starts_[next_start] - off);
            Bytes z(stream_.begin() + off, stream_.begin() + off + zone);
            out.push_back(unit(vcid_, counter_, fhp, z, signal));
            counter_ = (counter_ + 1) % goesrx::kVcduCounterModulo;
        }
        stream_.clear();
        starts_.clear();
        return out;
    }

private:
    uint8_t vcid_;
    uint32_t counter_;
    size_t frame_len_;
    Bytes stream_;
    std::vector<size_t> starts_;
};

} // namespace synth
