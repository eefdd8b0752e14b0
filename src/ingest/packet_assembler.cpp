#include "packet_assembler.hpp"
#include "logging.hpp"
#include <algorithm>

namespace goesrx {

PacketAssembler::PacketAssembler(uint8_t vcid, size_t max_packet_len,
                                 Stats &stats)
    : vcid_(vcid), max_packet_len_(max_packet_len), stats_(stats) {
  header_.reserve(kPacketHeaderLen);
}

void PacketAssembler::resync() {
  active_ = false;
  overflow_ = false;
  header_.clear();
  body_.clear();
  body_len_ = 0;
}

void PacketAssembler::feed(const uint8_t *region, size_t len,
                           std::vector<AppPacket> &out) {
  if (len <= kMpduHeaderLen) {
    resync();
    return;
  }
  uint16_t fhp = (uint16_t)(((region[0] & 0x7) << 8) | region[1]);
  const uint8_t *zone = region + kMpduHeaderLen;
  size_t zone_len = len - kMpduHeaderLen;

  if (fhp != kNoPacketHeader && fhp >= zone_len) {
    Logger::instance().log(LogLevel::WARN,
                           "vc %u: %s: first header pointer %u outside zone",
                           (unsigned)vcid_,
                           error_name(ErrorKind::FramingError), (unsigned)fhp);
    stats_.add(vcid_, ChannelCounter::Resyncs);
    resync();
    return;
  }

  size_t off = 0;
  if (active_) {
    size_t limit = fhp == kNoPacketHeader ? zone_len : fhp;
    off = consume(zone, limit, out);
    overflow_ = false;
    if (fhp == kNoPacketHeader)
      return;
    if (active_ || off != fhp) {
      // the packet in progress does not end where the next header starts
      Logger::instance().log(LogLevel::DEBUG,
                             "vc %u: packet boundary mismatch (at %zu, fhp %u)",
                             (unsigned)vcid_, off, (unsigned)fhp);
      stats_.add(vcid_, ChannelCounter::Resyncs);
      resync();
    }
  } else if (fhp == kNoPacketHeader) {
    return;
  }

  off = fhp;
  while (off < zone_len) {
    off += consume(zone + off, zone_len - off, out);
    if (overflow_) {
      overflow_ = false;
      break;
    }
  }
}

size_t PacketAssembler::consume(const uint8_t *p, size_t n,
                                std::vector<AppPacket> &out) {
  if (!active_) {
    active_ = true;
    header_.clear();
    body_.clear();
    body_len_ = 0;
  }
  size_t used = 0;
  if (header_.size() < kPacketHeaderLen) {
    size_t take = std::min(kPacketHeaderLen - header_.size(), n);
    header_.insert(header_.end(), p, p + take);
    used += take;
    if (header_.size() < kPacketHeaderLen)
      return used;

    body_len_ = (size_t)read_be16(header_.data() + 4) + 1;
    if (body_len_ > max_packet_len_ || body_len_ < kPacketCrcLen) {
      Logger::instance().log(LogLevel::WARN,
                             "vc %u: %s: declared packet length %zu",
                             (unsigned)vcid_,
                             error_name(ErrorKind::PacketOverflow), body_len_);
      stats_.add(vcid_, ChannelCounter::PacketOverflows);
      resync();
      overflow_ = true;
      return n;
    }
    body_.reserve(body_len_);
  }

  size_t take = std::min(body_len_ - body_.size(), n - used);
  body_.insert(body_.end(), p + used, p + used + take);
  used += take;
  if (body_.size() == body_len_)
    complete(out);
  return used;
}

void PacketAssembler::complete(std::vector<AppPacket> &out) {
  active_ = false;
  AppPacket pkt;
  pkt.vcid = vcid_;
  pkt.apid = (uint16_t)(((header_[0] & 0x7) << 8) | header_[1]);
  pkt.flag = (SequenceFlag)((header_[2] >> 6) & 0x3);
  pkt.seq = (uint16_t)(((header_[2] & 0x3f) << 8) | header_[3]);
  if (pkt.apid == kFillApid)
    return;

  size_t data_len = body_len_ - kPacketCrcLen;
  uint16_t computed = crc16_ccitt(body_.data(), data_len);
  uint16_t received = read_be16(body_.data() + data_len);
  pkt.crc_ok = computed == received;
  stats_.add(vcid_, ChannelCounter::Packets);
  if (!pkt.crc_ok) {
    Logger::instance().log(LogLevel::WARN,
                           "vc %u apid %u: %s: packet crc %04x != %04x",
                           (unsigned)vcid_, (unsigned)pkt.apid,
                           error_name(ErrorKind::IntegrityMismatch),
                           (unsigned)computed, (unsigned)received);
    stats_.add(vcid_, ChannelCounter::CrcFailures);
  }
  pkt.data.assign(body_.begin(), body_.begin() + data_len);
  out.push_back(std::move(pkt));
}

} // namespace goesrx
