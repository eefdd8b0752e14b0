#include "stats.hpp"
#include <sstream>

namespace goesrx {

const char *counter_name(Counter c) {
  switch (c) {
  case Counter::Frames:
    return "frames";
  case Counter::FramingErrors:
    return "framing_errors";
  case Counter::FillUnits:
    return "fill_units";
  case Counter::PartialTailBytes:
    return "partial_tail_bytes";
  case Counter::Reconnects:
    return "reconnects";
  case Counter::DecodeFailures:
    return "decode_failures";
  case Counter::ArtifactsQueued:
    return "artifacts_queued";
  case Counter::ArtifactsWritten:
    return "artifacts_written";
  case Counter::ArtifactsDropped:
    return "artifacts_dropped";
  case Counter::WriteFailures:
    return "write_failures";
  default:
    return "?";
  }
}

const char *counter_name(ChannelCounter c) {
  switch (c) {
  case ChannelCounter::Units:
    return "units";
  case ChannelCounter::Bytes:
    return "bytes";
  case ChannelCounter::Duplicates:
    return "duplicates";
  case ChannelCounter::MissingUnits:
    return "missing_units";
  case ChannelCounter::Resets:
    return "resets";
  case ChannelCounter::Packets:
    return "packets";
  case ChannelCounter::PacketOverflows:
    return "packet_overflows";
  case ChannelCounter::Resyncs:
    return "resyncs";
  case ChannelCounter::CrcFailures:
    return "crc_failures";
  case ChannelCounter::OrphanPackets:
    return "orphan_packets";
  case ChannelCounter::ExcessBytes:
    return "excess_bytes";
  case ChannelCounter::FilesOk:
    return "files_ok";
  case ChannelCounter::FilesCorrupt:
    return "files_corrupt";
  case ChannelCounter::FilesTruncated:
    return "files_truncated";
  default:
    return "?";
  }
}

uint64_t StatsSnapshot::get(uint8_t vcid, ChannelCounter c) const {
  auto it = channels.find(vcid);
  if (it == channels.end())
    return 0;
  return it->second.get(c);
}

void Stats::add(Counter c, uint64_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  data_.values[(size_t)c] += n;
}

void Stats::add(uint8_t vcid, ChannelCounter c, uint64_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  data_.channels[vcid].values[(size_t)c] += n;
}

StatsSnapshot Stats::snapshot() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return data_;
}

std::string Stats::summary() const {
  StatsSnapshot s = snapshot();
  std::ostringstream os;
  for (size_t i = 0; i < (size_t)Counter::Count_; i++) {
    if (i)
      os << ' ';
    os << counter_name((Counter)i) << '=' << s.values[i];
  }
  for (const auto &kv : s.channels) {
    os << "\n  vc " << (unsigned)kv.first << ':';
    for (size_t i = 0; i < (size_t)ChannelCounter::Count_; i++) {
      if (kv.second.values[i] == 0)
        continue;
      os << ' ' << counter_name((ChannelCounter)i) << '='
         << kv.second.values[i];
    }
  }
  return os.str();
}

} // namespace goesrx
