#include "demux.hpp"
#include "logging.hpp"

namespace goesrx {

ChannelState &Demultiplexer::channel_for(uint8_t vcid) {
  auto it = channels_.find(vcid);
  if (it == channels_.end()) {
    Logger::instance().log(LogLevel::DEBUG, "vc %u: new channel",
                           (unsigned)vcid);
    it = channels_
             .emplace(vcid, std::make_unique<ChannelState>(
                                vcid, profile_.max_packet_len, stats_))
             .first;
  }
  return *it->second;
}

const ChannelState *Demultiplexer::channel(uint8_t vcid) const {
  auto it = channels_.find(vcid);
  return it == channels_.end() ? nullptr : it->second.get();
}

void Demultiplexer::process(const TransportUnit &unit, SteadyTime now,
                            std::vector<FileContext> &closed) {
  stats_.add(unit.vcid, ChannelCounter::Units);
  stats_.add(unit.vcid, ChannelCounter::Bytes, unit.payload.size());
  ChannelState &ch = channel_for(unit.vcid);

  if (!ch.seen) {
    ch.seen = true;
  } else {
    uint32_t delta =
        counter_delta(ch.last_counter, unit.counter, kVcduCounterModulo);
    if (delta == 0) {
      Logger::instance().log(LogLevel::DEBUG, "vc %u: duplicate unit %u",
                             (unsigned)unit.vcid, (unsigned)unit.counter);
      stats_.add(unit.vcid, ChannelCounter::Duplicates);
      return;
    }
    if (delta >= kVcduCounterModulo / 2) {
      Logger::instance().log(LogLevel::WARN,
                             "vc %u: counter stepped back %u -> %u, resetting",
                             (unsigned)unit.vcid, (unsigned)ch.last_counter,
                             (unsigned)unit.counter);
      stats_.add(unit.vcid, ChannelCounter::Resets);
      ch.resets++;
      ch.packets.resync();
      ch.files.flush(closed, "channel counter reset");
    } else if (delta > 1) {
      uint32_t missing = delta - 1;
      Logger::instance().log(LogLevel::WARN, "vc %u: %s: %u unit(s) missing",
                             (unsigned)unit.vcid,
                             error_name(ErrorKind::SequenceGap),
                             (unsigned)missing);
      stats_.add(unit.vcid, ChannelCounter::MissingUnits, missing);
      ch.gaps++;
      if (ch.packets.in_progress())
        stats_.add(unit.vcid, ChannelCounter::Resyncs);
      ch.packets.resync();
      ch.files.mark_gap(missing);
    }
  }
  ch.last_counter = unit.counter;

  ch.files.note_unit(unit.replayed());
  std::vector<AppPacket> packets;
  ch.packets.feed(unit.payload.data(), unit.payload.size(), packets);
  for (auto &p : packets)
    ch.files.accept(std::move(p), now, closed);
}

void Demultiplexer::sweep(SteadyTime now,
                          std::chrono::steady_clock::duration window,
                          std::vector<FileContext> &closed) {
  for (auto &kv : channels_)
    kv.second->files.expire(now, window, closed);
}

void Demultiplexer::flush_all(std::vector<FileContext> &closed,
                              const std::string &reason) {
  for (auto &kv : channels_) {
    kv.second->packets.resync();
    kv.second->files.flush(closed, reason);
  }
}

void Demultiplexer::reset_all(std::vector<FileContext> &closed) {
  flush_all(closed, "stream reconnected");
  channels_.clear();
}

} // namespace goesrx
