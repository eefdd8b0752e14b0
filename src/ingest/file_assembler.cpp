#include "file_assembler.hpp"
#include "logging.hpp"
#include "protocol.hpp"

namespace goesrx {

const char *state_name(FileState s) {
  switch (s) {
  case FileState::Idle:
    return "idle";
  case FileState::HeaderSeen:
    return "header-seen";
  case FileState::Accumulating:
    return "accumulating";
  case FileState::Complete:
    return "complete";
  default:
    return "incomplete";
  }
}

void FileAssembler::accept(AppPacket &&pkt, SteadyTime now,
                           std::vector<FileContext> &closed) {
  if (pkt.flag == SequenceFlag::First ||
      pkt.flag == SequenceFlag::Standalone) {
    if (!idle()) {
      Logger::instance().log(
          LogLevel::WARN, "vc %u apid %u: %s: file %u superseded at %zu bytes",
          (unsigned)vcid_, (unsigned)open_.apid,
          error_name(ErrorKind::FileTruncated), (unsigned)open_.file_counter,
          open_.bytes.size());
      close(FileState::Incomplete, "superseded by a new file", closed);
    }
    bool standalone = pkt.flag == SequenceFlag::Standalone;
    open(std::move(pkt), now, closed);
    if (standalone && !idle())
      close(FileState::Incomplete, "single-packet file shorter than declared",
            closed);
    return;
  }

  if (idle() || pkt.apid != open_.apid) {
    Logger::instance().log(LogLevel::DEBUG,
                           "vc %u apid %u: orphan packet seq %u (%zu bytes)",
                           (unsigned)vcid_, (unsigned)pkt.apid,
                           (unsigned)pkt.seq, pkt.data.size());
    stats_.add(vcid_, ChannelCounter::OrphanPackets);
    return;
  }

  uint16_t expected = (uint16_t)((open_.last_seq + 1) % kPacketSeqModulo);
  if (pkt.seq != expected) {
    Logger::instance().log(LogLevel::WARN,
                           "vc %u apid %u: %s: packet seq %u, expected %u",
                           (unsigned)vcid_, (unsigned)pkt.apid,
                           error_name(ErrorKind::SequenceGap),
                           (unsigned)pkt.seq, (unsigned)expected);
    open_.gaps++;
    open_.seq_gaps++;
  }
  open_.last_seq = pkt.seq;
  open_.last_activity = now;
  if (!pkt.crc_ok)
    open_.crc_failures++;

  bool last = pkt.flag == SequenceFlag::Last;
  append(pkt.data.data(), pkt.data.size());
  if (open_.declared_len && open_.bytes.size() >= open_.declared_len) {
    // bytes after a lost packet may belong to another file
    if (open_.seq_gaps)
      close(FileState::Incomplete,
            "declared length reached after a packet sequence gap", closed);
    else
      close(FileState::Complete, "", closed);
  } else if (last && open_.declared_len == 0)
    close(FileState::Complete, "", closed);
  else if (last)
    close(FileState::Incomplete, "last packet before declared length", closed);
}

void FileAssembler::open(AppPacket &&pkt, SteadyTime now,
                         std::vector<FileContext> &closed) {
  if (pkt.data.size() < kTpFileHeaderLen) {
    Logger::instance().log(
        LogLevel::WARN, "vc %u apid %u: %s: first packet of %zu bytes",
        (unsigned)vcid_, (unsigned)pkt.apid,
        error_name(ErrorKind::FramingError), pkt.data.size());
    stats_.add(vcid_, ChannelCounter::OrphanPackets);
    return;
  }
  open_ = FileContext{};
  open_.vcid = vcid_;
  open_.apid = pkt.apid;
  open_.file_counter = read_be16(pkt.data.data());
  open_.declared_len = (read_be64(pkt.data.data() + 2) + 7) / 8;
  open_.last_seq = pkt.seq;
  open_.last_activity = now;
  open_.opened_at = std::chrono::system_clock::now();
  open_.state = FileState::HeaderSeen;
  if (in_unit_) {
    open_.units = 1;
    open_.flagged_units = unit_replayed_ ? 1 : 0;
  }
  if (!pkt.crc_ok)
    open_.crc_failures++;

  Logger::instance().log(LogLevel::DEBUG, "vc %u apid %u: file %u opened",
                         (unsigned)vcid_, (unsigned)open_.apid,
                         (unsigned)open_.file_counter);
  append(pkt.data.data() + kTpFileHeaderLen,
         pkt.data.size() - kTpFileHeaderLen);
  if (open_.declared_len && open_.bytes.size() >= open_.declared_len)
    close(FileState::Complete, "", closed);
}

void FileAssembler::append(const uint8_t *p, size_t n) {
  size_t take = n;
  if (open_.declared_len) {
    uint64_t room = open_.declared_len > open_.bytes.size()
                        ? open_.declared_len - open_.bytes.size()
                        : 0;
    if (take > room)
      take = (size_t)room;
  }
  if (take < n) {
    Logger::instance().log(LogLevel::DEBUG,
                           "vc %u apid %u: %zu bytes past declared length %llu",
                           (unsigned)vcid_, (unsigned)open_.apid, n - take,
                           (unsigned long long)open_.declared_len);
    stats_.add(vcid_, ChannelCounter::ExcessBytes, n - take);
  }
  open_.bytes.insert(open_.bytes.end(), p, p + take);
  open_.checksum = crc32_update(open_.checksum, p, take);

  if (open_.state == FileState::HeaderSeen &&
      open_.bytes.size() >= kPrimaryHeaderLen) {
    open_.state = FileState::Accumulating;
    PrimaryHeader ph;
    if (!parse_primary_header(open_.bytes.data(), open_.bytes.size(), ph)) {
      Logger::instance().log(LogLevel::WARN,
                             "vc %u apid %u: malformed primary header",
                             (unsigned)vcid_, (unsigned)open_.apid);
      open_.headers_parsed = true;
      return;
    }
    open_.headers.primary = ph;
    if (ph.total_len() != open_.declared_len)
      Logger::instance().log(
          LogLevel::DEBUG,
          "vc %u apid %u: primary header declares %llu bytes, transport %llu",
          (unsigned)vcid_, (unsigned)open_.apid,
          (unsigned long long)ph.total_len(),
          (unsigned long long)open_.declared_len);
    open_.declared_len = ph.total_len();
    if (open_.bytes.size() > open_.declared_len) {
      stats_.add(vcid_, ChannelCounter::ExcessBytes,
                 open_.bytes.size() - open_.declared_len);
      open_.bytes.resize((size_t)open_.declared_len);
      open_.checksum = crc32(open_.bytes.data(), open_.bytes.size());
    }
  }

  if (open_.state == FileState::Accumulating && !open_.headers_parsed &&
      open_.bytes.size() >= open_.headers.primary.total_header_len) {
    open_.headers_parsed = true;
    std::string err;
    FileHeaders h;
    if (parse_file_headers(open_.bytes.data(), open_.bytes.size(), h, err)) {
      open_.headers = std::move(h);
      open_.headers_valid = true;
    } else {
      Logger::instance().log(LogLevel::WARN, "vc %u apid %u: headers: %s",
                             (unsigned)vcid_, (unsigned)open_.apid,
                             err.c_str());
    }
  }
}

void FileAssembler::close(FileState final_state, const std::string &reason,
                          std::vector<FileContext> &closed) {
  open_.state = final_state;
  open_.reason = reason;
  closed.push_back(std::move(open_));
  open_ = FileContext{};
}

void FileAssembler::mark_gap(uint32_t missing) {
  if (idle())
    return;
  open_.gaps++;
  open_.missing_units += missing;
}

void FileAssembler::note_unit(bool replayed) {
  in_unit_ = true;
  unit_replayed_ = replayed;
  if (idle())
    return;
  open_.units++;
  if (replayed)
    open_.flagged_units++;
}

void FileAssembler::expire(SteadyTime now,
                           std::chrono::steady_clock::duration window,
                           std::vector<FileContext> &closed) {
  if (idle() || now - open_.last_activity < window)
    return;
  Logger::instance().log(LogLevel::WARN,
                         "vc %u apid %u: %s: file %u stalled at %zu/%llu bytes",
                         (unsigned)vcid_, (unsigned)open_.apid,
                         error_name(ErrorKind::FileTruncated),
                         (unsigned)open_.file_counter, open_.bytes.size(),
                         (unsigned long long)open_.declared_len);
  close(FileState::Incomplete, "stalled", closed);
}

void FileAssembler::flush(std::vector<FileContext> &closed,
                          const std::string &reason) {
  if (idle())
    return;
  close(FileState::Incomplete, reason, closed);
}

} // namespace goesrx
