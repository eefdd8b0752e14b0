#include "integrity.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <cstdio>

namespace goesrx {

const char *status_name(FileStatus s) {
  switch (s) {
  case FileStatus::Ok:
    return "ok";
  case FileStatus::Corrupt:
    return "corrupt";
  default:
    return "truncated";
  }
}

bool IntegrityChecker::check_dcs_trailer(const CompletedFile &f,
                                         std::string &note) {
  const uint8_t *d = f.data();
  size_t n = f.data_len();
  DcsHeader dh;
  std::string err;
  if (!parse_dcs_header(d, n, dh, err)) {
    note = err;
    return false;
  }
  if (n < kDcsHeaderLen + 4) {
    note = "DCS payload without trailing CRC";
    return false;
  }
  uint32_t computed = crc32(d, n - 4);
  uint32_t received = read_le32(d + n - 4);
  if (computed != received) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "DCS file crc %08x != %08x",
                  (unsigned)computed, (unsigned)received);
    note = buf;
    return false;
  }
  if (!dh.header_crc_ok)
    Logger::instance().log(LogLevel::DEBUG, "vc %u: DCS header crc mismatch",
                           (unsigned)f.vcid);
  return true;
}

CompletedFile IntegrityChecker::check(FileContext &&ctx) {
  CompletedFile f;
  f.vcid = ctx.vcid;
  f.apid = ctx.apid;
  f.file_counter = ctx.file_counter;
  f.headers = std::move(ctx.headers);
  f.headers_valid = ctx.headers_valid;
  f.declared_len = ctx.declared_len;
  f.received_len = ctx.bytes.size();
  f.bytes = std::move(ctx.bytes);
  f.gaps = ctx.gaps;
  f.crc_failures = ctx.crc_failures;
  f.units = ctx.units;
  f.flagged_units = ctx.flagged_units;
  f.checksum = ctx.checksum;
  f.received_at = ctx.opened_at;
  f.note = ctx.reason;

  bool truncated = ctx.state != FileState::Complete ||
                   f.received_len < f.declared_len;
  bool corrupt = f.crc_failures > 0;
  if (corrupt && !truncated)
    f.note = std::to_string(f.crc_failures) + " packet crc failure(s)";
  if (!truncated && !corrupt && f.headers_valid &&
      f.headers.primary.file_type == FT_DCS) {
    std::string note;
    if (!check_dcs_trailer(f, note)) {
      corrupt = true;
      f.note = note;
    }
  }

  if (truncated) {
    f.status = FileStatus::Truncated;
    if (f.note.empty())
      f.note = "declared length not reached";
    stats_.add(f.vcid, ChannelCounter::FilesTruncated);
    Logger::instance().log(
        LogLevel::WARN, "vc %u apid %u: %s: file %u %llu/%llu bytes (%s)",
        (unsigned)f.vcid, (unsigned)f.apid,
        error_name(ErrorKind::FileTruncated), (unsigned)f.file_counter,
        (unsigned long long)f.received_len,
        (unsigned long long)f.declared_len, f.note.c_str());
  } else if (corrupt) {
    f.status = FileStatus::Corrupt;
    stats_.add(f.vcid, ChannelCounter::FilesCorrupt);
    Logger::instance().log(LogLevel::WARN, "vc %u apid %u: %s: file %u (%s)",
                           (unsigned)f.vcid, (unsigned)f.apid,
                           error_name(ErrorKind::IntegrityMismatch),
                           (unsigned)f.file_counter, f.note.c_str());
  } else {
    f.status = FileStatus::Ok;
    stats_.add(f.vcid, ChannelCounter::FilesOk);
    Logger::instance().log(LogLevel::INFO,
                           "vc %u apid %u: file %u complete, %llu bytes",
                           (unsigned)f.vcid, (unsigned)f.apid,
                           (unsigned)f.file_counter,
                           (unsigned long long)f.received_len);
  }
  return f;
}

} // namespace goesrx
