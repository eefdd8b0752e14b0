#include "protocol.hpp"
#include <algorithm>
#include <array>

namespace goesrx {

namespace {

std::array<uint32_t, 256> make_crc32_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

std::array<uint16_t, 256> make_crc16_table() {
  std::array<uint16_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint16_t c = (uint16_t)(i << 8);
    for (int j = 0; j < 8; j++)
      c = (c & 0x8000) ? (uint16_t)((c << 1) ^ 0x1021) : (uint16_t)(c << 1);
    table[i] = c;
  }
  return table;
}

} // namespace

const char *error_name(ErrorKind k) {
  switch (k) {
  case ErrorKind::FramingError:
    return "FramingError";
  case ErrorKind::SequenceGap:
    return "SequenceGap";
  case ErrorKind::PacketOverflow:
    return "PacketOverflow";
  case ErrorKind::FileTruncated:
    return "FileTruncated";
  case ErrorKind::IntegrityMismatch:
    return "IntegrityMismatch";
  case ErrorKind::DecodeFailure:
    return "DecodeFailure";
  default:
    return "WriteFailure";
  }
}

bool MissionProfile::accepts(uint8_t scid) const {
  if (spacecraft_ids.empty())
    return true;
  return std::find(spacecraft_ids.begin(), spacecraft_ids.end(), scid) !=
         spacecraft_ids.end();
}

bool profile_by_name(const std::string &name, MissionProfile &out) {
  if (name == "goes-r-hrit" || name == "goes-lrit") {
    out = MissionProfile{};
    out.name = name;
    return true;
  }
  return false;
}

bool parse_unit(const uint8_t *data, size_t len, const MissionProfile &profile,
                TransportUnit &out) {
  if (len < profile.frame_len || profile.frame_len <= kVcduHeaderLen)
    return false;
  uint8_t version = (data[0] >> 6) & 0x3;
  uint8_t scid = (uint8_t)(((data[0] & 0x3f) << 2) | ((data[1] & 0xc0) >> 6));
  if (version != profile.version || !profile.accepts(scid))
    return false;
  out.version = version;
  out.scid = scid;
  out.vcid = data[1] & 0x3f;
  out.counter = ((uint32_t)data[2] << 16) | ((uint32_t)data[3] << 8) | data[4];
  out.signal = data[5];
  out.payload.assign(data + kVcduHeaderLen, data + profile.frame_len);
  return true;
}

uint32_t counter_delta(uint32_t last, uint32_t cur, uint32_t modulo) {
  last %= modulo;
  cur %= modulo;
  return cur >= last ? cur - last : modulo - last + cur;
}

uint16_t crc16_ccitt(const uint8_t *data, size_t len) {
  static const std::array<uint16_t, 256> table = make_crc16_table();
  uint16_t c = 0xFFFF;
  for (size_t i = 0; i < len; i++)
    c = (uint16_t)((c << 8) ^ table[((c >> 8) ^ data[i]) & 0xFF]);
  return c;
}

uint32_t crc32_update(uint32_t crc, const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_crc32_table();
  uint32_t c = ~crc;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

uint32_t crc32(const uint8_t *data, size_t len) {
  return crc32_update(0, data, len);
}

} // namespace goesrx
