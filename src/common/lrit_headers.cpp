#include "lrit_headers.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <cstdio>
#include <sstream>

namespace goesrx {

namespace {

constexpr uint32_t kDaysFrom1958To1970 = 4383;

std::string record_text(const uint8_t *p, size_t n) {
  return trim(std::string((const char *)p, n));
}

bool fixed_len(uint16_t rec_len, size_t need, uint8_t type, std::string &err) {
  if (rec_len < need) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "header type %u too short (%u < %zu)",
                  (unsigned)type, (unsigned)rec_len, need);
    err = buf;
    return false;
  }
  return true;
}

} // namespace

std::time_t TimeStamp::unix_seconds() const {
  if (days < kDaysFrom1958To1970)
    return 0;
  return (std::time_t)(days - kDaysFrom1958To1970) * 86400 + millis / 1000;
}

std::map<std::string, std::string> FileHeaders::ancillary_pairs() const {
  std::map<std::string, std::string> out;
  if (!ancillary_text)
    return out;
  std::stringstream ss(*ancillary_text);
  std::string pair;
  while (std::getline(ss, pair, ';')) {
    auto eq = pair.find('=');
    if (eq == std::string::npos)
      continue;
    out[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
  }
  return out;
}

bool FileHeaders::segmented() const {
  if (!segment)
    return false;
  auto pairs = ancillary_pairs();
  auto it = pairs.find("Segmented");
  if (it != pairs.end())
    return it->second == "yes";
  return segment->max_segment > 1;
}

bool parse_primary_header(const uint8_t *data, size_t len, PrimaryHeader &out) {
  if (len < kPrimaryHeaderLen)
    return false;
  if (data[0] != HT_PRIMARY || read_be16(data + 1) != kPrimaryHeaderLen)
    return false;
  out.file_type = data[3];
  out.total_header_len = read_be32(data + 4);
  out.data_len_bits = read_be64(data + 8);
  return out.total_header_len >= kPrimaryHeaderLen;
}

bool parse_file_headers(const uint8_t *data, size_t len, FileHeaders &out,
                        std::string &err) {
  out = FileHeaders{};
  if (!parse_primary_header(data, len, out.primary)) {
    err = "missing or malformed primary header";
    return false;
  }
  size_t end = out.primary.total_header_len;
  if (end > len) {
    err = "header area extends past available bytes";
    return false;
  }

  size_t off = kPrimaryHeaderLen;
  while (off < end) {
    if (end - off < 3) {
      err = "truncated secondary header";
      return false;
    }
    const uint8_t *p = data + off;
    uint8_t type = p[0];
    uint16_t rec_len = read_be16(p + 1);
    if (rec_len < 3 || rec_len > end - off) {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "bad record length %u for header type %u",
                    (unsigned)rec_len, (unsigned)type);
      err = buf;
      return false;
    }

    switch (type) {
    case HT_PRIMARY:
      err = "second primary header";
      return false;
    case HT_IMAGE_STRUCTURE: {
      if (!fixed_len(rec_len, 9, type, err))
        return false;
      ImageStructure s;
      s.bits_per_pixel = p[3];
      s.columns = read_be16(p + 4);
      s.lines = read_be16(p + 6);
      s.compression = p[8];
      out.image_structure = s;
      break;
    }
    case HT_IMAGE_NAVIGATION: {
      if (!fixed_len(rec_len, 51, type, err))
        return false;
      ImageNavigation n;
      n.projection = record_text(p + 3, 32);
      n.column_scaling = (int32_t)read_be32(p + 35);
      n.line_scaling = (int32_t)read_be32(p + 39);
      n.column_offset = (int32_t)read_be32(p + 43);
      n.line_offset = (int32_t)read_be32(p + 47);
      out.image_navigation = n;
      break;
    }
    case HT_IMAGE_DATA_FUNCTION:
      out.image_data_function = std::vector<uint8_t>(p + 3, p + rec_len);
      break;
    case HT_ANNOTATION:
      out.annotation = record_text(p + 3, rec_len - 3);
      break;
    case HT_TIME_STAMP: {
      if (!fixed_len(rec_len, 10, type, err))
        return false;
      // p[3] is the CDS P-field
      TimeStamp t;
      t.days = read_be16(p + 4);
      t.millis = read_be32(p + 6);
      out.time_stamp = t;
      break;
    }
    case HT_ANCILLARY_TEXT:
      out.ancillary_text = record_text(p + 3, rec_len - 3);
      break;
    case HT_SEGMENT_IDENTIFICATION: {
      if (!fixed_len(rec_len, 17, type, err))
        return false;
      SegmentIdentification s;
      s.image_id = read_be16(p + 3);
      s.segment_seq = read_be16(p + 5);
      s.start_column = read_be16(p + 7);
      s.start_line = read_be16(p + 9);
      s.max_segment = read_be16(p + 11);
      s.max_column = read_be16(p + 13);
      s.max_row = read_be16(p + 15);
      out.segment = s;
      break;
    }
    case HT_NOAA: {
      if (!fixed_len(rec_len, 14, type, err))
        return false;
      NoaaHeader n;
      n.agency = record_text(p + 3, 4);
      n.product_id = read_be16(p + 7);
      n.product_subid = read_be16(p + 9);
      n.parameter = read_be16(p + 11);
      n.compression = p[13];
      out.noaa = n;
      break;
    }
    case HT_HEADER_STRUCTURE:
      out.header_structure = record_text(p + 3, rec_len - 3);
      break;
    case HT_RICE_COMPRESSION: {
      if (!fixed_len(rec_len, 7, type, err))
        return false;
      RiceCompression r;
      r.flags = read_be16(p + 3);
      r.pixels_per_block = p[5];
      r.scanlines_per_packet = p[6];
      out.rice = r;
      break;
    }
    default:
      out.skipped_types.push_back(type);
      break;
    }
    off += rec_len;
  }
  return true;
}

std::string describe_headers(const FileHeaders &h) {
  std::ostringstream os;
  os << "primary: file_type=" << (unsigned)h.primary.file_type
     << " total_header_len=" << h.primary.total_header_len
     << " data_len_bits=" << h.primary.data_len_bits << "\n";
  if (h.image_structure)
    os << "image_structure: bpp=" << (unsigned)h.image_structure->bits_per_pixel
       << " columns=" << h.image_structure->columns
       << " lines=" << h.image_structure->lines
       << " compression=" << (unsigned)h.image_structure->compression << "\n";
  if (h.image_navigation)
    os << "image_navigation: projection=" << h.image_navigation->projection
       << " cfac=" << h.image_navigation->column_scaling
       << " lfac=" << h.image_navigation->line_scaling
       << " coff=" << h.image_navigation->column_offset
       << " loff=" << h.image_navigation->line_offset << "\n";
  if (h.image_data_function)
    os << "image_data_function: " << h.image_data_function->size()
       << " bytes\n";
  if (h.annotation)
    os << "annotation: " << *h.annotation << "\n";
  if (h.time_stamp)
    os << "time_stamp: "
       << format_utc(h.time_stamp->unix_seconds(), "%Y-%m-%dT%H:%M:%SZ")
       << " (days=" << h.time_stamp->days << " ms=" << h.time_stamp->millis
       << ")\n";
  if (h.ancillary_text)
    os << "ancillary_text: " << *h.ancillary_text << "\n";
  if (h.segment)
    os << "segment: image_id=" << h.segment->image_id
       << " seq=" << h.segment->segment_seq
       << " start_column=" << h.segment->start_column
       << " start_line=" << h.segment->start_line
       << " max_segment=" << h.segment->max_segment
       << " max_column=" << h.segment->max_column
       << " max_row=" << h.segment->max_row << "\n";
  if (h.noaa)
    os << "noaa: agency=" << h.noaa->agency
       << " product_id=" << h.noaa->product_id
       << " product_subid=" << h.noaa->product_subid
       << " parameter=" << h.noaa->parameter
       << " compression=" << (unsigned)h.noaa->compression << "\n";
  if (h.header_structure)
    os << "header_structure: " << *h.header_structure << "\n";
  if (h.rice)
    os << "rice: flags=" << h.rice->flags
       << " pixels_per_block=" << (unsigned)h.rice->pixels_per_block
       << " scanlines_per_packet=" << (unsigned)h.rice->scanlines_per_packet
       << "\n";
  for (uint8_t t : h.skipped_types)
    os << "skipped header type " << (unsigned)t << "\n";
  return os.str();
}

bool parse_dcs_header(const uint8_t *data, size_t len, DcsHeader &out,
                      std::string &err) {
  if (len < kDcsHeaderLen) {
    err = "DCS payload shorter than its header";
    return false;
  }
  out.name = record_text(data, 32);
  std::string plen = record_text(data + 32, 8);
  out.payload_len = 0;
  for (char c : plen) {
    if (c < '0' || c > '9') {
      err = "bad DCS payload length '" + plen + "'";
      return false;
    }
    out.payload_len = out.payload_len * 10 + (uint64_t)(c - '0');
  }
  out.source = record_text(data + 40, 4);
  out.type = record_text(data + 44, 4);
  out.header_crc = read_le32(data + 60);
  out.header_crc_ok = crc32(data, 60) == out.header_crc;
  if (out.type != "DCSH") {
    err = "unexpected DCS payload type '" + out.type + "'";
    return false;
  }
  return true;
}

} // namespace goesrx
