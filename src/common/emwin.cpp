#include "emwin.hpp"
#include <cctype>
#include <memory>
#include <zip.h>

namespace goesrx {

namespace {

struct ArchiveCloser {
  void operator()(zip_t *za) const { zip_discard(za); }
};

struct MemberCloser {
  void operator()(zip_file_t *zf) const { zip_fclose(zf); }
};

bool digits(const std::string &s, size_t pos, size_t n, uint32_t &out) {
  if (pos + n > s.size())
    return false;
  out = 0;
  for (size_t i = pos; i < pos + n; i++) {
    if (!std::isdigit((unsigned char)s[i]))
      return false;
    out = out * 10 + (uint32_t)(s[i] - '0');
  }
  return true;
}

// days since 1970-01-01 of a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = (unsigned)(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + (int64_t)doe - 719468;
}

} // namespace

std::optional<EmwinName> parse_emwin_name(const std::string &filename) {
  std::string stem = filename;
  auto slash = stem.find_last_of("/\\");
  if (slash != std::string::npos)
    stem = stem.substr(slash + 1);

  EmwinName n;
  auto dot = stem.rfind('.');
  if (dot != std::string::npos) {
    for (char c : stem.substr(dot + 1))
      n.extension.push_back((char)std::tolower((unsigned char)c));
    stem = stem.substr(0, dot);
  }
  if (stem.size() < 51)
    return std::nullopt;
  if ((stem[0] != 'A' && stem[0] != 'Z') || stem[1] != '_')
    return std::nullopt;
  if (stem[18] != '_' || stem[25] != '_' || stem[40] != '_' ||
      stem[47] != '-' || stem[49] != '-')
    return std::nullopt;

  n.pflag = stem[0];
  n.ttaaii = stem.substr(2, 6);
  n.cccc = stem.substr(8, 4);
  n.heading_time = stem.substr(12, 6);
  for (char c : n.ttaaii + n.cccc)
    if (!std::isalnum((unsigned char)c))
      return std::nullopt;

  uint32_t year, month, day, hour, minute, second;
  if (!digits(stem, 26, 4, year) || !digits(stem, 30, 2, month) ||
      !digits(stem, 32, 2, day) || !digits(stem, 34, 2, hour) ||
      !digits(stem, 36, 2, minute) || !digits(stem, 38, 2, second))
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60)
    return std::nullopt;
  n.issued = (std::time_t)(days_from_civil(year, month, day) * 86400 +
                           hour * 3600 + minute * 60 + second);

  if (!digits(stem, 41, 6, n.sequence))
    return std::nullopt;
  uint32_t prio;
  if (!digits(stem, 48, 1, prio) || prio < 1 || prio > 4)
    return std::nullopt;
  n.priority = (uint8_t)prio;
  n.legacy = stem.substr(50);
  return n;
}

bool read_zip_entries(const uint8_t *data, size_t len,
                      std::vector<ZipEntry> &out, std::string &err) {
  out.clear();
  zip_error_t zerr;
  zip_error_init(&zerr);
  zip_source_t *src = zip_source_buffer_create(data, len, 0, &zerr);
  if (!src) {
    err = zip_error_strerror(&zerr);
    zip_error_fini(&zerr);
    return false;
  }
  std::unique_ptr<zip_t, ArchiveCloser> za(
      zip_open_from_source(src, ZIP_RDONLY, &zerr));
  if (!za) {
    // the source is still ours when the open fails
    zip_source_free(src);
    err = zip_error_strerror(&zerr);
    zip_error_fini(&zerr);
    return false;
  }
  zip_error_fini(&zerr);

  zip_int64_t count = zip_get_num_entries(za.get(), 0);
  for (zip_int64_t i = 0; i < count; i++) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(za.get(), (zip_uint64_t)i, 0, &st) != 0) {
      err = zip_strerror(za.get());
      return false;
    }
    ZipEntry e;
    e.name = st.name ? st.name : "";
    e.method = (uint16_t)st.comp_method;
    e.crc32 = st.crc;
    e.compressed_size = st.comp_size;
    e.uncompressed_size = st.size;

    // stored bytes as they are in the container; members are inflated
    // and verified by the caller
    std::unique_ptr<zip_file_t, MemberCloser> zf(
        zip_fopen_index(za.get(), (zip_uint64_t)i, ZIP_FL_COMPRESSED));
    if (!zf) {
      err = "open " + e.name + ": " + zip_strerror(za.get());
      return false;
    }
    e.data.resize((size_t)st.comp_size);
    size_t got = 0;
    while (got < e.data.size()) {
      zip_int64_t n = zip_fread(zf.get(), e.data.data() + got,
                                (zip_uint64_t)(e.data.size() - got));
      if (n < 0) {
        err = "read " + e.name + ": " + zip_file_strerror(zf.get());
        return false;
      }
      if (n == 0)
        break;
      got += (size_t)n;
    }
    if (got != e.data.size()) {
      err = "short member data for " + e.name;
      return false;
    }
    out.push_back(std::move(e));
  }
  return true;
}

} // namespace goesrx
