#include "dispatcher.hpp"
#include "emwin.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <cstdio>
#include <sstream>

namespace goesrx {

namespace {

std::string strip_suffix(const std::string &s, const std::string &suffix) {
  if (s.size() > suffix.size() &&
      s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
    return s.substr(0, s.size() - suffix.size());
  return s;
}

std::time_t file_time(const CompletedFile &f) {
  if (f.headers_valid && f.headers.time_stamp)
    return f.headers.time_stamp->unix_seconds();
  return std::chrono::system_clock::to_time_t(f.received_at);
}

std::string header_dump(const CompletedFile &f) {
  std::ostringstream os;
  os << "vcid=" << (unsigned)f.vcid << " apid=" << f.apid
     << " file_counter=" << f.file_counter << " status=" << status_name(f.status)
     << "\n";
  os << "declared=" << f.declared_len << " received=" << f.received_len
     << " gaps=" << f.gaps << " crc_failures=" << f.crc_failures
     << " units=" << f.units << " replayed_units=" << f.flagged_units << "\n";
  char crc[16];
  std::snprintf(crc, sizeof(crc), "%08x", (unsigned)f.checksum);
  os << "crc32=" << crc << "\n";
  if (!f.note.empty())
    os << "note=" << f.note << "\n";
  if (f.headers_valid)
    os << describe_headers(f.headers);
  return os.str();
}

} // namespace

Product classify(const CompletedFile &f) {
  if (!f.headers_valid)
    return UnknownProduct{f.headers.primary.file_type};
  const FileHeaders &h = f.headers;
  switch (h.primary.file_type) {
  case FT_IMAGE: {
    if (!h.image_structure)
      return UnknownProduct{FT_IMAGE};
    ImageProduct p;
    p.structure = *h.image_structure;
    if (h.noaa)
      p.noaa_compression = h.noaa->compression;
    if (h.segmented())
      p.segment = h.segment;
    return p;
  }
  case FT_SERVICE_MESSAGE:
    return TextProduct{};
  case FT_TEXT:
    if (h.noaa && h.noaa->compression == NC_ZIP)
      return EmwinProduct{};
    return TextProduct{};
  case FT_DCS:
    return DcsProduct{};
  default:
    return UnknownProduct{h.primary.file_type};
  }
}

struct Dispatcher::Visitor {
  Dispatcher &d;
  const CompletedFile &f;

  void operator()(const ImageProduct &p) { d.handle_image(p, f); }
  void operator()(const EmwinProduct &) { d.handle_emwin(f); }
  void operator()(const TextProduct &) { d.handle_plain("text", "txt", f, false); }
  void operator()(const DcsProduct &) { d.handle_plain("dcs", "dcs", f, false); }
  void operator()(const UnknownProduct &) {
    d.handle_plain("unknown", "bin", f, true);
  }
};

Dispatcher::Dispatcher(const DispatchConfig &cfg, ImageCodec &codec,
                       Decompressor &inflater, ArtifactSink &sink, Stats &stats)
    : cfg_(cfg), codec_(codec), inflater_(inflater), sink_(sink),
      stats_(stats) {}

std::string Dispatcher::date_dir(const CompletedFile &f) {
  return format_utc(file_time(f), "%Y-%m-%d");
}

std::string Dispatcher::base_name(const CompletedFile &f) {
  if (f.headers_valid && f.headers.annotation) {
    std::string a = sanitize_component(strip_suffix(*f.headers.annotation, ".lrit"));
    if (!a.empty())
      return a;
  }
  char buf[96];
  std::string when = format_utc(file_time(f), "%Y%m%dT%H%M%S");
  if (f.headers_valid && f.headers.noaa)
    std::snprintf(buf, sizeof(buf), "t%u_%s_p%u-%u",
                  (unsigned)f.headers.primary.file_type, when.c_str(),
                  (unsigned)f.headers.noaa->product_id,
                  (unsigned)f.headers.noaa->product_subid);
  else
    std::snprintf(buf, sizeof(buf), "t%u_%s_vc%u",
                  (unsigned)f.headers.primary.file_type, when.c_str(),
                  (unsigned)f.vcid);
  return buf;
}

std::string Dispatcher::name_for(const char *category, const std::string &base,
                                 const CompletedFile &f,
                                 const std::string &ext) const {
  std::string name = std::string(category) + "/" + date_dir(f) + "/" + base;
  if (f.status != FileStatus::Ok)
    name += std::string(".") + status_name(f.status);
  return name + "." + ext;
}

void Dispatcher::emit(std::string name, std::vector<uint8_t> bytes,
                      const CompletedFile &f) {
  if (cfg_.dump_headers) {
    std::string stem = name.substr(0, name.rfind('.'));
    std::string text = header_dump(f);
    sink_.submit(Artifact{stem + ".hdr.txt",
                          std::vector<uint8_t>(text.begin(), text.end())});
  }
  Logger::instance().log(LogLevel::DEBUG, "artifact %s (%zu bytes)",
                         name.c_str(), bytes.size());
  sink_.submit(Artifact{std::move(name), std::move(bytes)});
}

void Dispatcher::dispatch(CompletedFile &&f) {
  Product p = classify(f);
  std::visit(Visitor{*this, f}, p);
}

void Dispatcher::handle_image(const ImageProduct &p, const CompletedFile &f) {
  std::string base = base_name(f);
  if (p.segment) {
    char seg[16];
    std::snprintf(seg, sizeof(seg), "_seg%03u", (unsigned)p.segment->segment_seq);
    base += seg;
  }
  const uint8_t *data = f.data();
  size_t len = f.data_len();

  if (p.noaa_compression == NC_GIF || p.noaa_compression == NC_JPEG) {
    const char *ext = p.noaa_compression == NC_GIF ? "gif" : "jpg";
    emit(name_for("images", base, f, ext),
         std::vector<uint8_t>(data, data + len), f);
    return;
  }

  ImageInfo info;
  info.bits_per_pixel = p.structure.bits_per_pixel;
  info.columns = p.structure.columns;
  info.lines = p.structure.lines;
  info.compression = p.structure.compression;
  info.noaa_compression = p.noaa_compression;
  std::vector<uint8_t> decoded;
  std::string err;
  if (codec_.decode(data, len, info, decoded, err)) {
    emit(name_for("images", base, f, codec_.extension()), std::move(decoded), f);
    return;
  }
  Logger::instance().log(LogLevel::WARN, "vc %u apid %u: %s: %s, keeping raw file",
                         (unsigned)f.vcid, (unsigned)f.apid,
                         error_name(ErrorKind::DecodeFailure), err.c_str());
  stats_.add(Counter::DecodeFailures);
  emit(name_for("images", base, f, "lrit"), f.bytes, f);
}

void Dispatcher::handle_emwin(const CompletedFile &f) {
  std::string date = date_dir(f);
  std::vector<ZipEntry> entries;
  std::string err;
  if (!read_zip_entries(f.data(), f.data_len(), entries, err)) {
    Logger::instance().log(LogLevel::WARN,
                           "vc %u apid %u: EMWIN container: %s, keeping raw",
                           (unsigned)f.vcid, (unsigned)f.apid, err.c_str());
    emit(name_for("emwin", base_name(f), f, "zip"),
         std::vector<uint8_t>(f.data(), f.data() + f.data_len()), f);
    return;
  }

  for (const ZipEntry &e : entries) {
    std::vector<uint8_t> member;
    bool ok = true;
    if (e.method == ZM_STORED) {
      member = e.data;
    } else if (e.method == ZM_DEFLATED) {
      ok = inflater_.inflate(e.data.data(), e.data.size(),
                             (size_t)e.uncompressed_size,
                             member, err);
    } else {
      err = "unsupported compression method " + std::to_string(e.method);
      ok = false;
    }
    if (ok && crc32(member.data(), member.size()) != e.crc32) {
      err = "member crc mismatch";
      ok = false;
    }
    if (!ok) {
      Logger::instance().log(LogLevel::WARN, "EMWIN member %s: %s: %s",
                             e.name.c_str(),
                             error_name(ErrorKind::DecodeFailure), err.c_str());
      stats_.add(Counter::DecodeFailures);
      continue;
    }

    std::string name;
    auto parsed = parse_emwin_name(e.name);
    if (parsed) {
      char buf[128];
      std::snprintf(buf, sizeof(buf), "emwin/%s/%s/%s_%s_%06u.%s", date.c_str(),
                    sanitize_component(parsed->cccc).c_str(),
                    sanitize_component(parsed->ttaaii).c_str(),
                    format_utc(parsed->issued, "%Y%m%d%H%M%S").c_str(),
                    (unsigned)parsed->sequence,
                    parsed->extension.empty()
                        ? "bin"
                        : sanitize_component(parsed->extension).c_str());
      name = buf;
    } else {
      std::string leaf = e.name.substr(e.name.find_last_of("/\\") + 1);
      leaf = sanitize_component(leaf);
      if (leaf.empty())
        leaf = base_name(f) + "_member";
      name = "emwin/" + date + "/" + leaf;
    }
    Logger::instance().log(LogLevel::INFO, "EMWIN product %s (%zu bytes)",
                           name.c_str(), member.size());
    emit(std::move(name), std::move(member), f);
  }
}

void Dispatcher::handle_plain(const char *category, const char *ext,
                              const CompletedFile &f, bool whole) {
  std::vector<uint8_t> bytes =
      whole ? f.bytes : std::vector<uint8_t>(f.data(), f.data() + f.data_len());
  emit(name_for(category, base_name(f), f, ext), std::move(bytes), f);
}

} // namespace goesrx
