#include "collaborators.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <zlib.h>

namespace goesrx {

namespace fs = std::filesystem;

bool PgmImageCodec::decode(const uint8_t *data, size_t len,
                           const ImageInfo &info, std::vector<uint8_t> &out,
                           std::string &err) {
  if (info.bits_per_pixel != 8) {
    err = "only 8-bit images are supported";
    return false;
  }
  if (info.compression != 0 || info.noaa_compression != 0) {
    err = "compressed image data";
    return false;
  }
  if (info.columns == 0 || info.lines == 0) {
    err = "empty image geometry";
    return false;
  }
  size_t pixels = (size_t)info.columns * info.lines;
  char hdr[64];
  int n = std::snprintf(hdr, sizeof(hdr), "P5\n%u %u\n255\n",
                        (unsigned)info.columns, (unsigned)info.lines);
  out.clear();
  out.reserve(n + pixels);
  out.insert(out.end(), hdr, hdr + n);
  // short images are padded with black lines
  size_t take = len < pixels ? len : pixels;
  out.insert(out.end(), data, data + take);
  out.resize(n + pixels, 0);
  return true;
}

bool ZlibDecompressor::inflate(const uint8_t *data, size_t len,
                               size_t expected_len, std::vector<uint8_t> &out,
                               std::string &err) {
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
    err = "inflateInit2 failed";
    return false;
  }
  out.clear();
  out.reserve(expected_len ? expected_len : len * 4);
  zs.next_in = const_cast<Bytef *>(data);
  zs.avail_in = (uInt)len;

  uint8_t chunk[16 * 1024];
  int rc = Z_OK;
  while (rc == Z_OK) {
    zs.next_out = chunk;
    zs.avail_out = sizeof(chunk);
    rc = ::inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END)
      break;
    out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      rc = Z_BUF_ERROR;
      break;
    }
  }
  inflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    err = zs.msg ? zs.msg : "deflate stream ended early";
    return false;
  }
  if (expected_len && out.size() != expected_len) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "inflated %zu bytes, expected %zu",
                  out.size(), expected_len);
    err = buf;
    return false;
  }
  return true;
}

bool DirectoryStorage::exists(const std::string &name) {
  std::error_code ec;
  return fs::exists(fs::path(root_) / name, ec);
}

bool DirectoryStorage::write(const std::string &name,
                             const std::vector<uint8_t> &bytes,
                             std::string &err) {
  fs::path target = fs::path(root_) / name;
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    err = ec.message();
    return false;
  }
  fs::path tmp = target;
  tmp += ".part";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      err = "cannot open " + tmp.string();
      return false;
    }
    f.write((const char *)bytes.data(), (std::streamsize)bytes.size());
    if (!f) {
      err = "short write to " + tmp.string();
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    err = ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool MemoryStorage::exists(const std::string &name) {
  std::lock_guard<std::mutex> lk(mtx_);
  return blobs_.count(name) != 0;
}

bool MemoryStorage::write(const std::string &name,
                          const std::vector<uint8_t> &bytes, std::string &err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (fail_next_ > 0) {
    fail_next_--;
    err = "injected write failure";
    return false;
  }
  blobs_[name] = bytes;
  return true;
}

void MemoryStorage::fail_next_writes(int n) {
  std::lock_guard<std::mutex> lk(mtx_);
  fail_next_ = n;
}

std::map<std::string, std::vector<uint8_t>> MemoryStorage::blobs() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return blobs_;
}

size_t MemoryStorage::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return blobs_.size();
}

} // namespace goesrx
