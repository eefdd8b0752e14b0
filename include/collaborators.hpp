#pragma once
#include <cstdint>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace goesrx {

struct ImageInfo {
    uint8_t bits_per_pixel{0};
    uint16_t columns{0};
    uint16_t lines{0};
    uint8_t compression{0};
    uint8_t noaa_compression{0};
};

class ImageCodec {
public:
    virtual ~ImageCodec() = default;
    virtual bool decode(const uint8_t* data, size_t len, const ImageInfo& info,
                        std::vector<uint8_t>& out, std::string& err) = 0;
    virtual const char* extension() const = 0;
};

// Frames uncompressed 8-bit pixel data as a binary PGM.
class PgmImageCodec : public ImageCodec {
public:
    bool decode(const uint8_t* data, size_t len, const ImageInfo& info,
                std::vector<uint8_t>& out, std::string& err) override;
    const char* extension() const override { return "pgm"; }
};

class Decompressor {
public:
    virtual ~Decompressor() = default;
    virtual bool inflate(const uint8_t* data, size_t len, size_t expected_len,
                         std::vector<uint8_t>& out, std::string& err) = 0;
};

// Raw DEFLATE streams (ZIP method 8).
class ZlibDecompressor : public Decompressor {
public:
    bool inflate(const uint8_t* data, size_t len, size_t expected_len,
                 std::vector<uint8_t>& out, std::string& err) override;
};

class Storage {
public:
    virtual ~Storage() = default;
    virtual bool exists(const std::string& name) = 0;
    virtual bool write(const std::string& name, const std::vector<uint8_t>& bytes,
                       std::string& err) = 0;
};

class DirectoryStorage : public Storage {
public:
    explicit DirectoryStorage(std::string root) : root_(std::move(root)) {}
    bool exists(const std::string& name) override;
    bool write(const std::string& name, const std::vector<uint8_t>& bytes,
               std::string& err) override;
private:
    std::string root_;
};

class MemoryStorage : public Storage {
public:
    bool exists(const std::string& name) override;
    bool write(const std::string& name, const std::vector<uint8_t>& bytes,
               std::string& err) override;

    void fail_next_writes(int n);
    std::map<std::string, std::vector<uint8_t>> blobs() const;
    size_t size() const;
private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<uint8_t>> blobs_;
    int fail_next_{0};
};

} // namespace goesrx
