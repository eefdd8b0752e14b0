#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "collaborators.hpp"
#include "completed_file.hpp"
#include "stats.hpp"

namespace goesrx {

struct ImageProduct {
    ImageStructure structure;
    uint8_t noaa_compression{NC_NONE};
    std::optional<SegmentIdentification> segment;
};
struct EmwinProduct {};
struct TextProduct {};
struct DcsProduct {};
struct UnknownProduct {
    uint8_t file_type{0};
};

using Product = std::variant<ImageProduct, EmwinProduct, TextProduct, DcsProduct, UnknownProduct>;

Product classify(const CompletedFile& f);

struct Artifact {
    std::string name;
    std::vector<uint8_t> bytes;
};

class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;
    virtual void submit(Artifact&& a) = 0;
};

struct DispatchConfig {
    bool dump_headers{false};
};

// Routes completed files to per-type handlers and hands named artifacts to the sink.
class Dispatcher {
public:
    Dispatcher(const DispatchConfig& cfg, ImageCodec& codec, Decompressor& inflater,
               ArtifactSink& sink, Stats& stats);

    void dispatch(CompletedFile&& f);

    // "<YYYY-MM-DD>" from the time stamp header, else the reception time.
    static std::string date_dir(const CompletedFile& f);
    static std::string base_name(const CompletedFile& f);

private:
    struct Visitor;

    void handle_image(const ImageProduct& p, const CompletedFile& f);
    void handle_emwin(const CompletedFile& f);
    void handle_plain(const char* category, const char* ext, const CompletedFile& f, bool whole);

    std::string name_for(const char* category, const std::string& base,
                         const CompletedFile& f, const std::string& ext) const;
    void emit(std::string name, std::vector<uint8_t> bytes, const CompletedFile& f);

    DispatchConfig cfg_;
    ImageCodec& codec_;
    Decompressor& inflater_;
    ArtifactSink& sink_;
    Stats& stats_;
};

} // namespace goesrx
