#pragma once

#include "../scan/signatures.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace image {

enum class RegionKind {
    EXIF,
    XMP,
    COMMENT,
    TEXT,
    TIME,
    APPLICATION
};

std::string to_string(RegionKind kind);

struct MetadataRegion {
    RegionKind kind;
    std::string label;
    size_t offset = 0;
    size_t size = 0;
};

struct MetadataField {
    std::string name;
    std::string value;
};

struct ImageMetadata {
    std::vector<MetadataField> text_fields;
    size_t field_count = 0;
    std::optional<int> orientation;
};

// Walks container structure only; pixel data is never touched. Truncated
// or malformed structures stop the walk and keep what was found so far.
class MetadataReader {
public:
    static std::vector<MetadataRegion> findRegions(std::string_view data);
    static ImageMetadata readMetadata(std::string_view data);

    // TIFF-structured EXIF payload, with or without the "Exif\0\0" preamble.
    static void parseExif(std::string_view payload, ImageMetadata& metadata);

private:
    static std::vector<MetadataRegion> jpegRegions(std::string_view data);
    static std::vector<MetadataRegion> pngRegions(std::string_view data);
    static std::vector<MetadataRegion> webpRegions(std::string_view data);
    static std::vector<MetadataRegion> gifRegions(std::string_view data);

    static void readPngText(std::string_view chunk_type, std::string_view payload, ImageMetadata& metadata);
};

}}
