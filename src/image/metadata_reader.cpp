#include "threat_guard/image/metadata_reader.hpp"
#include "threat_guard/common/logger.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace threat_guard {
namespace image {

namespace {

constexpr size_t MAX_EXIF_ENTRIES = 1024;
constexpr int MAX_IFD_DEPTH = 2;
constexpr uint16_t TAG_ORIENTATION = 0x0112;
constexpr uint16_t TAG_EXIF_IFD = 0x8769;
constexpr uint16_t TAG_GPS_IFD = 0x8825;
constexpr uint16_t TAG_USER_COMMENT = 0x9286;
constexpr uint16_t TAG_XP_TITLE = 0x9C9B;
constexpr uint16_t TAG_XP_SUBJECT = 0x9C9F;

const std::string_view EXIF_PREAMBLE("Exif\0\0", 6);
const std::string_view XMP_JPEG_NAMESPACE("http://ns.adobe.com/xap/1.0/\0", 29);

const std::map<uint16_t, const char*> EXIF_TAG_NAMES = {
    {0x010D, "DocumentName"},
    {0x010E, "ImageDescription"},
    {0x010F, "Make"},
    {0x0110, "Model"},
    {0x0131, "Software"},
    {0x0132, "DateTime"},
    {0x013B, "Artist"},
    {0x013C, "HostComputer"},
    {0x8298, "Copyright"},
    {0x9003, "DateTimeOriginal"},
    {0x9004, "DateTimeDigitized"},
    {0x9286, "UserComment"},
    {0x9C9B, "XPTitle"},
    {0x9C9C, "XPComment"},
    {0x9C9D, "XPAuthor"},
    {0x9C9E, "XPKeywords"},
    {0x9C9F, "XPSubject"},
    {0xA420, "ImageUniqueID"},
    {0xA430, "CameraOwnerName"},
    {0xA431, "BodySerialNumber"},
    {0xA433, "LensMake"},
    {0xA434, "LensModel"}
};

size_t exifTypeSize(uint16_t type) {
    switch (type) {
        case 1: case 2: case 6: case 7: return 1;
        case 3: case 8: return 2;
        case 4: case 9: case 11: case 13: return 4;
        case 5: case 10: case 12: return 8;
        default: return 0;
    }
}

std::string cleanText(std::string_view raw) {
    size_t end = raw.find('\0');
    std::string text(raw.substr(0, end));
    while (!text.empty() && (text.back() == ' ' || text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

// UTF-16 to a byte string keeping the low byte of each code unit; enough for
// substring checks on ASCII payloads.
std::string narrowUtf16(std::string_view raw, bool little_endian) {
    std::string out;
    for (size_t i = 0; i + 1 < raw.size(); i += 2) {
        uint8_t lo = static_cast<uint8_t>(raw[little_endian ? i : i + 1]);
        uint8_t hi = static_cast<uint8_t>(raw[little_endian ? i + 1 : i]);
        if (lo == 0 && hi == 0) break;
        out += (hi == 0) ? static_cast<char>(lo) : '?';
    }
    return out;
}

std::optional<size_t> skipGifSubBlocks(std::string_view data, size_t pos, std::string* collected = nullptr) {
    while (pos < data.size()) {
        uint8_t block_size = static_cast<uint8_t>(data[pos]);
        pos += 1;
        if (block_size == 0) return pos;
        if (pos + block_size > data.size()) return std::nullopt;
        if (collected) collected->append(data.substr(pos, block_size));
        pos += block_size;
    }
    return std::nullopt;
}

class TiffReader {
public:
    TiffReader(std::string_view tiff, bool little_endian) : tiff_(tiff), little_endian_(little_endian) {}

    uint16_t u16(size_t offset) const {
        return little_endian_ ? scan::readLe16(tiff_, offset) : scan::readBe16(tiff_, offset);
    }

    uint32_t u32(size_t offset) const {
        return little_endian_ ? scan::readLe32(tiff_, offset) : scan::readBe32(tiff_, offset);
    }

    bool littleEndian() const { return little_endian_; }
    std::string_view bytes() const { return tiff_; }

private:
    std::string_view tiff_;
    bool little_endian_;
};

void walkIfd(const TiffReader& reader, size_t ifd_offset, const std::string& ifd_name, int depth,
             std::set<size_t>& visited, size_t& entries_seen, ImageMetadata& metadata) {
    std::string_view tiff = reader.bytes();
    if (depth > MAX_IFD_DEPTH || ifd_offset + 2 > tiff.size() || !visited.insert(ifd_offset).second) {
        return;
    }

    uint16_t entry_count = reader.u16(ifd_offset);
    for (uint16_t i = 0; i < entry_count && entries_seen < MAX_EXIF_ENTRIES; ++i) {
        size_t entry = ifd_offset + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > tiff.size()) return;
        ++entries_seen;

        uint16_t tag = reader.u16(entry);
        uint16_t type = reader.u16(entry + 2);
        uint32_t count = reader.u32(entry + 4);

        size_t unit = exifTypeSize(type);
        if (unit == 0) continue;
        if (count > tiff.size() / unit) continue;

        size_t data_size = unit * count;
        size_t data_offset = (data_size <= 4) ? entry + 8 : reader.u32(entry + 8);
        if (data_offset + data_size > tiff.size()) continue;
        std::string_view value = tiff.substr(data_offset, data_size);

        if (tag == TAG_ORIENTATION && type == 3 && ifd_name == "Image") {
            metadata.orientation = reader.u16(entry + 8);
            continue;
        }
        if ((tag == TAG_EXIF_IFD || tag == TAG_GPS_IFD) && (type == 4 || type == 13)) {
            walkIfd(reader, reader.u32(entry + 8), tag == TAG_EXIF_IFD ? "Photo" : "GPS",
                    depth + 1, visited, entries_seen, metadata);
            continue;
        }

        auto name_it = EXIF_TAG_NAMES.find(tag);
        std::string name = "Exif." + ifd_name + "." +
            (name_it != EXIF_TAG_NAMES.end() ? std::string(name_it->second) : fmt::format("0x{:04X}", tag));

        std::optional<std::string> text;
        if (type == 2) {
            text = cleanText(value);
        } else if (tag == TAG_USER_COMMENT && value.size() >= 8) {
            std::string_view charset = value.substr(0, 8);
            std::string_view body = value.substr(8);
            if (charset.substr(0, 7) == "UNICODE") {
                text = narrowUtf16(body, reader.littleEndian());
            } else {
                text = cleanText(body);
            }
        } else if (tag >= TAG_XP_TITLE && tag <= TAG_XP_SUBJECT && type == 1) {
            text = narrowUtf16(value, true);
        }

        if (text && !text->empty()) {
            metadata.text_fields.push_back({name, *text});
            metadata.field_count++;
        }
    }
}

}

std::string to_string(RegionKind kind) {
    switch (kind) {
        case RegionKind::EXIF: return "exif";
        case RegionKind::XMP: return "xmp";
        case RegionKind::COMMENT: return "comment";
        case RegionKind::TEXT: return "text";
        case RegionKind::TIME: return "time";
        case RegionKind::APPLICATION: return "application";
        default: return "unknown";
    }
}

std::vector<MetadataRegion> MetadataReader::findRegions(std::string_view data) {
    switch (scan::detectImageType(data).type) {
        case scan::ImageType::JPEG: return jpegRegions(data);
        case scan::ImageType::PNG: return pngRegions(data);
        case scan::ImageType::WEBP: return webpRegions(data);
        case scan::ImageType::GIF: return gifRegions(data);
        default: return {};
    }
}

std::vector<MetadataRegion> MetadataReader::jpegRegions(std::string_view data) {
    std::vector<MetadataRegion> regions;

    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (static_cast<uint8_t>(data[pos]) != 0xFF) break;

        size_t marker_pos = pos;
        while (marker_pos + 1 < data.size() && static_cast<uint8_t>(data[marker_pos + 1]) == 0xFF) {
            ++marker_pos;
        }
        if (marker_pos + 1 >= data.size()) break;

        uint8_t marker = static_cast<uint8_t>(data[marker_pos + 1]);
        if (marker == 0xD9 || marker == 0xDA) break;
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos = marker_pos + 2;
            continue;
        }

        uint16_t length = scan::readBe16(data, marker_pos + 2);
        size_t payload_offset = marker_pos + 4;
        if (length < 2 || payload_offset + (length - 2) > data.size()) break;
        size_t payload_size = static_cast<size_t>(length) - 2;
        std::string_view payload = data.substr(payload_offset, payload_size);

        if (marker >= 0xE0 && marker <= 0xEF) {
            MetadataRegion region{RegionKind::APPLICATION, fmt::format("APP{}", marker - 0xE0),
                                  payload_offset, payload_size};
            if (marker == 0xE1 && payload.substr(0, EXIF_PREAMBLE.size()) == EXIF_PREAMBLE) {
                region.kind = RegionKind::EXIF;
            } else if (marker == 0xE1 && payload.substr(0, XMP_JPEG_NAMESPACE.size()) == XMP_JPEG_NAMESPACE) {
                region.kind = RegionKind::XMP;
            }
            regions.push_back(region);
        } else if (marker == 0xFE) {
            regions.push_back({RegionKind::COMMENT, "COM", payload_offset, payload_size});
        }

        pos = payload_offset + payload_size;
    }
    return regions;
}

std::vector<MetadataRegion> MetadataReader::pngRegions(std::string_view data) {
    std::vector<MetadataRegion> regions;

    size_t pos = 8;
    while (pos + 12 <= data.size()) {
        uint32_t length = scan::readBe32(data, pos);
        std::string type(data.substr(pos + 4, 4));
        size_t data_offset = pos + 8;
        if (length > data.size() - data_offset - 4) break;

        if (type == "tEXt" || type == "zTXt" || type == "iTXt") {
            regions.push_back({RegionKind::TEXT, type, data_offset, length});
        } else if (type == "tIME") {
            regions.push_back({RegionKind::TIME, type, data_offset, length});
        } else if (type == "eXIf") {
            regions.push_back({RegionKind::EXIF, type, data_offset, length});
        } else if (type == "IEND") {
            break;
        }

        pos = data_offset + length + 4;
    }
    return regions;
}

std::vector<MetadataRegion> MetadataReader::webpRegions(std::string_view data) {
    std::vector<MetadataRegion> regions;

    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        std::string fourcc(data.substr(pos, 4));
        uint32_t length = scan::readLe32(data, pos + 4);
        size_t data_offset = pos + 8;
        if (length > data.size() - data_offset) break;

        if (fourcc == "EXIF") {
            regions.push_back({RegionKind::EXIF, fourcc, data_offset, length});
        } else if (fourcc == "XMP ") {
            regions.push_back({RegionKind::XMP, "XMP", data_offset, length});
        }

        pos = data_offset + length + (length & 1);
    }
    return regions;
}

std::vector<MetadataRegion> MetadataReader::gifRegions(std::string_view data) {
    std::vector<MetadataRegion> regions;
    if (data.size() < 13) return regions;

    uint8_t flags = static_cast<uint8_t>(data[10]);
    size_t pos = 13;
    if (flags & 0x80) {
        pos += static_cast<size_t>(3) << ((flags & 0x07) + 1);
    }

    while (pos < data.size()) {
        uint8_t introducer = static_cast<uint8_t>(data[pos]);

        if (introducer == 0x3B) break;

        if (introducer == 0x21) {
            if (pos + 2 > data.size()) break;
            uint8_t label = static_cast<uint8_t>(data[pos + 1]);
            size_t body = pos + 2;
            auto end = skipGifSubBlocks(data, body);
            if (!end) break;

            if (label == 0xFE) {
                regions.push_back({RegionKind::COMMENT, "Comment", body, *end - body});
            } else if (label == 0xFF) {
                bool is_xmp = body + 12 <= data.size() && data.substr(body + 1, 11) == "XMP DataXMP";
                regions.push_back({is_xmp ? RegionKind::XMP : RegionKind::APPLICATION,
                                   is_xmp ? "XMP" : "Application", body, *end - body});
            }
            pos = *end;
            continue;
        }

        if (introducer == 0x2C) {
            if (pos + 10 > data.size()) break;
            uint8_t image_flags = static_cast<uint8_t>(data[pos + 9]);
            size_t next = pos + 10;
            if (image_flags & 0x80) {
                next += static_cast<size_t>(3) << ((image_flags & 0x07) + 1);
            }
            next += 1;
            auto end = skipGifSubBlocks(data, next);
            if (!end) break;
            pos = *end;
            continue;
        }

        break;
    }
    return regions;
}

void MetadataReader::parseExif(std::string_view payload, ImageMetadata& metadata) {
    std::string_view tiff = payload;
    if (tiff.substr(0, EXIF_PREAMBLE.size()) == EXIF_PREAMBLE) {
        tiff.remove_prefix(EXIF_PREAMBLE.size());
    }
    if (tiff.size() < 8) return;

    bool little_endian;
    if (tiff.substr(0, 2) == "II") {
        little_endian = true;
    } else if (tiff.substr(0, 2) == "MM") {
        little_endian = false;
    } else {
        return;
    }

    TiffReader reader(tiff, little_endian);
    if (reader.u16(2) != 42) return;

    std::set<size_t> visited;
    size_t entries_seen = 0;
    walkIfd(reader, reader.u32(4), "Image", 0, visited, entries_seen, metadata);
}

void MetadataReader::readPngText(std::string_view chunk_type, std::string_view payload, ImageMetadata& metadata) {
    size_t keyword_end = payload.find('\0');
    if (keyword_end == std::string_view::npos) {
        metadata.text_fields.push_back({"PNG." + std::string(chunk_type), cleanText(payload)});
        metadata.field_count++;
        return;
    }

    std::string name = "PNG." + std::string(payload.substr(0, keyword_end));
    std::string value;

    if (chunk_type == "tEXt") {
        value = std::string(payload.substr(keyword_end + 1));
    } else if (chunk_type == "iTXt" && keyword_end + 3 <= payload.size()) {
        bool compressed = payload[keyword_end + 1] != 0;
        size_t language_end = payload.find('\0', keyword_end + 3);
        size_t translated_end = language_end == std::string_view::npos ? std::string_view::npos
                                                                        : payload.find('\0', language_end + 1);
        if (!compressed && translated_end != std::string_view::npos) {
            value = std::string(payload.substr(translated_end + 1));
        }
    }

    metadata.text_fields.push_back({name, value});
    metadata.field_count++;
}

ImageMetadata MetadataReader::readMetadata(std::string_view data) {
    ImageMetadata metadata;

    for (const auto& region : findRegions(data)) {
        std::string_view payload = data.substr(region.offset, region.size);

        switch (region.kind) {
            case RegionKind::EXIF:
                parseExif(payload, metadata);
                break;
            case RegionKind::XMP: {
                std::string_view packet = payload;
                if (packet.substr(0, XMP_JPEG_NAMESPACE.size()) == XMP_JPEG_NAMESPACE) {
                    packet.remove_prefix(XMP_JPEG_NAMESPACE.size());
                }
                metadata.text_fields.push_back({"XMP", std::string(packet)});
                metadata.field_count++;
                break;
            }
            case RegionKind::COMMENT: {
                std::string text;
                if (region.label == "COM") {
                    text = std::string(payload);
                } else if (!skipGifSubBlocks(data, region.offset, &text)) {
                    common::Logger::instance().debug("[Metadata] Truncated GIF comment | offset={}",
                                                     region.offset);
                }
                metadata.text_fields.push_back({"Comment", text});
                metadata.field_count++;
                break;
            }
            case RegionKind::TEXT:
                readPngText(region.label, payload, metadata);
                break;
            case RegionKind::TIME:
            case RegionKind::APPLICATION:
                break;
        }
    }

    common::Logger::instance().debug("[Metadata] Read | fields={} | orientation={}",
                                     metadata.field_count, metadata.orientation.value_or(0));
    return metadata;
}

}}
