#include "threat_guard/scan/signatures.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace threat_guard {
namespace scan {

namespace {

constexpr size_t ZIP_EOCD_SEARCH_WINDOW = 65535 + 22;
constexpr size_t PDF_HEADER_SEARCH_WINDOW = 1024;

bool startsWith(std::string_view data, const std::vector<uint8_t>& magic, size_t offset = 0) {
    if (data.size() < offset + magic.size()) return false;
    for (size_t i = 0; i < magic.size(); ++i) {
        if (static_cast<uint8_t>(data[offset + i]) != magic[i]) return false;
    }
    return true;
}

bool isJpegSofMarker(uint8_t marker) {
    return marker >= 0xC0 && marker <= 0xCF &&
           marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

std::optional<ImageDimensions> jpegDimensions(std::string_view data) {
    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (static_cast<uint8_t>(data[pos]) != 0xFF) return std::nullopt;

        uint8_t marker = static_cast<uint8_t>(data[pos + 1]);
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) return std::nullopt;

        uint16_t length = readBe16(data, pos + 2);
        if (length < 2) return std::nullopt;

        if (isJpegSofMarker(marker)) {
            if (pos + 9 > data.size()) return std::nullopt;
            ImageDimensions dims;
            dims.height = readBe16(data, pos + 5);
            dims.width = readBe16(data, pos + 7);
            return dims;
        }
        pos += 2 + static_cast<size_t>(length);
    }
    return std::nullopt;
}

std::optional<ImageDimensions> pngDimensions(std::string_view data) {
    if (data.size() < 24) return std::nullopt;
    if (data.substr(12, 4) != "IHDR") return std::nullopt;
    return ImageDimensions{readBe32(data, 16), readBe32(data, 20)};
}

std::optional<ImageDimensions> gifDimensions(std::string_view data) {
    if (data.size() < 10) return std::nullopt;
    return ImageDimensions{readLe16(data, 6), readLe16(data, 8)};
}

std::optional<ImageDimensions> webpDimensions(std::string_view data) {
    if (data.size() < 30) return std::nullopt;
    std::string_view chunk = data.substr(12, 4);

    if (chunk == "VP8 ") {
        if (static_cast<uint8_t>(data[23]) != 0x9D || static_cast<uint8_t>(data[24]) != 0x01 ||
            static_cast<uint8_t>(data[25]) != 0x2A) {
            return std::nullopt;
        }
        return ImageDimensions{static_cast<uint32_t>(readLe16(data, 26) & 0x3FFF),
                               static_cast<uint32_t>(readLe16(data, 28) & 0x3FFF)};
    }
    if (chunk == "VP8L") {
        if (static_cast<uint8_t>(data[20]) != 0x2F) return std::nullopt;
        uint32_t bits = readLe32(data, 21);
        return ImageDimensions{(bits & 0x3FFF) + 1, ((bits >> 14) & 0x3FFF) + 1};
    }
    if (chunk == "VP8X") {
        auto read24 = [&data](size_t offset) {
            return static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) |
                   (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8) |
                   (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 16);
        };
        return ImageDimensions{read24(24) + 1, read24(27) + 1};
    }
    return std::nullopt;
}

}

uint16_t readBe16(std::string_view data, size_t offset) {
    if (offset + 2 > data.size()) return 0;
    return static_cast<uint16_t>((static_cast<uint8_t>(data[offset]) << 8) |
                                 static_cast<uint8_t>(data[offset + 1]));
}

uint32_t readBe32(std::string_view data, size_t offset) {
    if (offset + 4 > data.size()) return 0;
    return (static_cast<uint32_t>(readBe16(data, offset)) << 16) | readBe16(data, offset + 2);
}

uint16_t readLe16(std::string_view data, size_t offset) {
    if (offset + 2 > data.size()) return 0;
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

uint32_t readLe32(std::string_view data, size_t offset) {
    if (offset + 4 > data.size()) return 0;
    return static_cast<uint32_t>(readLe16(data, offset)) |
           (static_cast<uint32_t>(readLe16(data, offset + 2)) << 16);
}

std::string to_string(ImageType type) {
    switch (type) {
        case ImageType::JPEG: return "jpeg";
        case ImageType::PNG: return "png";
        case ImageType::GIF: return "gif";
        case ImageType::WEBP: return "webp";
        default: return "unknown";
    }
}

std::optional<ImageType> imageTypeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "jpeg" || lower == "jpg" || lower == "image/jpeg") return ImageType::JPEG;
    if (lower == "png" || lower == "image/png") return ImageType::PNG;
    if (lower == "gif" || lower == "image/gif") return ImageType::GIF;
    if (lower == "webp" || lower == "image/webp") return ImageType::WEBP;
    return std::nullopt;
}

std::string mimeTypeOf(ImageType type) {
    switch (type) {
        case ImageType::JPEG: return "image/jpeg";
        case ImageType::PNG: return "image/png";
        case ImageType::GIF: return "image/gif";
        case ImageType::WEBP: return "image/webp";
        default: return "application/octet-stream";
    }
}

const std::vector<FileSignature>& fileSignatureTable() {
    static const std::vector<FileSignature> table = {
        {"jpeg", "jpeg", {0xFF, 0xD8, 0xFF}},
        {"png", "png", {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}},
        {"gif87a", "gif", {0x47, 0x49, 0x46, 0x38, 0x37, 0x61}},
        {"gif89a", "gif", {0x47, 0x49, 0x46, 0x38, 0x39, 0x61}},
        {"webp", "riff", {0x52, 0x49, 0x46, 0x46}},
        {"pe", "pe", {0x4D, 0x5A}},
        {"elf", "elf", {0x7F, 0x45, 0x4C, 0x46}},
        {"zip", "zip", {0x50, 0x4B, 0x03, 0x04}},
        {"rar", "rar", {0x52, 0x61, 0x72, 0x21, 0x1A, 0x07}},
        {"html", "markup", {0x3C, 0x68, 0x74, 0x6D, 0x6C}},
        {"xml", "markup", {0x3C, 0x3F, 0x78, 0x6D, 0x6C}},
        {"pdf", "pdf", {0x25, 0x50, 0x44, 0x46, 0x2D}}
    };
    return table;
}

std::vector<std::string> detectFileSignatures(std::string_view data) {
    std::vector<std::string> formats;

    for (const auto& signature : fileSignatureTable()) {
        if (startsWith(data, signature.magic)) {
            formats.emplace_back(signature.format);
        }
    }

    auto contains = [&formats](const char* name) {
        return std::find(formats.begin(), formats.end(), name) != formats.end();
    };

    if (!contains("zip") && data.size() >= 22) {
        size_t search_start = data.size() > ZIP_EOCD_SEARCH_WINDOW ? data.size() - ZIP_EOCD_SEARCH_WINDOW : 0;
        size_t eocd = data.rfind(std::string_view("PK\x05\x06", 4));
        if (eocd != std::string_view::npos && eocd >= search_start && eocd + 22 <= data.size()) {
            formats.emplace_back("zip");
        }
    }

    if (!contains("pdf")) {
        std::string_view head = data.substr(0, std::min(data.size(), PDF_HEADER_SEARCH_WINDOW));
        size_t pdf = head.find("%PDF-");
        if (pdf != std::string_view::npos && pdf > 0) {
            formats.emplace_back("pdf");
        }
    }

    return formats;
}

size_t countSignatureFamilies(const std::vector<std::string>& formats) {
    std::set<std::string> families;
    for (const auto& format : formats) {
        const auto& table = fileSignatureTable();
        auto it = std::find_if(table.begin(), table.end(),
                               [&format](const FileSignature& sig) { return format == sig.format; });
        families.insert(it != table.end() ? it->family : format);
    }
    return families.size();
}

DetectedImage detectImageType(std::string_view data) {
    DetectedImage result;

    if (startsWith(data, {0xFF, 0xD8, 0xFF})) {
        result.type = ImageType::JPEG;
        result.dimensions = jpegDimensions(data);
    } else if (startsWith(data, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A})) {
        result.type = ImageType::PNG;
        result.dimensions = pngDimensions(data);
    } else if (data.size() >= 6 && (data.substr(0, 6) == "GIF87a" || data.substr(0, 6) == "GIF89a")) {
        result.type = ImageType::GIF;
        result.dimensions = gifDimensions(data);
    } else if (data.size() >= 12 && data.substr(0, 4) == "RIFF" && data.substr(8, 4) == "WEBP") {
        result.type = ImageType::WEBP;
        result.dimensions = webpDimensions(data);
    }

    return result;
}

bool hasValidPeHeader(std::string_view data, size_t mz_offset) {
    if (mz_offset + 0x40 > data.size()) return false;

    uint32_t e_lfanew = readLe32(data, mz_offset + 0x3C);
    if (e_lfanew < 0x40 || e_lfanew > data.size()) return false;

    size_t pe_offset = mz_offset + e_lfanew;
    if (pe_offset + 4 > data.size()) return false;

    return data.substr(pe_offset, 4) == std::string_view("PE\0\0", 4);
}

bool hasValidElfHeader(std::string_view data, size_t elf_offset) {
    if (elf_offset + 6 > data.size()) return false;

    uint8_t elf_class = static_cast<uint8_t>(data[elf_offset + 4]);
    uint8_t elf_data = static_cast<uint8_t>(data[elf_offset + 5]);
    return (elf_class == 1 || elf_class == 2) && (elf_data == 1 || elf_data == 2);
}

}}
