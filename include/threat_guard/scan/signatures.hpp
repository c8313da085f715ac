#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace threat_guard {
namespace scan {

enum class ImageType {
    JPEG,
    PNG,
    GIF,
    WEBP,
    UNKNOWN
};

std::string to_string(ImageType type);
std::optional<ImageType> imageTypeFromString(const std::string& name);
std::string mimeTypeOf(ImageType type);

struct ImageDimensions {
    uint32_t width = 0;
    uint32_t height = 0;
};

struct DetectedImage {
    ImageType type = ImageType::UNKNOWN;
    std::optional<ImageDimensions> dimensions;
};

struct FileSignature {
    const char* format;
    const char* family;
    std::vector<uint8_t> magic;
};

const std::vector<FileSignature>& fileSignatureTable();

// Formats whose magic is present at the buffer prefix, plus container
// signatures that readers accept away from offset 0 (ZIP end of central
// directory near the tail, PDF header inside the first KiB).
std::vector<std::string> detectFileSignatures(std::string_view data);

// Number of distinct signature families in a detectFileSignatures result.
size_t countSignatureFamilies(const std::vector<std::string>& formats);

// True type detection from bytes only. Dimensions come from the format
// header without decoding pixel data.
DetectedImage detectImageType(std::string_view data);

// Structural checks for executable headers found inside a larger buffer.
bool hasValidPeHeader(std::string_view data, size_t mz_offset);
bool hasValidElfHeader(std::string_view data, size_t elf_offset);

uint16_t readBe16(std::string_view data, size_t offset);
uint32_t readBe32(std::string_view data, size_t offset);
uint16_t readLe16(std::string_view data, size_t offset);
uint32_t readLe32(std::string_view data, size_t offset);

}}
