#include <gtest/gtest.h>
#include "threat_guard/image/metadata_reader.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace threat_guard;
using common::asView;
using image::MetadataReader;
using image::RegionKind;

namespace {

const image::MetadataField* findField(const image::ImageMetadata& metadata, const std::string& name) {
    auto it = std::find_if(metadata.text_fields.begin(), metadata.text_fields.end(),
                           [&name](const image::MetadataField& field) { return field.name == name; });
    return it == metadata.text_fields.end() ? nullptr : &*it;
}

}

TEST(MetadataReaderTest, ReadsJpegExifTextAndOrientation) {
    auto exif = test_util::makeExifPayload({{0x010F, "Canon"}, {0x010E, "holiday <script>"}}, 6);
    auto jpeg = test_util::makeJpegContainer(64, 48, {{0xE1, exif}});

    auto regions = MetadataReader::findRegions(asView(jpeg));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0].kind, RegionKind::EXIF);
    EXPECT_EQ(regions[0].label, "APP1");

    auto metadata = MetadataReader::readMetadata(asView(jpeg));
    ASSERT_TRUE(metadata.orientation.has_value());
    EXPECT_EQ(*metadata.orientation, 6);
    EXPECT_EQ(metadata.field_count, 2u);

    const auto* make = findField(metadata, "Exif.Image.Make");
    ASSERT_NE(make, nullptr);
    EXPECT_EQ(make->value, "Canon");

    const auto* description = findField(metadata, "Exif.Image.ImageDescription");
    ASSERT_NE(description, nullptr);
    EXPECT_EQ(description->value, "holiday <script>");
}

TEST(MetadataReaderTest, ShortAsciiTagsStoredInline) {
    common::Bytes payload = test_util::makeExifPayload({{0x0131, "v1"}});
    image::ImageMetadata metadata;
    MetadataReader::parseExif(asView(payload), metadata);

    const auto* software = findField(metadata, "Exif.Image.Software");
    ASSERT_NE(software, nullptr);
    EXPECT_EQ(software->value, "v1");
    EXPECT_FALSE(metadata.orientation.has_value());
}

TEST(MetadataReaderTest, ReadsJpegComment) {
    auto jpeg = test_util::makeJpegContainer(8, 8, {{0xFE, test_util::bytesOf("shot on a phone")}});
    auto metadata = MetadataReader::readMetadata(asView(jpeg));

    const auto* comment = findField(metadata, "Comment");
    ASSERT_NE(comment, nullptr);
    EXPECT_EQ(comment->value, "shot on a phone");
}

TEST(MetadataReaderTest, ClassifiesOtherAppSegments) {
    auto jpeg = test_util::makeJpegContainer(8, 8, {{0xE0, test_util::bytesOf("JFIF")},
                                                  {0xED, test_util::bytesOf("Photoshop 3.0")}});
    auto regions = MetadataReader::findRegions(asView(jpeg));

    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].kind, RegionKind::APPLICATION);
    EXPECT_EQ(regions[1].label, "APP13");

    auto metadata = MetadataReader::readMetadata(asView(jpeg));
    EXPECT_EQ(metadata.field_count, 0u);
}

TEST(MetadataReaderTest, ReadsPngTextChunks) {
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("Author", "Jane")},
        {"tIME", common::Bytes(7, 1)},
        {"tEXt", test_util::pngText("Comment", "visit http://example.com")}
    });

    auto regions = MetadataReader::findRegions(asView(png));
    ASSERT_EQ(regions.size(), 3u);
    EXPECT_EQ(regions[0].kind, RegionKind::TEXT);
    EXPECT_EQ(regions[1].kind, RegionKind::TIME);

    auto metadata = MetadataReader::readMetadata(asView(png));
    EXPECT_EQ(metadata.field_count, 2u);

    const auto* author = findField(metadata, "PNG.Author");
    ASSERT_NE(author, nullptr);
    EXPECT_EQ(author->value, "Jane");

    const auto* comment = findField(metadata, "PNG.Comment");
    ASSERT_NE(comment, nullptr);
    EXPECT_EQ(comment->value, "visit http://example.com");
}

TEST(MetadataReaderTest, ReadsUncompressedPngInternationalText) {
    common::Bytes itxt = test_util::bytesOf("Title");
    itxt.insert(itxt.end(), {0, 0, 0});
    auto lang = test_util::bytesOf("en");
    itxt.insert(itxt.end(), lang.begin(), lang.end());
    itxt.push_back(0);
    itxt.push_back(0);
    auto text = test_util::bytesOf("onload=run()");
    itxt.insert(itxt.end(), text.begin(), text.end());

    auto png = test_util::makePngContainer(4, 4, {{"iTXt", itxt}});
    auto metadata = MetadataReader::readMetadata(asView(png));

    const auto* title = findField(metadata, "PNG.Title");
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->value, "onload=run()");
}

TEST(MetadataReaderTest, ReadsPngExifChunk) {
    auto exif = test_util::makeExifPayload({{0x013B, "photographer"}}, 3);
    common::Bytes tiff(exif.begin() + 6, exif.end());
    auto png = test_util::makePngContainer(4, 4, {{"eXIf", tiff}});

    auto metadata = MetadataReader::readMetadata(asView(png));
    ASSERT_TRUE(metadata.orientation.has_value());
    EXPECT_EQ(*metadata.orientation, 3);
    ASSERT_NE(findField(metadata, "Exif.Image.Artist"), nullptr);
}

TEST(MetadataReaderTest, ReadsGifCommentExtension) {
    common::Bytes gif = test_util::bytesOf("GIF89a");
    gif.insert(gif.end(), {0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    gif.insert(gif.end(), {0x21, 0xFE, 0x05});
    auto comment = test_util::bytesOf("hello");
    gif.insert(gif.end(), comment.begin(), comment.end());
    gif.push_back(0x00);
    gif.push_back(0x3B);

    auto regions = MetadataReader::findRegions(asView(gif));
    ASSERT_EQ(regions.size(), 1u);
    EXPECT_EQ(regions[0].kind, RegionKind::COMMENT);

    auto metadata = MetadataReader::readMetadata(asView(gif));
    const auto* field = findField(metadata, "Comment");
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->value, "hello");
}

TEST(MetadataReaderTest, TruncatedInputKeepsPartialResults) {
    auto png = test_util::makePngContainer(16, 16, {
        {"tEXt", test_util::pngText("Author", "Jane")},
        {"tEXt", test_util::pngText("Comment", "second chunk")}
    });
    // Cut into the middle of the second text chunk.
    common::Bytes truncated(png.begin(), png.begin() + 8 + 25 + 23 + 10);

    auto metadata = MetadataReader::readMetadata(asView(truncated));
    EXPECT_EQ(metadata.field_count, 1u);

    auto jpeg = test_util::makeJpegContainer(8, 8, {{0xE1, test_util::makeExifPayload({{0x010F, "Nikon"}})}});
    common::Bytes cut(jpeg.begin(), jpeg.begin() + 12);
    EXPECT_TRUE(MetadataReader::findRegions(asView(cut)).empty());
}

TEST(MetadataReaderTest, MalformedExifIsIgnored) {
    image::ImageMetadata metadata;
    MetadataReader::parseExif(std::string_view("Exif\0\0XX*\0\x08\0\0\0", 14), metadata);
    MetadataReader::parseExif(std::string_view(), metadata);

    common::Bytes looping = {'I', 'I', 42, 0, 8, 0, 0, 0, 0xFF, 0xFF};
    MetadataReader::parseExif(asView(looping), metadata);

    EXPECT_EQ(metadata.field_count, 0u);
    EXPECT_FALSE(metadata.orientation.has_value());
}

TEST(MetadataReaderTest, NonImageHasNoRegions) {
    auto text = test_util::bytesOf("plain text body");
    EXPECT_TRUE(MetadataReader::findRegions(asView(text)).empty());
    EXPECT_EQ(MetadataReader::readMetadata(asView(text)).field_count, 0u);
}
