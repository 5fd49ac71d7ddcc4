/**
 * @file test_zip.cpp
 * @brief ZipWriter/ZipReader container tests and Archiver behaviour.
 */

#include <gtest/gtest.h>

#include "pagezip/archiver.hpp"
#include "pagezip/errors.hpp"
#include "pagezip/zip.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace pagezip;

namespace {

Image make_image(size_t index, const std::string& name, Bytes content) {
    Image img;
    img.index = index;
    img.name = name;
    img.content = std::move(content);
    return img;
}

std::vector<Image> two_images() {
    std::vector<Image> images;
    images.push_back(make_image(0, "0-a.png", {0x89, 'P', 'N'}));
    images.push_back(make_image(1, "1-b.png", {0x00, 0xff}));
    return images;
}

} // namespace

class ArchiverMethodTest : public ::testing::TestWithParam<ZipWriter::Method> {};

TEST_P(ArchiverMethodTest, TwoImagesRoundTrip) {
    const Bytes blob = Archiver(GetParam()).pack(two_images());

    const auto entries = ZipReader::read(blob);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "0-a.png");
    EXPECT_EQ(entries[0].data, (Bytes{0x89, 'P', 'N'}));
    EXPECT_EQ(entries[1].name, "1-b.png");
    EXPECT_EQ(entries[1].data, (Bytes{0x00, 0xff}));
}

TEST_P(ArchiverMethodTest, BinaryAndEmptyPayloadsSurvive) {
    Bytes all(256 * 40);
    for (size_t i = 0; i < all.size(); ++i) all[i] = static_cast<std::uint8_t>((i * 131) ^ (i >> 3));

    std::vector<Image> images;
    images.push_back(make_image(0, "0-noise.bin", all));
    images.push_back(make_image(1, "1-empty.gif", {}));
    images.push_back(make_image(2, u8"2-café photo.jpg", {'x'}));

    const auto entries = ZipReader::read(Archiver(GetParam()).pack(images));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].data, all);
    EXPECT_TRUE(entries[1].data.empty());
    EXPECT_EQ(entries[2].name, u8"2-café photo.jpg");
}

INSTANTIATE_TEST_SUITE_P(Methods, ArchiverMethodTest,
                         ::testing::Values(ZipWriter::Method::Store, ZipWriter::Method::Deflate));

TEST(ArchiverTest, OutputIndependentOfArrivalOrder) {
    auto forward = two_images();
    auto reversed = two_images();
    std::swap(reversed[0], reversed[1]);

    const Archiver archiver;
    EXPECT_EQ(archiver.pack(forward), archiver.pack(reversed));
}

TEST(ArchiverTest, DuplicateNameIsArchiveFailure) {
    std::vector<Image> images;
    images.push_back(make_image(0, "0-a.png", {1}));
    images.push_back(make_image(1, "0-a.png", {2}));

    EXPECT_THROW(Archiver().pack(images), ArchiveFailure);
}

TEST(ArchiverTest, EmptySetProducesEmptyArchive) {
    const Bytes blob = Archiver().pack({});
    EXPECT_EQ(blob.size(), 22u) << "only the end-of-central-directory record";
    EXPECT_TRUE(ZipReader::read(blob).empty());
}

TEST(ZipWriterTest, StartsWithLocalHeaderSignature) {
    ZipWriter zip(ZipWriter::Method::Store);
    zip.add("hello.txt", {'h', 'i'});
    const Bytes blob = zip.finish();

    ASSERT_GE(blob.size(), 4u);
    EXPECT_EQ(blob[0], 'P');
    EXPECT_EQ(blob[1], 'K');
    EXPECT_EQ(blob[2], 0x03);
    EXPECT_EQ(blob[3], 0x04);
}

TEST(ZipWriterTest, RejectsEmptyNameAndUseAfterFinish) {
    ZipWriter zip;
    EXPECT_THROW(zip.add("", {1}), ArchiveFailure);
    zip.add("a", {1});
    EXPECT_EQ(zip.entry_count(), 1u);
    zip.finish();
    EXPECT_THROW(zip.add("b", {2}), ArchiveFailure);
    EXPECT_THROW(zip.finish(), ArchiveFailure);
}

TEST(ZipReaderTest, DetectsCorruptedPayload) {
    ZipWriter zip(ZipWriter::Method::Store);
    zip.add("0-a.png", {10, 20, 30});
    Bytes blob = zip.finish();

    // Local header is 30 bytes plus the 7-byte name; flip the first payload byte.
    blob[30 + 7] ^= 0xff;
    EXPECT_THROW(ZipReader::read(blob), ArchiveFailure);
}

TEST(ZipReaderTest, RejectsGarbage) {
    EXPECT_THROW(ZipReader::read(Bytes{1, 2, 3}), ArchiveFailure);
    EXPECT_THROW(ZipReader::read(Bytes(64, 0)), ArchiveFailure);
}
