#include <gnomon/metadata/jpeg_segments.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace nm = gnomon::metadata;
namespace nc = gnomon::core;

namespace {

std::vector<std::byte> bytes(std::initializer_list<int> values) {
  std::vector<std::byte> out;
  for (int v : values) out.push_back(static_cast<std::byte>(v));
  return out;
}

void append(std::vector<std::byte>& out, const std::vector<std::byte>& more) {
  out.insert(out.end(), more.begin(), more.end());
}

/// SOI, APP0 "JFIF", SOS with two scan bytes, EOI.
std::vector<std::byte> minimal_jpeg() {
  std::vector<std::byte> out = bytes({0xFF, 0xD8});
  append(out, bytes({0xFF, 0xE0, 0x00, 0x07, 'J', 'F', 'I', 'F', 0x00}));
  append(out, bytes({0xFF, 0xDA, 0x00, 0x02, 0x12, 0x34, 0xFF, 0xD9}));
  return out;
}

std::vector<std::byte> exif_segment(const std::vector<std::byte>& payload) {
  const std::size_t length = payload.size() + 8;
  std::vector<std::byte> out = bytes({0xFF, 0xE1, static_cast<int>(length >> 8),
                                      static_cast<int>(length & 0xFF), 'E', 'x', 'i', 'f', 0, 0});
  append(out, payload);
  return out;
}

}  // namespace

TEST(JpegSegments, NoExifInPlainJpeg) {
  EXPECT_FALSE(nm::find_exif_payload(minimal_jpeg()).has_value());
}

TEST(JpegSegments, NotAJpeg) {
  EXPECT_FALSE(nm::find_exif_payload(bytes({0x89, 'P', 'N', 'G', 0, 0})).has_value());
  auto embedded = nm::embed_exif_payload(bytes({0x89, 'P', 'N', 'G'}), bytes({1, 2}));
  ASSERT_FALSE(embedded.has_value());
  EXPECT_EQ(embedded.error(), nc::PhotoError::EncodeFailed);
}

TEST(JpegSegments, EmbedPlacesExifAfterJfif) {
  const auto payload = bytes({'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00});
  auto embedded = nm::embed_exif_payload(minimal_jpeg(), payload);
  ASSERT_TRUE(embedded.has_value());

  std::vector<std::byte> expected = bytes({0xFF, 0xD8});
  append(expected, bytes({0xFF, 0xE0, 0x00, 0x07, 'J', 'F', 'I', 'F', 0x00}));
  append(expected, exif_segment(payload));
  append(expected, bytes({0xFF, 0xDA, 0x00, 0x02, 0x12, 0x34, 0xFF, 0xD9}));
  EXPECT_EQ(*embedded, expected);
}

TEST(JpegSegments, EmbeddedPayloadIsFoundVerbatim) {
  std::vector<std::byte> payload;
  for (int i = 0; i < 300; ++i) payload.push_back(static_cast<std::byte>(i & 0xFF));
  auto embedded = nm::embed_exif_payload(minimal_jpeg(), payload);
  ASSERT_TRUE(embedded.has_value());
  auto found = nm::find_exif_payload(*embedded);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, payload);
}

TEST(JpegSegments, ExistingExifIsReplaced) {
  std::vector<std::byte> jpeg = bytes({0xFF, 0xD8});
  append(jpeg, exif_segment(bytes({9, 9, 9})));
  append(jpeg, bytes({0xFF, 0xDA, 0x00, 0x02, 0xFF, 0xD9}));

  auto embedded = nm::embed_exif_payload(jpeg, bytes({1, 2, 3, 4}));
  ASSERT_TRUE(embedded.has_value());
  auto found = nm::find_exif_payload(*embedded);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, bytes({1, 2, 3, 4}));
  EXPECT_EQ(embedded->size(), jpeg.size() + 1);
}

TEST(JpegSegments, OversizedPayloadRejected) {
  std::vector<std::byte> payload(nm::kMaxExifPayload + 1);
  auto embedded = nm::embed_exif_payload(minimal_jpeg(), payload);
  ASSERT_FALSE(embedded.has_value());
  EXPECT_EQ(embedded.error(), nc::PhotoError::MetadataTooLarge);

  std::vector<std::byte> largest(nm::kMaxExifPayload);
  EXPECT_TRUE(nm::embed_exif_payload(minimal_jpeg(), largest).has_value());
}
