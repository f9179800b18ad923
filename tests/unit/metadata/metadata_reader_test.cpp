#include <gnomon/metadata/exif_block.hpp>
#include <gnomon/metadata/jpeg_segments.hpp>
#include <gnomon/metadata/metadata_reader.hpp>
#include "support/recording_reporter.hpp"
#include "support/test_images.hpp"
#include <gtest/gtest.h>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nm = gnomon::metadata;
namespace nc = gnomon::core;
namespace gt = gnomon::test;

TEST(ExifBlock, JpegPayloadIsRawSegmentBody) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 32, 24);
  gt::set_exif_datetimes(photo, "2024:12:21 08:00:00");

  auto block = nm::read_exif_block(photo);
  ASSERT_TRUE(block.has_value());
  ASSERT_TRUE(block->date_time_original.has_value());
  EXPECT_FALSE(block->date_time_digitized.has_value());

  auto raw = nm::find_exif_payload(gt::read_bytes(photo));
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(block->payload, *raw);
}

TEST(ExifBlock, MissingExifIsUnavailable) {
  gt::TempDir dir;
  const auto photo = dir.path() / "plain.jpg";
  gt::write_jpeg(photo, 16, 16);
  auto block = nm::read_exif_block(photo);
  ASSERT_FALSE(block.has_value());
  EXPECT_EQ(block.error(), nc::PhotoError::MetadataUnavailable);
}

TEST(ExifBlock, CorruptFileIsUnavailable) {
  gt::TempDir dir;
  const auto photo = dir.path() / "broken.jpg";
  gt::write_bytes(photo, "this is not an image");
  auto block = nm::read_exif_block(photo);
  ASSERT_FALSE(block.has_value());
  EXPECT_EQ(block.error(), nc::PhotoError::MetadataUnavailable);
}

TEST(ExifBlock, GuardTurnsStdExceptionsIntoUnavailable) {
  auto overflow = nm::guard_exif_read([]() -> nm::ExifReadResult {
    throw std::overflow_error("IFD offset overflow");
  });
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error(), nc::PhotoError::MetadataUnavailable);

  auto out_of_range = nm::guard_exif_read([]() -> nm::ExifReadResult {
    throw std::out_of_range("tag index");
  });
  ASSERT_FALSE(out_of_range.has_value());
  EXPECT_EQ(out_of_range.error(), nc::PhotoError::MetadataUnavailable);

  auto alloc = nm::guard_exif_read([]() -> nm::ExifReadResult { throw std::bad_alloc(); });
  ASSERT_FALSE(alloc.has_value());
  EXPECT_EQ(alloc.error(), nc::PhotoError::MetadataUnavailable);
}

TEST(ExifBlock, GuardPassesResultThrough) {
  auto ok = nm::guard_exif_read([]() -> nm::ExifReadResult {
    nm::ExifBlock block;
    block.date_time_original = "2024:12:21 08:00:00";
    return block;
  });
  ASSERT_TRUE(ok.has_value());
  ASSERT_TRUE(ok->date_time_original.has_value());
  EXPECT_EQ(*ok->date_time_original, "2024:12:21 08:00:00");

  auto missing = nm::guard_exif_read([]() -> nm::ExifReadResult {
    return std::unexpected(nc::PhotoError::MetadataUnavailable);
  });
  ASSERT_FALSE(missing.has_value());
}

TEST(MetadataReader, PrefersDateTimeOriginal) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 32, 24);
  gt::set_exif_datetimes(photo, "2024:12:21 08:00:00", "2024:12:22 09:30:00");

  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::DateTimeOriginal);
  EXPECT_EQ(reading.timestamp, (nc::CaptureTimestamp{2024, 12, 21, 8, 0, 0}));
  EXPECT_TRUE(reporter.warnings.empty());
}

TEST(MetadataReader, FallsBackToDigitized) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 32, 24);
  gt::set_exif_datetimes(photo, std::nullopt, "2025:03:20 09:01:02");

  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::DateTimeDigitized);
  EXPECT_EQ(reading.timestamp, (nc::CaptureTimestamp{2025, 3, 20, 9, 1, 2}));
  EXPECT_TRUE(reporter.warnings.empty());
}

TEST(MetadataReader, MalformedOriginalSkippedForDigitized) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 32, 24);
  gt::set_exif_datetimes(photo, "sometime in december", "2024:12:21 10:10:10");

  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::DateTimeDigitized);
  EXPECT_EQ(reading.timestamp.hour, 10);
}

TEST(MetadataReader, NoTimestampTagsUseModificationTime) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 32, 24);
  gt::set_exif_datetimes(photo, std::nullopt, std::nullopt);
  const nc::CaptureTimestamp mtime{2023, 6, 21, 5, 45, 12};
  gt::set_mtime(photo, mtime);

  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::FileModified);
  EXPECT_EQ(reading.timestamp, mtime);
  ASSERT_EQ(reporter.warnings.size(), 1u);
  EXPECT_NE(reporter.warnings[0].find("a.jpg"), std::string::npos);
}

TEST(MetadataReader, UnreadableMetadataUsesModificationTime) {
  gt::TempDir dir;
  const auto photo = dir.path() / "broken.jpg";
  gt::write_bytes(photo, "garbage");
  const nc::CaptureTimestamp mtime{2022, 12, 22, 6, 15, 30};
  gt::set_mtime(photo, mtime);

  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::FileModified);
  EXPECT_EQ(reading.timestamp, mtime);
  ASSERT_EQ(reporter.warnings.size(), 1u);
  EXPECT_NE(reporter.warnings[0].find("broken.jpg"), std::string::npos);
}

TEST(MetadataReader, CustomProvidersTriedInOrder) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 8, 8);
  gt::set_exif_datetimes(photo, "2024:12:21 08:00:00", "2024:12:21 09:00:00");

  std::vector<nm::TimestampProvider> providers = {
      {nm::TimestampOrigin::DateTimeOriginal,
       [](const nm::ExifBlock&) { return std::optional<nc::CaptureTimestamp>{}; }},
      {nm::TimestampOrigin::DateTimeDigitized,
       [](const nm::ExifBlock& b) {
         return nc::parse_exif_datetime(b.date_time_digitized.value_or(""));
       }},
  };
  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter, std::move(providers));
  auto reading = reader.read(photo);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::DateTimeDigitized);
  EXPECT_EQ(reading.timestamp.hour, 9);
}

TEST(MetadataReader, MissingFileDoesNotThrow) {
  gt::TempDir dir;
  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  EXPECT_NO_THROW({
    auto reading = reader.read(dir.path() / "gone.jpg");
    EXPECT_EQ(reading.origin, nm::TimestampOrigin::FileModified);
  });
  EXPECT_EQ(reporter.warnings.size(), 1u);
}

TEST(MetadataReader, ThrowingExifReadFallsBackToModificationTime) {
  gt::TempDir dir;
  const auto photo = dir.path() / "crafted.jpg";
  gt::write_jpeg(photo, 8, 8);
  const nc::CaptureTimestamp mtime{2023, 3, 20, 21, 24, 0};
  gt::set_mtime(photo, mtime);

  const auto exif = nm::guard_exif_read([]() -> nm::ExifReadResult {
    throw std::overflow_error("IFD offset overflow");
  });
  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  EXPECT_NO_THROW({
    auto reading = reader.read(photo, exif);
    EXPECT_EQ(reading.origin, nm::TimestampOrigin::FileModified);
    EXPECT_EQ(reading.timestamp, mtime);
  });
  ASSERT_EQ(reporter.warnings.size(), 1u);
  EXPECT_NE(reporter.warnings[0].find("crafted.jpg"), std::string::npos);
}

TEST(MetadataReader, UsesBlockAlreadyRead) {
  gt::TempDir dir;
  const auto photo = dir.path() / "a.jpg";
  gt::write_jpeg(photo, 8, 8);

  nm::ExifBlock block;
  block.date_time_digitized = "2024:03:20 03:06:00";
  gt::RecordingReporter reporter;
  nm::MetadataReader reader(reporter);
  auto reading = reader.read(photo, block);
  EXPECT_EQ(reading.origin, nm::TimestampOrigin::DateTimeDigitized);
  EXPECT_EQ(reading.timestamp, (nc::CaptureTimestamp{2024, 3, 20, 3, 6, 0}));
  EXPECT_TRUE(reporter.warnings.empty());
}
