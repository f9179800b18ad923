#include <gnomon/metadata/exif_block.hpp>
#include <gnomon/metadata/jpeg_segments.hpp>
#include <exiv2/exiv2.hpp>
#include <exception>
#include <fstream>
#include <string_view>
#include <utility>

namespace gnomon::metadata {

namespace {

constexpr std::string_view kDateTimeOriginal = "Exif.Photo.DateTimeOriginal";
constexpr std::string_view kDateTimeDigitized = "Exif.Photo.DateTimeDigitized";

std::optional<std::string> find_text(const Exiv2::ExifData& exif, std::string_view key) {
  auto pos = exif.findKey(Exiv2::ExifKey(std::string(key)));
  if (pos == exif.end()) return std::nullopt;
  return pos->toString();
}

std::optional<std::vector<std::byte>> read_file_bytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) return std::nullopt;
  const std::streamsize size = in.tellg();
  if (size < 0) return std::nullopt;
  std::vector<std::byte> bytes(static_cast<std::size_t>(size));
  in.seekg(0);
  if (!in.read(reinterpret_cast<char*>(bytes.data()), size)) return std::nullopt;
  return bytes;
}

std::vector<std::byte> serialize(Exiv2::Image& image) {
  Exiv2::ByteOrder order = image.byteOrder();
  if (order == Exiv2::invalidByteOrder) order = Exiv2::littleEndian;

  Exiv2::Blob blob;
  Exiv2::ExifParser::encode(blob, order, image.exifData());
  std::vector<std::byte> out(blob.size());
  for (std::size_t i = 0; i < blob.size(); ++i) {
    out[i] = static_cast<std::byte>(blob[i]);
  }
  return out;
}

}  // namespace

ExifReadResult guard_exif_read(const std::function<ExifReadResult()>& read) {
  try {
    return read();
  } catch (const std::exception&) {
    // Exiv2::Error, and std errors thrown from Exiv2 internals or allocation.
    return std::unexpected(gnomon::core::PhotoError::MetadataUnavailable);
  }
}

ExifReadResult read_exif_block(const std::filesystem::path& path) {
  using gnomon::core::PhotoError;

  return guard_exif_read([&path]() -> ExifReadResult {
    auto image = Exiv2::ImageFactory::open(path.string());
    if (image.get() == nullptr) {
      return std::unexpected(PhotoError::MetadataUnavailable);
    }
    image->readMetadata();

    Exiv2::ExifData& exif = image->exifData();
    if (exif.empty()) {
      return std::unexpected(PhotoError::MetadataUnavailable);
    }

    ExifBlock block;
    block.date_time_original = find_text(exif, kDateTimeOriginal);
    block.date_time_digitized = find_text(exif, kDateTimeDigitized);

    if (image->mimeType() == "image/jpeg") {
      if (auto bytes = read_file_bytes(path)) {
        if (auto payload = find_exif_payload(*bytes)) {
          block.payload = std::move(*payload);
        }
      }
    }
    if (block.payload.empty()) {
      block.payload = serialize(*image);
    }
    return block;
  });
}

}  // namespace gnomon::metadata
