#include <gnomon/metadata/jpeg_segments.hpp>
#include <array>
#include <cstdint>
#include <cstring>

namespace gnomon::metadata {

namespace {

constexpr std::uint8_t kMarkerPrefix = 0xFF;
constexpr std::uint8_t kSoi = 0xD8;
constexpr std::uint8_t kEoi = 0xD9;
constexpr std::uint8_t kSos = 0xDA;
constexpr std::uint8_t kApp0 = 0xE0;
constexpr std::uint8_t kApp1 = 0xE1;
constexpr std::array<std::uint8_t, 6> kExifHeader = {'E', 'x', 'i', 'f', 0, 0};

/// One marker segment in the header part of a JPEG stream.
struct Segment {
  std::size_t offset{0};  // position of the 0xFF prefix
  std::size_t size{0};    // marker + length field + body
  std::uint8_t marker{0};
};

std::uint8_t at(std::span<const std::byte> data, std::size_t pos) {
  return static_cast<std::uint8_t>(data[pos]);
}

bool is_soi(std::span<const std::byte> data) {
  return data.size() >= 4 && at(data, 0) == kMarkerPrefix && at(data, 1) == kSoi;
}

/// Header segments from just after SOI up to, not including, SOS or EOI.
/// Returns the offset where the walk stopped through end_offset.
std::vector<Segment> header_segments(std::span<const std::byte> data,
                                     std::size_t& end_offset) {
  std::vector<Segment> segments;
  std::size_t pos = 2;
  while (pos + 4 <= data.size()) {
    if (at(data, pos) != kMarkerPrefix) break;
    const std::uint8_t marker = at(data, pos + 1);
    if (marker == kMarkerPrefix) {  // fill byte
      ++pos;
      continue;
    }
    if (marker == kSos || marker == kEoi) break;

    const std::size_t length =
        (static_cast<std::size_t>(at(data, pos + 2)) << 8) | at(data, pos + 3);
    if (length < 2 || pos + 2 + length > data.size()) break;

    segments.push_back({pos, 2 + length, marker});
    pos += 2 + length;
  }
  end_offset = pos;
  return segments;
}

bool is_exif_segment(std::span<const std::byte> data, const Segment& seg) {
  if (seg.marker != kApp1 || seg.size < 4 + kExifHeader.size()) return false;
  return std::memcmp(data.data() + seg.offset + 4, kExifHeader.data(),
                     kExifHeader.size()) == 0;
}

void append(std::vector<std::byte>& out, std::span<const std::byte> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace

std::optional<std::vector<std::byte>> find_exif_payload(
    std::span<const std::byte> jpeg) {
  if (!is_soi(jpeg)) return std::nullopt;

  std::size_t end_offset = 0;
  for (const Segment& seg : header_segments(jpeg, end_offset)) {
    if (!is_exif_segment(jpeg, seg)) continue;
    const std::size_t body = seg.offset + 4 + kExifHeader.size();
    const std::size_t body_size = seg.size - 4 - kExifHeader.size();
    auto first = jpeg.begin() + static_cast<std::ptrdiff_t>(body);
    return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(body_size));
  }
  return std::nullopt;
}

std::expected<std::vector<std::byte>, gnomon::core::PhotoError>
embed_exif_payload(std::span<const std::byte> jpeg, std::span<const std::byte> payload) {
  using gnomon::core::PhotoError;

  if (!is_soi(jpeg)) {
    return std::unexpected(PhotoError::EncodeFailed);
  }
  if (payload.empty()) {
    return std::unexpected(PhotoError::MetadataUnavailable);
  }
  if (payload.size() > kMaxExifPayload) {
    return std::unexpected(PhotoError::MetadataTooLarge);
  }

  std::size_t end_offset = 0;
  const std::vector<Segment> segments = header_segments(jpeg, end_offset);

  std::vector<std::byte> out;
  out.reserve(jpeg.size() + payload.size() + 10);
  append(out, jpeg.first(2));

  std::size_t next = 0;
  if (!segments.empty() && segments[0].marker == kApp0) {
    append(out, jpeg.subspan(segments[0].offset, segments[0].size));
    next = 1;
  }

  const std::size_t length = 2 + kExifHeader.size() + payload.size();
  out.push_back(std::byte{kMarkerPrefix});
  out.push_back(std::byte{kApp1});
  out.push_back(static_cast<std::byte>((length >> 8) & 0xFF));
  out.push_back(static_cast<std::byte>(length & 0xFF));
  for (std::uint8_t b : kExifHeader) out.push_back(static_cast<std::byte>(b));
  append(out, payload);

  for (std::size_t i = next; i < segments.size(); ++i) {
    if (is_exif_segment(jpeg, segments[i])) continue;
    append(out, jpeg.subspan(segments[i].offset, segments[i].size));
  }
  append(out, jpeg.subspan(end_offset));
  return out;
}

}  // namespace gnomon::metadata
