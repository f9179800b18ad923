#include <gnomon/imaging/transcoder.hpp>
#include <gnomon/imaging/color_convert_stage.hpp>
#include <gnomon/imaging/flatten_alpha_stage.hpp>
#include <gnomon/imaging/jpeg_encoder.hpp>
#include <gnomon/imaging/load_image.hpp>
#include <gnomon/imaging/resize_stage.hpp>
#include <gnomon/metadata/exif_block.hpp>
#include <gnomon/metadata/jpeg_segments.hpp>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace gnomon::imaging {

namespace nc = gnomon::core;

namespace {

bool write_file(const std::filesystem::path& path, std::span<const std::byte> bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  out.close();
  return static_cast<bool>(out);
}

}  // namespace

Transcoder::Transcoder(TranscodeOptions options, nc::IReporter& reporter)
    : options_(options), reporter_(reporter) {
  pipeline_.add_stage(std::make_unique<ResizeStage>(options_.max_width));
  pipeline_.add_stage(std::make_unique<FlattenAlphaStage>(Rgb{255, 255, 255}));
  pipeline_.add_stage(std::make_unique<ColorConvertStage>(nc::PixelFormat::BGR8));
}

std::expected<TranscodeResult, nc::PhotoError> Transcoder::fail(
    const std::filesystem::path& source, nc::PhotoError error) {
  reporter_.error("Error optimizing " + source.filename().string() + ": " +
                  std::string(nc::describe(error)));
  return std::unexpected(error);
}

std::expected<TranscodeResult, nc::PhotoError> Transcoder::transcode(
    const std::filesystem::path& source,
    const std::filesystem::path& destination) {
  return transcode(source, destination, gnomon::metadata::read_exif_block(source));
}

std::expected<TranscodeResult, nc::PhotoError> Transcoder::transcode(
    const std::filesystem::path& source,
    const std::filesystem::path& destination,
    const gnomon::metadata::ExifReadResult& exif) {
  auto loaded = load_frame_from_image(source);
  if (!loaded) return fail(source, loaded.error());

  auto frame = pipeline_.run(*loaded);
  if (!frame) return fail(source, frame.error());

  auto encoded = encode_jpeg(*frame, JpegOptions{options_.quality, true, true});
  if (!encoded) return fail(source, encoded.error());

  TranscodeResult result;
  result.width = frame->width();
  result.height = frame->height();

  std::vector<std::byte> bytes = std::move(*encoded);
  if (exif) {
    auto with_exif = gnomon::metadata::embed_exif_payload(bytes, exif->payload);
    if (with_exif) {
      bytes = std::move(*with_exif);
      result.metadata_attached = true;
    } else {
      reporter_.warning("EXIF of " + source.filename().string() + " not carried over (" +
                        std::string(nc::describe(with_exif.error())) + ")");
    }
  }

  if (!write_file(destination, bytes)) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    return fail(source, nc::PhotoError::WriteFailed);
  }

  result.bytes_written = bytes.size();
  return result;
}

}  // namespace gnomon::imaging
