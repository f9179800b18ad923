#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/pipeline.hpp>
#include <gnomon/core/reporter.hpp>
#include <gnomon/metadata/exif_block.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace gnomon::imaging {

struct TranscodeOptions {
  std::uint32_t max_width{1920};
  int quality{82};  // 1-100
};

struct TranscodeResult {
  std::uint32_t width{0};
  std::uint32_t height{0};
  std::uintmax_t bytes_written{0};
  bool metadata_attached{false};
};

/// Produces the gallery JPEG for one source image:
/// load -> resize to max width -> flatten alpha onto white -> BGR -> progressive,
/// optimized JPEG at the configured quality, with the source EXIF block reattached
/// when it can be read. Failures are reported with the file name and returned;
/// a partially written destination is removed.
class Transcoder {
 public:
  Transcoder(TranscodeOptions options, gnomon::core::IReporter& reporter);

  [[nodiscard]] std::expected<TranscodeResult, gnomon::core::PhotoError> transcode(
      const std::filesystem::path& source,
      const std::filesystem::path& destination);

  /// Same, reattaching an EXIF block already read from source. A failed read
  /// only means the output carries no metadata.
  [[nodiscard]] std::expected<TranscodeResult, gnomon::core::PhotoError> transcode(
      const std::filesystem::path& source,
      const std::filesystem::path& destination,
      const gnomon::metadata::ExifReadResult& exif);

  [[nodiscard]] const TranscodeOptions& options() const noexcept { return options_; }

 private:
  std::expected<TranscodeResult, gnomon::core::PhotoError> fail(
      const std::filesystem::path& source, gnomon::core::PhotoError error);

  TranscodeOptions options_;
  gnomon::core::IReporter& reporter_;
  gnomon::core::Pipeline pipeline_;
};

}  // namespace gnomon::imaging
