#pragma once

#include <gnomon/core/error.hpp>
#include <gnomon/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace gnomon::imaging {

struct JpegOptions {
  int quality{82};  // 1-100
  bool optimize{true};
  bool progressive{true};
};

/// Encode a BGR8 or Grayscale8 frame as a JPEG byte stream.
/// InvalidFrame for any other format, EncodeFailed if the encoder rejects it.
[[nodiscard]] std::expected<std::vector<std::byte>, gnomon::core::PhotoError>
encode_jpeg(const gnomon::core::Frame& frame, const JpegOptions& options);

}  // namespace gnomon::imaging
