#include <gnomon/core/error.hpp>

namespace gnomon::core {

std::string_view describe(PhotoError error) noexcept {
  switch (error) {
    case PhotoError::None:
      return "no error";
    case PhotoError::InvalidFrame:
      return "unsupported pixel layout";
    case PhotoError::LoadFailed:
      return "could not decode image";
    case PhotoError::EncodeFailed:
      return "JPEG encoding failed";
    case PhotoError::WriteFailed:
      return "could not write output file";
    case PhotoError::BackupFailed:
      return "could not copy original to backup";
    case PhotoError::MetadataUnavailable:
      return "no readable EXIF metadata";
    case PhotoError::MetadataTooLarge:
      return "EXIF block does not fit in a JPEG segment";
    case PhotoError::InvalidConfig:
      return "invalid configuration";
  }
  return "unknown error";
}

}  // namespace gnomon::core
