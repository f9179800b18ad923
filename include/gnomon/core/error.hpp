#pragma once

#include <string_view>

namespace gnomon::core {

/// Per-file error codes; used with std::expected for recoverable failures.
enum class PhotoError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  EncodeFailed,
  WriteFailed,
  BackupFailed,
  MetadataUnavailable,
  MetadataTooLarge,
  InvalidConfig,
};

/// Short human-readable description for reporting.
[[nodiscard]] std::string_view describe(PhotoError error) noexcept;

}  // namespace gnomon::core
