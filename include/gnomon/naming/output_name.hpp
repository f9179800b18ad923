#pragma once

#include <gnomon/core/capture_timestamp.hpp>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace gnomon::naming {

/// Extension of every output file.
inline constexpr std::string_view kOutputExtension = ".jpg";

/// Returns true if a file name is already taken.
using NameTakenPredicate = std::function<bool(const std::string& file_name)>;

/// "<event>-YYYY-MM-DD-HHMM", the stem shared by all candidates for one photo.
[[nodiscard]] std::string base_stem(std::string_view event,
                                    const gnomon::core::CaptureTimestamp& ts);

/// First of "<stem>.jpg", "<stem>-1.jpg", "<stem>-2.jpg", ... for which taken()
/// is false. taken() is re-evaluated for every candidate; nothing is reserved.
[[nodiscard]] std::string unique_name(std::string_view stem,
                                      const NameTakenPredicate& taken);

/// unique_name against the entries of output_dir; returns output_dir / name.
[[nodiscard]] std::filesystem::path derive_output_path(
    const std::filesystem::path& output_dir,
    std::string_view event,
    const gnomon::core::CaptureTimestamp& ts);

}  // namespace gnomon::naming
