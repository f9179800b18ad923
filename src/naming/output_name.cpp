#include <gnomon/naming/output_name.hpp>
#include <cstddef>
#include <system_error>

namespace gnomon::naming {

std::string base_stem(std::string_view event, const gnomon::core::CaptureTimestamp& ts) {
  std::string stem(event);
  stem += '-';
  stem += gnomon::core::format_name_stamp(ts);
  return stem;
}

std::string unique_name(std::string_view stem, const NameTakenPredicate& taken) {
  std::string candidate = std::string(stem) + std::string(kOutputExtension);
  for (std::size_t counter = 1; taken && taken(candidate); ++counter) {
    candidate = std::string(stem) + "-" + std::to_string(counter) +
                std::string(kOutputExtension);
  }
  return candidate;
}

std::filesystem::path derive_output_path(const std::filesystem::path& output_dir,
                                         std::string_view event,
                                         const gnomon::core::CaptureTimestamp& ts) {
  const auto exists_in_output = [&output_dir](const std::string& file_name) {
    // A stat error counts as free; the write that follows reports it.
    std::error_code ec;
    return std::filesystem::exists(output_dir / file_name, ec);
  };
  return output_dir / unique_name(base_stem(event, ts), exists_in_output);
}

}  // namespace gnomon::naming
