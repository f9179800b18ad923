#pragma once

#include <gnomon/core/run_statistics.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace gnomon::core {

/// Settings of one batch run, announced before the first file is processed.
struct RunPlan {
  std::size_t file_count{0};
  std::filesystem::path input_dir;
  std::filesystem::path output_dir;
  std::filesystem::path backup_dir;
  std::string event;
  std::uint32_t max_width{0};
  int quality{0};
};

/// Narration sink for a batch run. Components report through this interface and
/// never write to streams themselves. Calls arrive on the single control thread.
class IReporter {
 public:
  virtual ~IReporter() = default;

  virtual void run_started(const RunPlan& plan) = 0;
  virtual void no_images_found(const std::filesystem::path& input_dir) = 0;
  virtual void file_started(const std::filesystem::path& source,
                            const std::string& output_name) = 0;
  virtual void file_optimized(const std::filesystem::path& source,
                              std::uintmax_t original_size,
                              std::uintmax_t optimized_size) = 0;
  /// Recoverable condition; processing of the current file continues.
  virtual void warning(std::string_view message) = 0;
  /// The current file failed and is skipped.
  virtual void error(std::string_view message) = 0;
  virtual void run_finished(const RunStatistics& stats, const RunPlan& plan) = 0;
};

}  // namespace gnomon::core
