#pragma once

#include <gnomon/core/reporter.hpp>
#include <ostream>

namespace gnomon::app {

/// Prints run narration: progress and summary to out, warnings and errors to err.
class ConsoleReporter final : public gnomon::core::IReporter {
 public:
  ConsoleReporter(std::ostream& out, std::ostream& err);

  void run_started(const gnomon::core::RunPlan& plan) override;
  void no_images_found(const std::filesystem::path& input_dir) override;
  void file_started(const std::filesystem::path& source,
                    const std::string& output_name) override;
  void file_optimized(const std::filesystem::path& source,
                      std::uintmax_t original_size,
                      std::uintmax_t optimized_size) override;
  void warning(std::string_view message) override;
  void error(std::string_view message) override;
  void run_finished(const gnomon::core::RunStatistics& stats,
                    const gnomon::core::RunPlan& plan) override;

 private:
  std::ostream& out_;
  std::ostream& err_;
};

}  // namespace gnomon::app
