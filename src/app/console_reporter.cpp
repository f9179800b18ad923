#include <gnomon/app/console_reporter.hpp>
#include <iomanip>
#include <sstream>
#include <string>

namespace gnomon::app {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;
constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

std::string fixed(double value, int precision) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << value;
  return os.str();
}

std::string reduction_text(const std::optional<double>& percent) {
  if (!percent) return "reduction n/a";
  return fixed(*percent, 1) + "% reduction";
}

}  // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

void ConsoleReporter::run_started(const gnomon::core::RunPlan& plan) {
  out_ << "\nFound " << plan.file_count << " photos to process\n"
       << "Output directory: " << plan.output_dir.string() << "\n"
       << "Backup directory: " << plan.backup_dir.string() << "\n"
       << "Event name: " << plan.event << "\n"
       << "Max width: " << plan.max_width << "px\n"
       << "Quality: " << plan.quality << "%\n\n";
}

void ConsoleReporter::no_images_found(const std::filesystem::path& input_dir) {
  out_ << "No image files found in " << input_dir.string() << "\n";
}

void ConsoleReporter::file_started(const std::filesystem::path& source,
                                   const std::string& output_name) {
  out_ << "Processing: " << source.filename().string() << " -> " << output_name << "\n";
}

void ConsoleReporter::file_optimized(const std::filesystem::path&,
                                     std::uintmax_t original_size,
                                     std::uintmax_t optimized_size) {
  const auto percent =
      gnomon::core::RunStatistics::reduction_percent(original_size, optimized_size);
  out_ << "  OK " << fixed(static_cast<double>(original_size) / kMiB, 1) << " MB -> "
       << fixed(static_cast<double>(optimized_size) / kMiB, 1) << " MB ("
       << reduction_text(percent) << ")\n";
}

void ConsoleReporter::warning(std::string_view message) {
  err_ << "  Warning: " << message << "\n";
}

void ConsoleReporter::error(std::string_view message) {
  err_ << "  Error: " << message << "\n";
}

void ConsoleReporter::run_finished(const gnomon::core::RunStatistics& stats,
                                   const gnomon::core::RunPlan& plan) {
  const std::string rule(60, '=');
  out_ << "\n" << rule << "\n"
       << "Successfully processed: " << stats.succeeded << " photos\n";
  if (stats.failed > 0) {
    out_ << "Failed: " << stats.failed << " photos\n";
  }
  out_ << "\nStorage summary:\n"
       << "   Original total:  " << fixed(static_cast<double>(stats.original_bytes) / kGiB, 2)
       << " GB\n"
       << "   Optimized total: " << fixed(static_cast<double>(stats.optimized_bytes) / kGiB, 2)
       << " GB\n"
       << "   Space saved:     " << fixed(static_cast<double>(stats.saved_bytes()) / kGiB, 2)
       << " GB (" << reduction_text(stats.reduction_percent()) << ")\n"
       << "\nOptimized photos: " << plan.output_dir.string() << "\n"
       << "Original backups: " << plan.backup_dir.string() << "\n"
       << rule << "\n\n";
}

}  // namespace gnomon::app
