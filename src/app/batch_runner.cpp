#include <gnomon/app/batch_runner.hpp>
#include <gnomon/imaging/transcoder.hpp>
#include <gnomon/metadata/exif_block.hpp>
#include <gnomon/metadata/metadata_reader.hpp>
#include <gnomon/naming/output_name.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gnomon::app {

namespace fs = std::filesystem;
namespace nc = gnomon::core;

namespace {

constexpr std::array<std::string_view, 6> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".JPG", ".JPEG", ".PNG",
};

fs::path normalized_dir(const fs::path& dir) {
  std::error_code ec;
  fs::path abs = fs::absolute(dir, ec);
  if (ec) abs = dir;
  abs = abs.lexically_normal();
  if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
    abs = abs.parent_path();
  }
  return abs;
}

/// Remove an optimized output whose original could not be backed up.
void discard_output(const fs::path& output) {
  std::error_code ec;
  fs::remove(output, ec);
}

/// Processes one file and returns (original size, optimized size).
std::expected<std::pair<std::uintmax_t, std::uintmax_t>, nc::PhotoError> process_file(
    const fs::path& source,
    const OptimizeConfig& config,
    const fs::path& output_dir,
    const fs::path& backup_dir,
    const gnomon::metadata::MetadataReader& metadata_reader,
    gnomon::imaging::Transcoder& transcoder,
    nc::IReporter& reporter) {
  const auto exif = gnomon::metadata::read_exif_block(source);
  const auto reading = metadata_reader.read(source, exif);
  const fs::path output =
      gnomon::naming::derive_output_path(output_dir, config.event, reading.timestamp);

  std::error_code ec;
  const std::uintmax_t original_size = fs::file_size(source, ec);
  if (ec) {
    reporter.error("Error processing " + source.filename().string() + ": " + ec.message());
    return std::unexpected(nc::PhotoError::LoadFailed);
  }

  reporter.file_started(source, output.filename().string());
  auto transcoded = transcoder.transcode(source, output, exif);
  if (!transcoded) {
    return std::unexpected(transcoded.error());
  }

  auto backup = backup_original(source, backup_dir);
  if (!backup) {
    reporter.error("Error backing up " + source.filename().string() + ": " +
                   std::string(nc::describe(backup.error())) + "; removed " +
                   output.filename().string());
    discard_output(output);
    return std::unexpected(backup.error());
  }

  reporter.file_optimized(source, original_size, transcoded->bytes_written);
  return std::pair{original_size, transcoded->bytes_written};
}

}  // namespace

fs::path backup_dir_for(const fs::path& output_dir) {
  const fs::path dir = normalized_dir(output_dir);
  return dir.parent_path() / (dir.filename().string() + "_originals");
}

bool is_source_image(const fs::path& path) {
  const std::string ext = path.extension().string();
  return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) !=
         kImageExtensions.end();
}

std::expected<std::vector<fs::path>, nc::PhotoError> list_source_images(
    const fs::path& input_dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || entry_ec) continue;
    if (is_source_image(it->path())) files.push_back(it->path());
  }
  if (ec) return std::unexpected(nc::PhotoError::LoadFailed);

  std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return files;
}

std::expected<fs::path, nc::PhotoError> backup_original(const fs::path& source,
                                                        const fs::path& backup_dir) {
  const fs::path target = backup_dir / source.filename();
  std::error_code ec;
  fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
  if (ec) return std::unexpected(nc::PhotoError::BackupFailed);

  const auto mtime = fs::last_write_time(source, ec);
  if (!ec) fs::last_write_time(target, mtime, ec);
  if (ec) return std::unexpected(nc::PhotoError::BackupFailed);

  const auto perms = fs::status(source, ec).permissions();
  if (!ec) fs::permissions(target, perms, fs::perm_options::replace, ec);
  if (ec) return std::unexpected(nc::PhotoError::BackupFailed);

  return target;
}

std::expected<nc::RunStatistics, nc::PhotoError> run_batch(const OptimizeConfig& config,
                                                           nc::IReporter& reporter) {
  nc::RunPlan plan;
  plan.input_dir = config.input_dir;
  plan.output_dir = config.output_dir;
  plan.backup_dir = backup_dir_for(config.output_dir);
  plan.event = config.event;
  plan.max_width = static_cast<std::uint32_t>(std::max(config.max_width, 1));
  plan.quality = config.quality;

  std::error_code ec;
  fs::create_directories(plan.output_dir, ec);
  if (ec) return std::unexpected(nc::PhotoError::WriteFailed);
  fs::create_directories(plan.backup_dir, ec);
  if (ec) return std::unexpected(nc::PhotoError::WriteFailed);

  auto files = list_source_images(config.input_dir);
  if (!files) return std::unexpected(files.error());

  nc::RunStatistics stats;
  plan.file_count = files->size();
  if (files->empty()) {
    reporter.no_images_found(config.input_dir);
  } else {
    reporter.run_started(plan);
  }

  const gnomon::metadata::MetadataReader metadata_reader(reporter);
  gnomon::imaging::Transcoder transcoder(
      gnomon::imaging::TranscodeOptions{plan.max_width, config.quality}, reporter);

  for (const fs::path& source : *files) {
    try {
      auto sizes = process_file(source, config, plan.output_dir, plan.backup_dir,
                                metadata_reader, transcoder, reporter);
      if (sizes) {
        stats.record_success(sizes->first, sizes->second);
      } else {
        stats.record_failure();
      }
    } catch (const std::exception& e) {
      reporter.error("Error processing " + source.filename().string() + ": " + e.what());
      stats.record_failure();
    }
  }

  reporter.run_finished(stats, plan);
  return stats;
}

}  // namespace gnomon::app
