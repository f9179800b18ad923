#pragma once

#include <gnomon/app/config.hpp>
#include <gnomon/core/error.hpp>
#include <gnomon/core/reporter.hpp>
#include <gnomon/core/run_statistics.hpp>
#include <expected>
#include <filesystem>
#include <vector>

namespace gnomon::app {

/// <parent>/<name>_originals next to the output directory. A trailing separator
/// or relative form of output_dir does not change the result.
[[nodiscard]] std::filesystem::path backup_dir_for(const std::filesystem::path& output_dir);

/// True for .jpg .jpeg .png and their all-uppercase forms.
[[nodiscard]] bool is_source_image(const std::filesystem::path& path);

/// Regular files directly in input_dir that pass is_source_image, sorted by name.
/// LoadFailed if the directory cannot be listed.
[[nodiscard]] std::expected<std::vector<std::filesystem::path>, gnomon::core::PhotoError>
list_source_images(const std::filesystem::path& input_dir);

/// Copy source byte-for-byte into backup_dir under its own name, overwriting an
/// older backup, and carry over its modification time and permissions.
[[nodiscard]] std::expected<std::filesystem::path, gnomon::core::PhotoError>
backup_original(const std::filesystem::path& source,
                const std::filesystem::path& backup_dir);

/// Runs one batch: creates the output and backup directories, then for each
/// source image in name order resolves its capture time, derives a free output
/// name, transcodes it and backs up the original. A failing file is reported,
/// counted and skipped; the summary is always reported.
/// Expects a config that passed validate_config(). Returns WriteFailed if the
/// output or backup directory cannot be created, LoadFailed if the input
/// directory cannot be listed.
[[nodiscard]] std::expected<gnomon::core::RunStatistics, gnomon::core::PhotoError>
run_batch(const OptimizeConfig& config, gnomon::core::IReporter& reporter);

}  // namespace gnomon::app
