#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace gnomon::app {

inline constexpr int kDefaultMaxWidth = 1920;
inline constexpr int kDefaultQuality = 82;

/// Settings for one optimize run.
struct OptimizeConfig {
  std::filesystem::path input_dir;
  std::filesystem::path output_dir;
  std::string event;
  int max_width{kDefaultMaxWidth};
  int quality{kDefaultQuality};
};

/// Default config: empty paths and event, width 1920, quality 82.
OptimizeConfig default_config();

/// Set one field by key ("input", "output", "event", "width", "quality").
/// Fails on an unknown key or a value that is not a whole decimal integer.
std::expected<void, std::string> apply_setting(OptimizeConfig& config,
                                               std::string_view key,
                                               std::string_view value);

/// Load a simple key=value file (one per line, '#' comments) on top of base.
/// Unknown keys are ignored; an unreadable file or malformed number is an error.
std::expected<OptimizeConfig, std::string> load_config(
    const std::filesystem::path& path,
    OptimizeConfig base = default_config());

/// Pre-flight checks, in order: required fields, event label, width >= 1,
/// quality in 1-100, input directory exists. Touches the filesystem only to
/// check the input directory.
std::expected<void, std::string> validate_config(const OptimizeConfig& config);

}  // namespace gnomon::app
