#include <gnomon/app/cli.hpp>
#include <gnomon/app/batch_runner.hpp>
#include <gnomon/app/console_reporter.hpp>
#include <gnomon/core/error.hpp>
#include <gnomon/core/event.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace gnomon::app {

namespace {

/// Setting key for a value-taking flag, or nullopt.
std::optional<std::string_view> setting_for_flag(std::string_view flag) {
  if (flag == "--input" || flag == "-i") return "input";
  if (flag == "--output" || flag == "-o") return "output";
  if (flag == "--event" || flag == "-e") return "event";
  if (flag == "--width" || flag == "-w") return "width";
  if (flag == "--quality" || flag == "-q") return "quality";
  return std::nullopt;
}

}  // namespace

void print_usage(std::ostream& os) {
  os << "Usage: gnomon_cli --input <dir> --output <dir> --event <name> [options]\n"
     << "  -i, --input <dir>     Directory containing the photos (required)\n"
     << "  -o, --output <dir>    Directory for optimized photos; created if missing (required)\n"
     << "  -e, --event <name>    Event name used as file name prefix (required), one of:\n"
     << "                       ";
  for (std::string_view label : gnomon::core::kEventLabels) os << " " << label;
  os << "\n"
     << "  -w, --width <px>      Maximum width in pixels (default: 1920)\n"
     << "  -q, --quality <1-100> JPEG quality (default: 82)\n"
     << "  -c, --config <path>   key=value file with input/output/event/width/quality;\n"
     << "                        command-line options take precedence\n"
     << "  -h, --help            Show this help\n"
     << "\nExamples:\n"
     << "  gnomon_cli --input ~/Desktop/Dec22Photos --output ./images/solstice --event solstice\n"
     << "  gnomon_cli -i ~/Desktop/EquinoxPhotos -o ./images/equinox -e equinox -w 2560\n";
}

std::expected<CommandLine, std::string> parse_command_line(int argc, const char* const* argv) {
  CommandLine cmd;
  cmd.config = default_config();

  std::string config_path;
  std::vector<std::pair<std::string_view, std::string>> overrides;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cmd.show_help = true;
      return cmd;
    }
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        return std::unexpected(std::string(arg) + " requires a value");
      }
      config_path = argv[++i];
      continue;
    }
    const auto key = setting_for_flag(arg);
    if (!key) {
      return std::unexpected("unknown option '" + std::string(arg) + "'");
    }
    if (i + 1 >= argc) {
      return std::unexpected(std::string(arg) + " requires a value");
    }
    overrides.emplace_back(*key, argv[++i]);
  }

  if (!config_path.empty()) {
    auto loaded = load_config(config_path, cmd.config);
    if (!loaded) return std::unexpected(loaded.error());
    cmd.config = std::move(*loaded);
  }
  for (const auto& [key, value] : overrides) {
    auto applied = apply_setting(cmd.config, key, value);
    if (!applied) return std::unexpected(applied.error());
  }
  return cmd;
}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  auto cmd = parse_command_line(argc, argv);
  if (!cmd) {
    err << "Error: " << cmd.error() << "\n";
    print_usage(err);
    return 1;
  }
  if (cmd->show_help) {
    print_usage(out);
    return 0;
  }

  const OptimizeConfig& cfg = cmd->config;
  if (auto valid = validate_config(cfg); !valid) {
    err << "Error: " << valid.error() << "\n";
    return 1;
  }

  ConsoleReporter reporter(out, err);
  auto stats = run_batch(cfg, reporter);
  if (!stats) {
    if (stats.error() == gnomon::core::PhotoError::LoadFailed) {
      err << "Error: could not list input directory '" << cfg.input_dir.string() << "'\n";
    } else {
      err << "Error: could not create output directories for '" << cfg.output_dir.string()
          << "'\n";
    }
    return 1;
  }
  return 0;
}

}  // namespace gnomon::app
