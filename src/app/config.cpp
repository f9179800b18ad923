#include <gnomon/app/config.hpp>
#include <gnomon/core/event.hpp>
#include <charconv>
#include <fstream>
#include <system_error>

namespace gnomon::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::expected<int, std::string> parse_int(std::string_view key, std::string_view value) {
  int parsed = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::unexpected(std::string(key) + " must be an integer, got '" +
                           std::string(value) + "'");
  }
  return parsed;
}

std::string event_choices() {
  std::string out;
  for (std::string_view label : gnomon::core::kEventLabels) {
    if (!out.empty()) out += ", ";
    out += label;
  }
  return out;
}

}  // namespace

OptimizeConfig default_config() {
  OptimizeConfig c;
  c.max_width = kDefaultMaxWidth;
  c.quality = kDefaultQuality;
  return c;
}

std::expected<void, std::string> apply_setting(OptimizeConfig& config,
                                               std::string_view key,
                                               std::string_view value) {
  if (key == "input") {
    config.input_dir = std::string(value);
  } else if (key == "output") {
    config.output_dir = std::string(value);
  } else if (key == "event") {
    config.event = std::string(value);
  } else if (key == "width") {
    auto parsed = parse_int(key, value);
    if (!parsed) return std::unexpected(parsed.error());
    config.max_width = *parsed;
  } else if (key == "quality") {
    auto parsed = parse_int(key, value);
    if (!parsed) return std::unexpected(parsed.error());
    config.quality = *parsed;
  } else {
    return std::unexpected("unknown setting '" + std::string(key) + "'");
  }
  return {};
}

std::expected<OptimizeConfig, std::string> load_config(const std::filesystem::path& path,
                                                       OptimizeConfig base) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected("cannot read config file '" + path.string() + "'");
  }

  OptimizeConfig c = std::move(base);
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    if (key != "input" && key != "output" && key != "event" && key != "width" &&
        key != "quality") {
      continue;
    }
    auto applied = apply_setting(c, key, value);
    if (!applied) {
      return std::unexpected(path.string() + ": " + applied.error());
    }
  }
  return c;
}

std::expected<void, std::string> validate_config(const OptimizeConfig& config) {
  if (config.input_dir.empty()) return std::unexpected("--input is required");
  if (config.output_dir.empty()) return std::unexpected("--output is required");
  if (config.event.empty()) return std::unexpected("--event is required");

  if (!gnomon::core::parse_event(config.event)) {
    return std::unexpected("Event '" + config.event + "' is not one of: " + event_choices());
  }
  if (config.max_width < 1) {
    return std::unexpected("Width must be at least 1 pixel");
  }
  if (config.quality < 1 || config.quality > 100) {
    return std::unexpected("Quality must be between 1 and 100");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.input_dir, ec)) {
    return std::unexpected("Input directory '" + config.input_dir.string() +
                           "' does not exist");
  }
  return {};
}

}  // namespace gnomon::app
