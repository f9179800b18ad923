#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gnomon::core {

/// Gallery event a batch of photos belongs to; its label prefixes every output name.
enum class Event : std::uint8_t {
  Solstice,
  Equinox,
  WinterSolstice,
  SummerSolstice,
  SpringEquinox,
  FallEquinox,
};

inline constexpr std::array<std::string_view, 6> kEventLabels = {
    "solstice",       "equinox",        "winter-solstice",
    "summer-solstice", "spring-equinox", "fall-equinox",
};

/// Label used in file names, e.g. "winter-solstice".
[[nodiscard]] std::string_view event_label(Event event) noexcept;

/// Exact, case-sensitive match against kEventLabels.
[[nodiscard]] std::optional<Event> parse_event(std::string_view label) noexcept;

}  // namespace gnomon::core
