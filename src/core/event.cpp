#include <gnomon/core/event.hpp>
#include <cstddef>

namespace gnomon::core {

std::string_view event_label(Event event) noexcept {
  const auto index = static_cast<std::size_t>(event);
  if (index >= kEventLabels.size()) return {};
  return kEventLabels[index];
}

std::optional<Event> parse_event(std::string_view label) noexcept {
  for (std::size_t i = 0; i < kEventLabels.size(); ++i) {
    if (kEventLabels[i] == label) return static_cast<Event>(i);
  }
  return std::nullopt;
}

}  // namespace gnomon::core
