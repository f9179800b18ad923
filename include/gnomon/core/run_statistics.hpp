#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace gnomon::core {

/// Running totals for one batch run. Sizes are accrued only for files that
/// were fully processed (optimized and backed up).
struct RunStatistics {
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::uintmax_t original_bytes{0};
  std::uintmax_t optimized_bytes{0};

  void record_success(std::uintmax_t original_size, std::uintmax_t optimized_size) noexcept {
    ++succeeded;
    original_bytes += original_size;
    optimized_bytes += optimized_size;
  }

  void record_failure() noexcept { ++failed; }

  [[nodiscard]] std::size_t attempted() const noexcept { return succeeded + failed; }

  /// original - optimized; negative when the output grew.
  [[nodiscard]] std::intmax_t saved_bytes() const noexcept {
    return static_cast<std::intmax_t>(original_bytes) -
           static_cast<std::intmax_t>(optimized_bytes);
  }

  /// Percentage saved, or nullopt when nothing was accrued (original total is zero).
  [[nodiscard]] std::optional<double> reduction_percent() const noexcept {
    return reduction_percent(original_bytes, optimized_bytes);
  }

  [[nodiscard]] static std::optional<double> reduction_percent(
      std::uintmax_t original_size, std::uintmax_t optimized_size) noexcept {
    if (original_size == 0) return std::nullopt;
    return (1.0 - static_cast<double>(optimized_size) /
                      static_cast<double>(original_size)) * 100.0;
  }
};

}  // namespace gnomon::core
